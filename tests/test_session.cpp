#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

#include "granddao/core/inventory.h"
#include "granddao/core/save_store.h"
#include "granddao/core/session.h"
#include "test.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

std::string temp_save_path(const std::string& name) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");
  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  return (dir / "granddao_test_session" / std::to_string(static_cast<long long>(nonce)) / name).string();
}

double martial_xp(granddao::Session& s) {
  return s.snapshot().path_progress.at("martial").xp;
}

} // namespace

int test_session() {
  using namespace granddao;

  // Ticks come due once per second of host time; a click boosts the next one.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Train);
    const std::int64_t t0 = f.clock.now_ms();
    Session session(std::move(*f.sim));
    GD_ASSERT(!session.running());
    GD_ASSERT(session.pump(t0 + 5000).ticks == 0);

    const auto rep = session.start(t0);
    GD_ASSERT(rep.has_value());
    GD_ASSERT(!rep->applied);
    GD_ASSERT(!session.start(t0).has_value());
    GD_ASSERT(session.running());

    GD_ASSERT(session.pump(t0 + 999).ticks == 0);
    GD_ASSERT(session.pump(t0 + 3000).ticks == 3);
    GD_ASSERT(near(martial_xp(session), 3.6));

    session.click();
    GD_ASSERT(session.pump(t0 + 4000).ticks == 1);
    GD_ASSERT(near(martial_xp(session), 6.0));
    GD_ASSERT(session.pump(t0 + 5000).ticks == 1);
    GD_ASSERT(near(martial_xp(session), 7.2));

    const int ticks = session.with_simulation([](Simulation& sim) { return static_cast<int>(sim.state().tick_count); });
    GD_ASSERT(ticks == 5);

    session.stop();
    GD_ASSERT(!session.running());
    GD_ASSERT(session.pump(t0 + 60000).ticks == 0);
    GD_ASSERT(session.snapshot().tick_count == 5);
  }

  // Start applies offline catch-up from the last save.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Train);
    const std::int64_t saved = f.st().last_save_timestamp_ms;
    Session session(std::move(*f.sim));
    const auto rep = session.start(saved + 100 * 1000);
    GD_ASSERT(rep.has_value());
    GD_ASSERT(rep->applied);
    GD_ASSERT(rep->elapsed_seconds == 100);
    GD_ASSERT(near(martial_xp(session), 120.0));
  }

  // A stalled host gets at most max_ticks_per_pump ticks and resyncs.
  {
    test::Fixture f;
    const std::int64_t t0 = f.clock.now_ms();
    SessionConfig cfg;
    cfg.max_ticks_per_pump = 5;
    Session session(std::move(*f.sim), nullptr, cfg);
    (void)session.start(t0);
    GD_ASSERT(session.pump(t0 + 100000).ticks == 5);
    GD_ASSERT(session.pump(t0 + 100500).ticks == 0);
    GD_ASSERT(session.pump(t0 + 101000).ticks == 1);
  }

  // Autosave runs on the configured interval, never right after start.
  {
    const std::string path = temp_save_path("autosave.json");
    test::Fixture f;
    const std::int64_t t0 = f.clock.now_ms();
    SaveStore store(path, &f.s().content());
    SessionConfig cfg;
    cfg.autosave.interval_seconds = 30;
    Session session(std::move(*f.sim), &store, cfg);
    (void)session.start(t0);

    GD_ASSERT(!session.pump(t0 + 1000).autosaved);
    GD_ASSERT(!store.exists());
    GD_ASSERT(!session.pump(t0 + 30000).autosaved);
    const auto r = session.pump(t0 + 31000);
    GD_ASSERT(r.autosaved);
    GD_ASSERT(store.exists());
    const auto loaded = store.load();
    GD_ASSERT(loaded.has_value());
    GD_ASSERT(loaded->last_save_timestamp_ms == t0 + 31000);
    GD_ASSERT(loaded->tick_count == 31);

    // Turning it off in the save stops the writes.
    session.with_simulation([](Simulation& sim) { sim.state().auto_save_enabled = false; });
    GD_ASSERT(!session.pump(t0 + 90000).autosaved);
    GD_ASSERT(store.load()->tick_count == 31);

    GD_ASSERT(session.save_now(t0 + 91000));
    GD_ASSERT(store.load()->last_save_timestamp_ms == t0 + 91000);
    GD_ASSERT(store.remove());
  }

  // Tier boundaries route to a tribulation; a failed one ends in rebirth.
  {
    const std::string path = temp_save_path("tribulation.json");
    test::Fixture f;
    f.ready_at("martial", 4);
    f.st().character.devil_mark = true;
    const std::int64_t t0 = f.clock.now_ms();
    SaveStore store(path, &f.s().content());
    Session session(std::move(*f.sim), &store);
    (void)session.start(t0);

    const auto r = session.attempt_breakthrough();
    GD_ASSERT(r.outcome == BreakthroughOutcome::TribulationStarted);
    GD_ASSERT(session.with_simulation([](Simulation& sim) { return sim.tribulation() != nullptr; }));

    const auto again = session.attempt_breakthrough();
    GD_ASSERT(again.outcome == BreakthroughOutcome::NotReady);
    GD_ASSERT(!again.message.empty());

    // The host timestamp only drives ticks; strikes follow the simulation clock.
    const auto early = session.pump(t0 + 60000);
    GD_ASSERT(early.ticks == 60);
    GD_ASSERT(!early.tribulation_finished.has_value());
    GD_ASSERT(session.with_simulation([](Simulation& sim) {
      return sim.tribulation() && sim.tribulation()->status() == TribulationStatus::Waiting;
    }));

    // Nobody resists: six strikes of 19 damage against 64 HP.
    f.clock.set_ms(t0 + 60000);
    const auto p = session.pump(t0 + 61000);
    GD_ASSERT(p.tribulation_finished.has_value());
    GD_ASSERT(*p.tribulation_finished == TribulationStatus::Failed);
    GD_ASSERT(p.reborn);

    const GameState st = session.snapshot();
    GD_ASSERT(st.character.rebirth_count == 1);
    GD_ASSERT(st.total_deaths == 1);
    GD_ASSERT(st.character.devil_mark);
    GD_ASSERT(session.with_simulation([](Simulation& sim) { return sim.tribulation() == nullptr; }));

    const auto saved = store.load();
    GD_ASSERT(saved.has_value());
    GD_ASSERT(saved->character.rebirth_count == 1);
    GD_ASSERT(store.remove());
  }

  // Resisting every strike through the session survives and levels the path.
  {
    test::Fixture f;
    f.ready_at("martial", 4);
    Session session(std::move(*f.sim));
    (void)session.start(f.clock.now_ms());
    GD_ASSERT(session.attempt_breakthrough().outcome == BreakthroughOutcome::TribulationStarted);

    bool survived = false;
    for (int i = 0; i < 3; ++i) {
      f.clock.advance_ms(1000);
      (void)session.pump(f.clock.now_ms());
      const auto u = session.resist_strike();
      GD_ASSERT(u.accepted);
      survived = u.finished && u.status == TribulationStatus::Survived;
    }
    GD_ASSERT(survived);
    const GameState st = session.snapshot();
    GD_ASSERT(st.path_progress.at("martial").level == 5);
    GD_ASSERT(st.character.rebirth_count == 0);
  }

  // A fatal breakthrough roll is followed by rebirth.
  {
    test::Fixture f;
    f.ready_at("martial", 3);
    f.script({0.99, 0.01});
    Session session(std::move(*f.sim));
    (void)session.start(f.clock.now_ms());
    const auto r = session.attempt_breakthrough();
    GD_ASSERT(r.outcome == BreakthroughOutcome::Death);
    const GameState st = session.snapshot();
    GD_ASSERT(st.character.rebirth_count == 1);
    GD_ASSERT(st.phase == GamePhase::Playing);
  }

  // Not ready: nothing happens and no pills are spent.
  {
    test::Fixture f;
    add_item(f.s().content(), f.st(), "breakthrough_pill", 2);
    Session session(std::move(*f.sim));
    (void)session.start(f.clock.now_ms());
    GD_ASSERT(session.attempt_breakthrough().outcome == BreakthroughOutcome::NotReady);
    GD_ASSERT(item_quantity(session.snapshot(), "breakthrough_pill") == 2);
  }

  return 0;
}
