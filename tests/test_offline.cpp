#include <cmath>
#include <iostream>
#include <string>

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
} // namespace

int test_offline() {
  using namespace granddao;

  // Gaps under the minimum are ignored entirely.
  {
    test::Fixture f;
    const std::int64_t saved = f.st().last_save_timestamp_ms;
    const std::size_t log_size = f.st().log.size();
    const auto rep = f.s().catch_up(saved + 4999);
    GD_ASSERT(!rep.applied);
    GD_ASSERT(f.st().last_save_timestamp_ms == saved);
    GD_ASSERT(f.st().log.size() == log_size);
  }

  // Idle for an hour: stones only.
  {
    test::Fixture f;
    const std::int64_t saved = f.st().last_save_timestamp_ms;
    const auto rep = f.s().catch_up(saved + 3600 * 1000);
    GD_ASSERT(rep.applied);
    GD_ASSERT(rep.elapsed_seconds == 3600);
    GD_ASSERT(rep.stones_gained == 6);
    GD_ASSERT(rep.xp_gained == 0.0);
    GD_ASSERT(f.st().spirit_stones == 6);
    GD_ASSERT(f.st().path_progress.at("martial").xp == 0.0);
    GD_ASSERT(f.st().last_save_timestamp_ms == saved + 3600 * 1000);
    GD_ASSERT(f.st().total_play_time == 3600);
    GD_ASSERT(f.st().log.front().kind == LogKind::System);
    GD_ASSERT(f.st().log.front().message.find("Offline progress: 1h 00m") == 0);
  }

  // Training offline follows the live rate without buffs, capped by the requirement.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Train);
    f.st().spirit_stones = 100;
    GD_ASSERT(f.s().buy_boost());
    const std::int64_t saved = f.st().last_save_timestamp_ms;
    const auto rep = f.s().catch_up(saved + 100 * 1000);
    GD_ASSERT(near(rep.xp_gained, 120.0));
    GD_ASSERT(near(f.st().path_progress.at("martial").xp, 120.0));
    // The 600 s boost has 500 s left.
    GD_ASSERT(f.st().buffs.size() == 1);
    GD_ASSERT(f.st().buffs.front().remaining_seconds == 500);

    const auto more = f.s().catch_up(f.st().last_save_timestamp_ms + 1000 * 1000);
    GD_ASSERT(more.applied);
    const PathProgress& pp = f.st().path_progress.at("martial");
    GD_ASSERT(pp.xp == pp.xp_required);
    GD_ASSERT(pp.breakthrough_available);
    GD_ASSERT(near(more.xp_gained, 100.0));
    GD_ASSERT(f.st().buffs.empty());
  }

  // Long absences are capped at eight hours.
  {
    test::Fixture f;
    const auto rep = f.s().catch_up(f.st().last_save_timestamp_ms + 100000LL * 1000);
    GD_ASSERT(rep.elapsed_seconds == 8 * 3600);
    GD_ASSERT(rep.stones_gained == 48);
  }

  // Arrival happens offline. Qi deviation only runs down after arrival, as it
  // does between live travel ticks.
  {
    test::Fixture f;
    GD_ASSERT(f.s().travel_to("forest_path"));
    f.st().qi_deviation.active = true;
    f.st().qi_deviation.remaining_seconds = 60;
    const auto rep = f.s().catch_up(f.st().last_save_timestamp_ms + 120 * 1000);
    GD_ASSERT(rep.arrived);
    GD_ASSERT(f.st().location_id == "forest_path");
    GD_ASSERT(!f.st().travel.traveling);
    GD_ASSERT(f.st().qi_deviation.active);
    GD_ASSERT(f.st().qi_deviation.remaining_seconds == 30);

    const auto later = f.s().catch_up(f.st().last_save_timestamp_ms + 30 * 1000);
    GD_ASSERT(later.applied);
    GD_ASSERT(!f.st().qi_deviation.active);
  }

  // No XP for time on the road, offline or live.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Train);
    GD_ASSERT(f.s().travel_to("forest_path"));
    GD_ASSERT(f.st().travel.remaining_seconds == 90);

    test::Fixture live;
    live.s().set_action(ActionType::Train);
    GD_ASSERT(live.s().travel_to("forest_path"));
    live.s().advance_seconds(10);
    GD_ASSERT(live.st().path_progress.at("martial").xp == 0.0);

    const auto rep = f.s().catch_up(f.st().last_save_timestamp_ms + 10 * 1000);
    GD_ASSERT(rep.applied);
    GD_ASSERT(rep.xp_gained == 0.0);
    GD_ASSERT(!rep.arrived);
    GD_ASSERT(f.st().path_progress.at("martial").xp == 0.0);
    GD_ASSERT(f.st().travel.traveling);
    GD_ASSERT(f.st().travel.remaining_seconds == 80);

    // 80 s still on the road, then 20 s of training at 1.2 XP/s.
    const auto rest = f.s().catch_up(f.st().last_save_timestamp_ms + 100 * 1000);
    GD_ASSERT(rest.arrived);
    GD_ASSERT(near(rest.xp_gained, 24.0));
    GD_ASSERT(near(f.st().path_progress.at("martial").xp, 24.0));

    live.s().advance_seconds(100);
    GD_ASSERT(!live.st().travel.traveling);
    GD_ASSERT(near(live.st().path_progress.at("martial").xp, 24.0));
  }

  // Exploring offline earns nothing but stones, and no events.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Explore);
    f.script({}, 0.0);
    const auto rep = f.s().catch_up(f.st().last_save_timestamp_ms + 600 * 1000);
    GD_ASSERT(rep.stones_gained == 1);
    GD_ASSERT(f.st().pending_event_id.empty());
    GD_ASSERT(f.st().inventory.empty());
    GD_ASSERT(f.rng->draws() == 0);
  }

  // Not during character creation.
  {
    test::Fixture f;
    f.s().begin_character_creation("X");
    GD_ASSERT(!f.s().catch_up(f.clock.now_ms() + 3600 * 1000).applied);
  }

  return 0;
}
