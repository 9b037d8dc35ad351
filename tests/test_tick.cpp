#include <cmath>
#include <iostream>
#include <string>

#include "granddao/core/inventory.h"
#include "granddao/core/progression.h"
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

int test_tick() {
  using namespace granddao;

  // Training accrues body-scaled XP on martial.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    GD_ASSERT(sim.set_action(ActionType::Train));
    GD_ASSERT(f.st().active_path_id == "martial");
    sim.advance_seconds(10);
    const PathProgress& pp = f.st().path_progress.at("martial");
    GD_ASSERT(near(pp.xp, 12.0));
    GD_ASSERT(f.st().tick_count == 10);
    GD_ASSERT(f.st().total_play_time == 10);

    // Click boost doubles a single tick.
    sim.tick(true);
    GD_ASSERT(near(pp.xp, 14.4));

    // Legacy bonus and qi deviation scale the rate.
    f.st().character.legacy_bonus = 0.5;
    f.st().qi_deviation.active = true;
    f.st().qi_deviation.remaining_seconds = 100;
    sim.tick();
    GD_ASSERT(near(pp.xp, 14.4 + 1.2 * 1.5 * 0.5));
    GD_ASSERT(f.st().qi_deviation.remaining_seconds == 99);
  }

  // XP stops exactly at the requirement and the path becomes ready.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    sim.set_action(ActionType::Train);
    PathProgress& pp = f.st().path_progress.at("martial");
    pp.xp = pp.xp_required - 0.5;
    sim.tick();
    GD_ASSERT(pp.xp == pp.xp_required);
    GD_ASSERT(pp.breakthrough_available);
    GD_ASSERT(f.st().log.front().message.find("XP maxed") != std::string::npos);
    sim.advance_seconds(5);
    GD_ASSERT(pp.xp == pp.xp_required);
  }

  // No XP while idle, exploring, or when the action does not match the path.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    const PathProgress& pp = f.st().path_progress.at("martial");
    sim.advance_seconds(3);
    GD_ASSERT(pp.xp == 0.0);
    sim.set_action(ActionType::Explore);
    GD_ASSERT(f.st().active_path_id == "martial");
    sim.advance_seconds(3);
    GD_ASSERT(pp.xp == 0.0);
    f.st().current_action = ActionType::Study;
    sim.advance_seconds(3);
    GD_ASSERT(pp.xp == 0.0);
  }

  // Buffs multiply and expire with a log line.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    sim.set_action(ActionType::Train);
    f.st().spirit_stones = 100;
    GD_ASSERT(sim.boost_cost() == 10);
    GD_ASSERT(sim.buy_boost());
    GD_ASSERT(sim.boost_cost() == 20);
    GD_ASSERT(f.st().spirit_stones == 90);
    f.st().buffs.front().remaining_seconds = 2;
    sim.tick();
    GD_ASSERT(near(f.st().path_progress.at("martial").xp, 6.0));
    sim.tick();
    GD_ASSERT(f.st().buffs.empty());
    GD_ASSERT(f.st().log.front().message == "Spirit Stone Boost has expired.");
    GD_ASSERT(sim.boost_cost() == 10);
  }

  // Travel takes base + danger * step seconds and blocks everything else.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    sim.set_action(ActionType::Train);
    GD_ASSERT(sim.travel_seconds_to("forest_path") == 90);
    GD_ASSERT(!sim.travel_to("peaceful_village"));
    GD_ASSERT(!sim.travel_to("mining_town"));
    GD_ASSERT(sim.travel_to("forest_path"));
    GD_ASSERT(!sim.travel_to("river_delta"));

    sim.advance_seconds(89);
    GD_ASSERT(f.st().travel.traveling);
    GD_ASSERT(f.st().location_id == "peaceful_village");
    GD_ASSERT(f.st().path_progress.at("martial").xp == 0.0);
    sim.tick();
    GD_ASSERT(!f.st().travel.traveling);
    GD_ASSERT(f.st().location_id == "forest_path");
    GD_ASSERT(is_discovered(f.st(), "mining_town"));
    GD_ASSERT(is_discovered(f.st(), "cursed_swamp"));
    GD_ASSERT(f.st().log.front().message == "Arrived at Forest Path");
  }

  // Karma becomes visible once any path reaches level 5.
  {
    test::Fixture f;
    f.st().path_progress.at("martial").level = 5;
    GD_ASSERT(!f.st().karma_visible);
    f.s().tick();
    GD_ASSERT(f.st().karma_visible);
    GD_ASSERT(f.st().highest_path_level == 5);
  }

  // Karma at the devil threshold opens both devil paths and marks the character.
  {
    test::Fixture f;
    f.st().character.karma = -100;
    f.s().tick();
    GD_ASSERT(f.st().path_progress.at("devil_soul").unlocked);
    GD_ASSERT(f.st().path_progress.at("devil_body").unlocked);
    GD_ASSERT(f.st().character.devil_mark);
  }

  // Rogue status opens the wild path; owning a manual opens alchemy.
  {
    test::Fixture f;
    GD_ASSERT(f.s().set_rogue_status(true));
    GD_ASSERT(!f.s().set_rogue_status(true));
    GD_ASSERT(f.st().path_progress.at("rogue").unlocked);
    add_item(f.s().content(), f.st(), "alchemy_manual");
    f.s().tick();
    GD_ASSERT(f.st().path_progress.at("alchemy").unlocked);
    // A scripture of any kind also opens the spirit path.
    GD_ASSERT(f.st().path_progress.at("spirit").unlocked);
  }

  // The lucid dream roll only happens while cultivating.
  {
    test::Fixture f;
    add_item(f.s().content(), f.st(), "basic_scripture");
    f.s().tick();
    GD_ASSERT(f.s().set_action(ActionType::Cultivate));
    GD_ASSERT(f.st().active_path_id == "spirit");
    f.script({0.0});
    f.s().tick();
    GD_ASSERT(f.st().path_progress.at("dream").unlocked);
  }

  // Log is capped and sequence numbers keep increasing.
  {
    SimConfig cfg;
    cfg.max_log_entries = 4;
    test::Fixture f(cfg);
    f.st().spirit_stones = 1000;
    for (int i = 0; i < 6; ++i) f.s().buy_boost();
    GD_ASSERT(f.st().log.size() == 4);
    for (std::size_t i = 1; i < f.st().log.size(); ++i) GD_ASSERT(f.st().log[i - 1].seq > f.st().log[i].seq);
    GD_ASSERT(f.st().log.front().seq + 1 == f.st().next_log_seq);
  }

  return 0;
}
