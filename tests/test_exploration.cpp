#include <iostream>
#include <string>

#include "granddao/core/inventory.h"
#include "test.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_exploration() {
  using namespace granddao;

  // Peaceful village: loot common_herb 30 / iron_ore 15 / small pouch 5,
  // events traveler + herb_garden, no regional fated events.

  // Stone trickle then loot in the same tick.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Explore);
    // trickle hit, amount 3, narrate; loot hit, first entry; no fated.
    f.script({0.0, 0.99, 0.0, 0.0, 0.0});
    f.s().tick();
    GD_ASSERT(f.st().spirit_stones == 3);
    GD_ASSERT(has_item(f.st(), "common_herb"));
    GD_ASSERT(f.st().pending_event_id.empty());
    GD_ASSERT(f.rng->remaining() == 0);
    GD_ASSERT(f.st().log.front().message.find("Found: ") == 0);
  }

  // Stone pouches pay out stones instead of an item.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Explore);
    f.script({0.99, 0.0, 0.95, 0.0});
    f.s().tick();
    GD_ASSERT(f.st().spirit_stones == 5);
    GD_ASSERT(f.st().inventory.empty());
    GD_ASSERT(f.st().log.front().message == "Found 5 Spirit Stones!");
  }

  // Nothing happens when exploring is not the action.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Train);
    f.script({}, 0.0);
    f.s().tick();
    GD_ASSERT(f.st().spirit_stones == 0);
    GD_ASSERT(f.st().inventory.empty());
  }

  // Periodic region event, then resolving it.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Explore);
    f.st().tick_count = 59;
    f.script({0.99, 0.99, 0.99, 0.0});
    f.s().tick();
    GD_ASSERT(f.st().pending_event_id == "traveler");
    GD_ASSERT(f.st().log.front().message == "Fellow Traveler");

    GD_ASSERT(!f.s().choose_event_option(3));
    GD_ASSERT(!f.s().choose_event_option(-1));
    GD_ASSERT(f.s().choose_event_option(0));
    GD_ASSERT(f.st().pending_event_id.empty());
    GD_ASSERT(f.st().character.karma == 2);
    GD_ASSERT(f.st().spirit_stones == 5);
    GD_ASSERT(f.st().log.front().kind == LogKind::Success);
    GD_ASSERT(!f.s().choose_event_option(0));
  }

  // Fated encounters fall back to the global fated list and never replace a
  // pending event.
  {
    test::Fixture f;
    f.s().set_action(ActionType::Explore);
    f.script({0.99, 0.99, 0.0, 0.0});
    f.s().tick();
    GD_ASSERT(f.st().pending_event_id == "dying_immortal");
    GD_ASSERT(f.st().log.front().kind == LogKind::Legendary);

    f.script({0.99, 0.99, 0.0, 0.9});
    f.s().tick();
    GD_ASSERT(f.st().pending_event_id == "dying_immortal");

    // The reward scripture opens the spirit path.
    GD_ASSERT(f.s().choose_event_option(0));
    GD_ASSERT(has_item(f.st(), "epic_scripture"));
    GD_ASSERT(f.st().path_progress.at("spirit").unlocked);
  }

  // Karma changes clamp and stone losses floor at zero.
  {
    test::Fixture f;
    f.st().pending_event_id = "traveler";
    f.st().character.karma = -998;
    GD_ASSERT(f.s().choose_event_option(2));
    GD_ASSERT(f.st().character.karma == -1000);
    GD_ASSERT(f.st().spirit_stones == 20);
    GD_ASSERT(f.st().log.front().kind == LogKind::Warning);
    // Deep negative karma with a devil path open marks the character.
    GD_ASSERT(f.st().path_progress.count("devil_soul") && f.st().path_progress.at("devil_soul").unlocked);
    GD_ASSERT(f.st().character.devil_mark);
  }

  // A pending id that no longer exists in content is dropped.
  {
    test::Fixture f;
    f.st().pending_event_id = "removed_event";
    GD_ASSERT(!f.s().choose_event_option(0));
    GD_ASSERT(f.st().pending_event_id.empty());
  }

  // Beast tamer can only be met in the spirit beast territory.
  {
    test::Fixture f;
    f.st().location_id = "spirit_beast_territory";
    f.s().set_action(ActionType::Explore);
    f.script({0.99, 0.99, 0.99, 0.0});
    f.s().tick();
    GD_ASSERT(f.st().path_progress.at("beast_tamer").unlocked);
  }

  return 0;
}
