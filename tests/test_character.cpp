#include <cmath>
#include <iostream>
#include <string>

#include "granddao/core/character.h"
#include "granddao/core/inventory.h"
#include "test.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_character() {
  using namespace granddao;
  const ContentDB& db = test::shipped_content();

  // Draw order: root, body, background, luck.
  {
    test::ScriptedRandom r({0.0, 0.0, 0.99, 0.5});
    const Character c = roll_character(db, r, "Mo");
    GD_ASSERT(r.draws() == 4);
    GD_ASSERT(c.name == "Mo");
    GD_ASSERT(c.spirit_root_id == "trash_root");
    GD_ASSERT(c.body_type_id == "common_mortal_frame");
    GD_ASSERT(c.background_id == "mysterious_amnesiac");
    // Hidden luck is folded into the rolled value.
    GD_ASSERT(std::fabs(c.luck - (std::pow(0.5, 2.5) + 0.1)) < 1e-9);
    GD_ASSERT(c.karma == 0);
    GD_ASSERT(c.rebirth_count == 0);

    GD_ASSERT(character_qi_multiplier(db, c) == 0.3);
    GD_ASSERT(character_body_multiplier(db, c) == 0.5);
    GD_ASSERT(character_qi_bonus(db, c) == 0.0);

    const GameState s = create_initial_state(db, c, 5000, 50);
    GD_ASSERT(s.phase == GamePhase::Playing);
    GD_ASSERT(s.location_id == "cursed_swamp");
    GD_ASSERT(is_discovered(s, "cursed_swamp"));
    GD_ASSERT(is_discovered(s, "bone_fields"));
    GD_ASSERT(!is_discovered(s, "peaceful_village"));
    GD_ASSERT(has_item(s, "basic_scripture"));
    GD_ASSERT(s.path_progress.at("spirit").unlocked);
    GD_ASSERT(s.path_progress.at("martial").unlocked);
    GD_ASSERT(s.active_path_id == "martial");
    GD_ASSERT(s.current_action == ActionType::Idle);
    GD_ASSERT(s.last_save_timestamp_ms == 5000);

    GD_ASSERT(s.log.size() == 5);
    GD_ASSERT(s.log.back().seq == 1);
    GD_ASSERT(s.log.back().message == "Your journey on the Grand Dao begins...");
    GD_ASSERT(s.log.front().kind == LogKind::System);
    GD_ASSERT(s.next_log_seq == 6);
  }

  // Background stones; unknown trait ids fall back to neutral multipliers.
  {
    Character c;
    c.background_id = "fallen_noble";
    c.spirit_root_id = "gone";
    const GameState s = create_initial_state(db, c, 0, 50);
    GD_ASSERT(s.spirit_stones == 50);
    GD_ASSERT(s.location_id == "small_city");
    GD_ASSERT(s.inventory.empty());
    GD_ASSERT(character_qi_multiplier(db, c) == 1.0);
    GD_ASSERT(s.path_progress.count("spirit") == 0);
  }

  GD_ASSERT(reroll_cost(0) == 0);
  GD_ASSERT(reroll_cost(1) == 10);
  GD_ASSERT(reroll_cost(3) == 1000);

  // Creation flow through the simulation.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    sim.begin_character_creation("Lin");
    GD_ASSERT(f.st().phase == GamePhase::CharacterCreation);
    GD_ASSERT(f.st().character.name == "Lin");

    // Ticks do nothing before confirmation.
    sim.tick();
    GD_ASSERT(f.st().tick_count == 0);

    GD_ASSERT(sim.reroll_character());
    GD_ASSERT(f.st().reroll_count == 1);
    // The next reroll costs 10 stones and there are none.
    GD_ASSERT(!sim.reroll_character());
    f.st().spirit_stones = 10;
    GD_ASSERT(sim.reroll_character());
    GD_ASSERT(f.st().spirit_stones == 0);
    GD_ASSERT(f.st().reroll_count == 2);

    GD_ASSERT(sim.confirm_character());
    GD_ASSERT(f.st().phase == GamePhase::Playing);
    GD_ASSERT(f.st().reroll_count == 2);
    GD_ASSERT(f.st().character.name == "Lin");
    GD_ASSERT(!sim.confirm_character());
    GD_ASSERT(!sim.reroll_character());
  }

  // Inventory stacking rules.
  {
    GameState s;
    add_item(db, s, "common_herb", 2);
    add_item(db, s, "common_herb");
    add_item(db, s, "basic_scripture", 2);
    GD_ASSERT(s.inventory.size() == 3);
    GD_ASSERT(item_quantity(s, "common_herb") == 3);
    GD_ASSERT(item_quantity(s, "basic_scripture") == 2);
    GD_ASSERT(has_item_in_category(db, s, ItemCategory::Scripture));

    GD_ASSERT(!remove_item(s, "common_herb", 4));
    GD_ASSERT(item_quantity(s, "common_herb") == 3);
    GD_ASSERT(remove_item(s, "basic_scripture", 2));
    GD_ASSERT(!has_item(s, "basic_scripture"));
    GD_ASSERT(s.inventory.size() == 1);
    GD_ASSERT(!has_item_in_category(db, s, ItemCategory::Scripture));
  }

  return 0;
}
