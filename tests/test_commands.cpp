#include <algorithm>
#include <iostream>
#include <string>

#include "granddao/core/combat.h"
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

bool contains(const std::vector<std::string>& v, const std::string& x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

} // namespace

int test_commands() {
  using namespace granddao;

  // Action selection picks a matching unlocked path.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    GD_ASSERT(sim.set_action(ActionType::Cultivate));
    GD_ASSERT(f.st().current_action == ActionType::Cultivate);
    GD_ASSERT(f.st().active_path_id == "martial");
    GD_ASSERT(f.st().log.front().kind == LogKind::Warning);

    GD_ASSERT(!sim.select_path("alchemy"));
    add_item(sim.content(), f.st(), "alchemy_manual");
    sim.tick();
    GD_ASSERT(sim.set_action(ActionType::Refine));
    GD_ASSERT(f.st().active_path_id == "alchemy");
    GD_ASSERT(sim.select_path("martial"));
    GD_ASSERT(f.st().active_path_id == "martial");
    GD_ASSERT(sim.set_action(ActionType::Cultivate));
    GD_ASSERT(f.st().active_path_id == "spirit");
  }

  // Pills and scriptures.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    GD_ASSERT(!sim.use_item("basic_pill"));
    add_item(sim.content(), f.st(), "basic_pill", 2);
    GD_ASSERT(sim.use_item("basic_pill"));
    GD_ASSERT(item_quantity(f.st(), "basic_pill") == 1);
    GD_ASSERT(f.st().buffs.size() == 1);
    GD_ASSERT(f.st().buffs.front().multiplier == 1.5);
    GD_ASSERT(f.st().buffs.front().remaining_seconds == 300);

    // Pills without an applicable effect and non-pills are refused.
    add_item(sim.content(), f.st(), "bloodline_elixir");
    GD_ASSERT(!sim.use_item("bloodline_elixir"));
    GD_ASSERT(has_item(f.st(), "bloodline_elixir"));
    add_item(sim.content(), f.st(), "common_herb");
    GD_ASSERT(!sim.use_item("common_herb"));

    GD_ASSERT(!sim.equip_scripture("basic_scripture"));
    GD_ASSERT(!sim.equip_scripture("common_herb"));
    add_item(sim.content(), f.st(), "basic_scripture");
    GD_ASSERT(sim.equip_scripture("basic_scripture"));
    GD_ASSERT(f.st().equipped_scripture == "basic_scripture");
    GD_ASSERT(f.st().path_progress.at("spirit").unlocked);
  }

  // Shops.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    GD_ASSERT(sim.shop_available());
    const auto stock = sim.shop_stock();
    GD_ASSERT(contains(stock, "basic_pill"));
    GD_ASSERT(!contains(stock, "epic_pill"));
    GD_ASSERT(sim.shop_price("basic_pill") == 30);
    GD_ASSERT(sim.shop_price("nope") == -1);

    f.st().spirit_stones = 29;
    GD_ASSERT(!sim.buy_item("basic_pill"));
    f.st().spirit_stones = 30;
    GD_ASSERT(sim.buy_item("basic_pill"));
    GD_ASSERT(f.st().spirit_stones == 0);
    GD_ASSERT(has_item(f.st(), "basic_pill"));
    GD_ASSERT(!sim.buy_item("epic_pill"));

    GD_ASSERT(sim.sell_item("basic_pill"));
    GD_ASSERT(f.st().spirit_stones == 10);
    GD_ASSERT(!sim.sell_item("basic_pill"));

    // Selling the last copy of the equipped scripture unequips it.
    f.st().spirit_stones = 45;
    GD_ASSERT(sim.buy_item("basic_scripture"));
    GD_ASSERT(sim.equip_scripture("basic_scripture"));
    GD_ASSERT(sim.sell_item("basic_scripture"));
    GD_ASSERT(f.st().equipped_scripture.empty());

    // Worthless items cannot be sold.
    add_item(sim.content(), f.st(), "fate_anchor");
    GD_ASSERT(!sim.sell_item("fate_anchor"));

    // Merchant's children haggle.
    f.st().character.background_id = "merchants_child";
    GD_ASSERT(sim.shop_price("basic_pill") == 27);

    // No shop on the road or in the wilds.
    GD_ASSERT(sim.travel_to("forest_path"));
    GD_ASSERT(!sim.shop_available());
    GD_ASSERT(sim.shop_stock().empty());
    sim.advance_seconds(90);
    GD_ASSERT(f.st().location_id == "forest_path");
    GD_ASSERT(!sim.shop_available());
  }

  // Groups and missions.
  {
    test::Fixture f;
    Simulation& sim = f.s();
    GD_ASSERT(!sim.can_join_group("azure_cloud_sect"));
    GD_ASSERT(sim.available_groups().empty());

    f.st().character.background_id = "sect_reject";
    GD_ASSERT(sim.can_join_group("azure_cloud_sect"));
    GD_ASSERT(!sim.can_join_group("blood_lotus_cult"));
    GD_ASSERT(!sim.can_join_group("nope"));
    GD_ASSERT(sim.join_group("azure_cloud_sect"));
    GD_ASSERT(!sim.join_group("jade_merchant_assoc"));

    GD_ASSERT(sim.complete_mission("patrol_1", true));
    GD_ASSERT(f.st().spirit_stones == 20);
    GD_ASSERT(f.st().character.karma == 3);
    GD_ASSERT(f.st().group_contribution == 20);
    GD_ASSERT(!sim.complete_mission("patrol_1", true));
    GD_ASSERT(!sim.complete_mission("trade_1", true));

    GD_ASSERT(sim.complete_mission("herb_gather", false));
    GD_ASSERT(f.st().spirit_stones == 50);
    GD_ASSERT(f.st().character.karma == 0);
    GD_ASSERT(f.st().log.front().kind == LogKind::Warning);

    GD_ASSERT(sim.leave_group());
    GD_ASSERT(!sim.leave_group());
    GD_ASSERT(!sim.complete_mission("patrol_1", true));

    // Rogues walk alone.
    GD_ASSERT(sim.join_group("azure_cloud_sect"));
    GD_ASSERT(sim.set_rogue_status(true));
    GD_ASSERT(f.st().group_id.empty());
    GD_ASSERT(!sim.can_join_group("azure_cloud_sect"));
    GD_ASSERT(sim.set_rogue_status(false));
    GD_ASSERT(sim.can_join_group("azure_cloud_sect"));
  }

  // Evil groups only take the wicked.
  {
    test::Fixture f;
    discover_region(f.st(), "cursed_swamp");
    f.st().character.karma = -60;
    const auto groups = f.s().available_groups();
    GD_ASSERT(groups.size() == 1);
    GD_ASSERT(groups.front() == "blood_lotus_cult");
  }

  // Power and combat.
  {
    test::Fixture f;
    GD_ASSERT(calculate_power(f.s().content(), f.st()) == 12);
    f.st().path_progress["spirit"] = make_path_progress("spirit", true);
    f.st().path_progress["spirit"].level = 2;
    GD_ASSERT(calculate_power(f.s().content(), f.st()) == 32);

    test::ScriptedRandom r({0.5, 0.5, 0.2});
    GD_ASSERT(resolve_combat(130, 100, r).won);
    GD_ASSERT(r.draws() == 0);
    GD_ASSERT(resolve_combat(90, 100, r).won);
    GD_ASSERT(!resolve_combat(50, 100, r).won);
    GD_ASSERT(resolve_combat(50, 100, r).won);
    GD_ASSERT(resolve_combat(5, 0, r).ratio == 5.0);
  }

  // Commands are refused outside the playing phase.
  {
    test::Fixture f;
    f.s().begin_character_creation("X");
    GD_ASSERT(!f.s().set_action(ActionType::Train));
    GD_ASSERT(!f.s().buy_boost());
    GD_ASSERT(!f.s().travel_to("forest_path"));
    GD_ASSERT(!f.s().shop_available());
  }

  return 0;
}
