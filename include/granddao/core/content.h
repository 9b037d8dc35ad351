#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "granddao/core/game_state.h"

namespace granddao {

enum class Realm { Mortal, Heaven, Underworld };

enum class Rarity { Common, Uncommon, Rare, Epic, Legendary, Mythic };

enum class ItemCategory { Pill, Scripture, Treasure, Material, FormationScroll, Special };

struct SpiritRootDef {
  std::string id;
  std::string name;
  std::string description;
  double qi_multiplier{1.0};
  // Relative weight for the creation roll.
  double probability{0.0};
};

struct BodyTypeDef {
  std::string id;
  std::string name;
  std::string description;
  double body_multiplier{1.0};
  // Added to the spirit root's qi multiplier for qi-based paths.
  double qi_bonus_multiplier{0.0};
  double probability{0.0};
};

struct BackgroundEffect {
  double exploration_bonus{0.0};
  std::int64_t spirit_stones{0};
  double luck_bonus{0.0};
  bool sect_access{false};
  double shop_discount{0.0};
  double hidden_luck{0.0};
  bool random_scripture{false};
};

struct BackgroundDef {
  std::string id;
  std::string name;
  std::string description;
  std::string start_location;
  std::string bonus;
  BackgroundEffect effect;
};

struct PathLevelDef {
  int level{1};
  int tier{1};
  std::string name;
  std::string flavor;
};

// Static description of a path. Speed and unlock behaviour are not data; they
// live in the path_rules dispatch table keyed by id.
struct PathDef {
  std::string id;
  std::string name;
  std::string subtitle;
  ActionType action{ActionType::Cultivate};
  std::string unlock_condition;
  std::vector<PathLevelDef> levels;
};

struct LootEntry {
  std::string item_id;
  double weight{0.0};
  int min_danger{1};
};

struct RegionDef {
  std::string id;
  std::string name;
  std::string description;
  Realm realm{Realm::Mortal};
  int danger_level{1};
  std::string terrain;
  bool has_shop{false};
  bool is_city{false};
  std::vector<std::string> connections;
  std::vector<LootEntry> loot_table;
  // May repeat ids to weight the uniform draw.
  std::vector<std::string> event_pool;
};

struct ItemEffects {
  double xp_multiplier{0.0};
  int xp_multiplier_duration{0};
  double breakthrough_bonus{0.0};
  bool heal_qi_deviation{false};
  bool preserve_inventory{false};
  bool preserve_rolls{false};
  double tribulation_hp_bonus{0.0};
};

struct ItemDef {
  std::string id;
  std::string name;
  std::string description;
  ItemCategory category{ItemCategory::Material};
  Rarity rarity{Rarity::Common};
  ItemEffects effects;
  std::int64_t sell_value{0};
  bool stackable{true};
};

struct EventChoiceDef {
  std::string text;
  int karma_change{0};
  std::int64_t reward_stones{0};
  std::vector<std::string> reward_items;
  std::int64_t loss_stones{0};
  int time_penalty_seconds{0};
};

struct EventDef {
  std::string id;
  std::string title;
  std::string description;
  bool fated{false};
  std::vector<EventChoiceDef> choices;
};

struct ShopDef {
  Realm realm{Realm::Mortal};
  double price_multiplier{1.0};
  std::vector<std::string> item_ids;
};

struct MissionOption {
  std::int64_t reward{0};
  int karma_change{0};
  std::string description;
};

struct MissionDef {
  std::string id;
  std::string name;
  std::string description;
  int duration_seconds{0};
  MissionOption help;
  MissionOption exploit;
};

struct GroupDef {
  std::string id;
  std::string name;
  std::string type;
  std::string description;
  std::string location;
  int karma_min{kKarmaMin};
  int karma_max{kKarmaMax};
  std::vector<MissionDef> missions;
};

// All static game tables. Vectors keep file order, which several rules rely
// on (weighted picks, path auto-selection, unlock sweeps).
struct ContentDB {
  std::vector<SpiritRootDef> spirit_roots;
  std::vector<BodyTypeDef> body_types;
  std::vector<BackgroundDef> backgrounds;
  std::vector<PathDef> paths;
  std::vector<RegionDef> regions;
  std::unordered_map<std::string, ItemDef> items;
  std::vector<EventDef> events;
  std::vector<ShopDef> shops;
  std::vector<GroupDef> groups;

  const SpiritRootDef* find_spirit_root(const std::string& id) const;
  const BodyTypeDef* find_body_type(const std::string& id) const;
  const BackgroundDef* find_background(const std::string& id) const;
  const PathDef* find_path(const std::string& id) const;
  const RegionDef* find_region(const std::string& id) const;
  const ItemDef* find_item(const std::string& id) const;
  const EventDef* find_event(const std::string& id) const;
  const ShopDef* find_shop(Realm realm) const;
  const GroupDef* find_group(const std::string& id) const;
};

// Loads content tables from a JSON file (see data/content/cultivation.json).
// Throws std::runtime_error on IO, parse or schema errors.
ContentDB load_content_db_from_file(const std::string& path);

// Same as above, from JSON text already in memory.
ContentDB load_content_db_from_json(const std::string& json_text);

} // namespace granddao
