#include "granddao/core/content.h"

#include <stdexcept>

#include "granddao/core/enum_strings.h"
#include "granddao/core/progression.h"
#include "granddao/util/file_io.h"
#include "granddao/util/json.h"

namespace granddao {

namespace {

const json::Object& required_object(const json::Object& o, const std::string& key, const std::string& where) {
  const auto* v = json::find(o, key);
  if (!v || !v->is_object()) throw std::runtime_error(where + ": missing object '" + key + "'");
  return v->object();
}

const json::Array& required_array(const json::Object& o, const std::string& key, const std::string& where) {
  const auto* v = json::find(o, key);
  if (!v || !v->is_array()) throw std::runtime_error(where + ": missing array '" + key + "'");
  return v->array();
}

std::string required_string(const json::Object& o, const std::string& key, const std::string& where) {
  const auto* v = json::find(o, key);
  if (!v || !v->is_string()) throw std::runtime_error(where + ": missing string '" + key + "'");
  return v->string_value();
}

std::string opt_string(const json::Object& o, const std::string& key, const std::string& def = "") {
  const auto* v = json::find(o, key);
  return v ? v->string_value(def) : def;
}

double opt_number(const json::Object& o, const std::string& key, double def = 0.0) {
  const auto* v = json::find(o, key);
  return v ? v->number_value(def) : def;
}

bool opt_bool(const json::Object& o, const std::string& key, bool def = false) {
  const auto* v = json::find(o, key);
  return v ? v->bool_value(def) : def;
}

std::vector<std::string> string_list(const json::Object& o, const std::string& key) {
  std::vector<std::string> out;
  const auto* v = json::find(o, key);
  if (!v) return out;
  for (const auto& e : v->array()) out.push_back(e.string_value());
  return out;
}

MissionOption parse_mission_option(const json::Object& o) {
  MissionOption opt;
  opt.reward = static_cast<std::int64_t>(opt_number(o, "reward"));
  opt.karma_change = static_cast<int>(opt_number(o, "karma"));
  opt.description = opt_string(o, "description");
  return opt;
}

} // namespace

const SpiritRootDef* ContentDB::find_spirit_root(const std::string& id) const {
  for (const auto& r : spirit_roots) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

const BodyTypeDef* ContentDB::find_body_type(const std::string& id) const {
  for (const auto& b : body_types) {
    if (b.id == id) return &b;
  }
  return nullptr;
}

const BackgroundDef* ContentDB::find_background(const std::string& id) const {
  for (const auto& b : backgrounds) {
    if (b.id == id) return &b;
  }
  return nullptr;
}

const PathDef* ContentDB::find_path(const std::string& id) const {
  for (const auto& p : paths) {
    if (p.id == id) return &p;
  }
  return nullptr;
}

const RegionDef* ContentDB::find_region(const std::string& id) const {
  for (const auto& r : regions) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

const ItemDef* ContentDB::find_item(const std::string& id) const { return find_ptr(items, id); }

const EventDef* ContentDB::find_event(const std::string& id) const {
  for (const auto& e : events) {
    if (e.id == id) return &e;
  }
  return nullptr;
}

const ShopDef* ContentDB::find_shop(Realm realm) const {
  for (const auto& s : shops) {
    if (s.realm == realm) return &s;
  }
  return nullptr;
}

const GroupDef* ContentDB::find_group(const std::string& id) const {
  for (const auto& g : groups) {
    if (g.id == id) return &g;
  }
  return nullptr;
}

ContentDB load_content_db_from_json(const std::string& json_text) {
  const auto doc = json::parse(json_text);
  const auto& root = doc.object();

  ContentDB db;

  // --- Character creation tables ---
  for (const auto& v : required_array(root, "spirit_roots", "content")) {
    const auto& o = v.object();
    SpiritRootDef r;
    r.id = required_string(o, "id", "spirit_roots");
    r.name = opt_string(o, "name", r.id);
    r.description = opt_string(o, "description");
    r.qi_multiplier = opt_number(o, "qi_multiplier", 1.0);
    r.probability = opt_number(o, "probability");
    db.spirit_roots.push_back(std::move(r));
  }

  for (const auto& v : required_array(root, "body_types", "content")) {
    const auto& o = v.object();
    BodyTypeDef b;
    b.id = required_string(o, "id", "body_types");
    b.name = opt_string(o, "name", b.id);
    b.description = opt_string(o, "description");
    b.body_multiplier = opt_number(o, "body_multiplier", 1.0);
    b.qi_bonus_multiplier = opt_number(o, "qi_bonus_multiplier");
    b.probability = opt_number(o, "probability");
    db.body_types.push_back(std::move(b));
  }

  for (const auto& v : required_array(root, "backgrounds", "content")) {
    const auto& o = v.object();
    BackgroundDef b;
    b.id = required_string(o, "id", "backgrounds");
    b.name = opt_string(o, "name", b.id);
    b.description = opt_string(o, "description");
    b.start_location = required_string(o, "start_location", "background " + b.id);
    b.bonus = opt_string(o, "bonus");
    if (const auto* e = json::find(o, "effect")) {
      const auto& eo = e->object();
      b.effect.exploration_bonus = opt_number(eo, "exploration_bonus");
      b.effect.spirit_stones = static_cast<std::int64_t>(opt_number(eo, "spirit_stones"));
      b.effect.luck_bonus = opt_number(eo, "luck_bonus");
      b.effect.sect_access = opt_bool(eo, "sect_access");
      b.effect.shop_discount = opt_number(eo, "shop_discount");
      b.effect.hidden_luck = opt_number(eo, "hidden_luck");
      b.effect.random_scripture = opt_bool(eo, "random_scripture");
    }
    db.backgrounds.push_back(std::move(b));
  }

  // --- Paths ---
  for (const auto& v : required_array(root, "paths", "content")) {
    const auto& o = v.object();
    PathDef p;
    p.id = required_string(o, "id", "paths");
    p.name = opt_string(o, "name", p.id);
    p.subtitle = opt_string(o, "subtitle");
    const std::string action = required_string(o, "action", "path " + p.id);
    const auto parsed = action_from_string(action);
    if (!parsed || *parsed == ActionType::Idle) {
      throw std::runtime_error("path " + p.id + ": invalid action '" + action + "'");
    }
    p.action = *parsed;
    p.unlock_condition = opt_string(o, "unlock_condition");
    int level = 1;
    for (const auto& lv : required_array(o, "levels", "path " + p.id)) {
      const auto& lo = lv.object();
      PathLevelDef l;
      l.level = level;
      l.tier = tier_for_level(level);
      l.name = opt_string(lo, "name");
      l.flavor = opt_string(lo, "flavor");
      p.levels.push_back(std::move(l));
      ++level;
    }
    db.paths.push_back(std::move(p));
  }

  // --- World ---
  for (const auto& v : required_array(root, "regions", "content")) {
    const auto& o = v.object();
    RegionDef r;
    r.id = required_string(o, "id", "regions");
    r.name = opt_string(o, "name", r.id);
    r.description = opt_string(o, "description");
    const std::string realm = opt_string(o, "realm", "mortal");
    const auto parsed = realm_from_string(realm);
    if (!parsed) throw std::runtime_error("region " + r.id + ": unknown realm '" + realm + "'");
    r.realm = *parsed;
    r.danger_level = static_cast<int>(opt_number(o, "danger_level", 1.0));
    r.terrain = opt_string(o, "terrain");
    r.has_shop = opt_bool(o, "has_shop");
    r.is_city = opt_bool(o, "is_city");
    r.connections = string_list(o, "connections");
    if (const auto* loot = json::find(o, "loot")) {
      for (const auto& lv : loot->array()) {
        const auto& lo = lv.object();
        LootEntry e;
        e.item_id = required_string(lo, "item", "region " + r.id + " loot");
        e.weight = opt_number(lo, "weight");
        e.min_danger = static_cast<int>(opt_number(lo, "min_danger", 1.0));
        r.loot_table.push_back(std::move(e));
      }
    }
    r.event_pool = string_list(o, "events");
    db.regions.push_back(std::move(r));
  }

  for (const auto& [id, v] : required_object(root, "items", "content")) {
    const auto& o = v.object();
    ItemDef it;
    it.id = id;
    it.name = opt_string(o, "name", id);
    it.description = opt_string(o, "description");
    const std::string cat = opt_string(o, "category", "material");
    const auto parsed_cat = item_category_from_string(cat);
    if (!parsed_cat) throw std::runtime_error("item " + id + ": unknown category '" + cat + "'");
    it.category = *parsed_cat;
    const std::string rar = opt_string(o, "rarity", "common");
    const auto parsed_rar = rarity_from_string(rar);
    if (!parsed_rar) throw std::runtime_error("item " + id + ": unknown rarity '" + rar + "'");
    it.rarity = *parsed_rar;
    if (const auto* e = json::find(o, "effects")) {
      const auto& eo = e->object();
      it.effects.xp_multiplier = opt_number(eo, "xp_multiplier");
      it.effects.xp_multiplier_duration = static_cast<int>(opt_number(eo, "xp_multiplier_duration"));
      it.effects.breakthrough_bonus = opt_number(eo, "breakthrough_bonus");
      it.effects.heal_qi_deviation = opt_bool(eo, "heal_qi_deviation");
      it.effects.preserve_inventory = opt_bool(eo, "preserve_inventory");
      it.effects.preserve_rolls = opt_bool(eo, "preserve_rolls");
      it.effects.tribulation_hp_bonus = opt_number(eo, "tribulation_hp_bonus");
    }
    it.sell_value = static_cast<std::int64_t>(opt_number(o, "sell_value"));
    it.stackable = opt_bool(o, "stackable", true);
    db.items[id] = std::move(it);
  }

  for (const auto& v : required_array(root, "events", "content")) {
    const auto& o = v.object();
    EventDef e;
    e.id = required_string(o, "id", "events");
    e.title = opt_string(o, "title", e.id);
    e.description = opt_string(o, "description");
    e.fated = opt_bool(o, "fated");
    for (const auto& cv : required_array(o, "choices", "event " + e.id)) {
      const auto& co = cv.object();
      EventChoiceDef c;
      c.text = opt_string(co, "text");
      c.karma_change = static_cast<int>(opt_number(co, "karma"));
      c.reward_stones = static_cast<std::int64_t>(opt_number(co, "stones"));
      c.reward_items = string_list(co, "items");
      c.loss_stones = static_cast<std::int64_t>(opt_number(co, "stone_loss"));
      c.time_penalty_seconds = static_cast<int>(opt_number(co, "time_penalty"));
      e.choices.push_back(std::move(c));
    }
    db.events.push_back(std::move(e));
  }

  if (const auto* shops = json::find(root, "shops")) {
    for (const auto& [realm, sv] : shops->object()) {
      const auto parsed = realm_from_string(realm);
      if (!parsed) throw std::runtime_error("shops: unknown realm '" + realm + "'");
      const auto& so = sv.object();
      ShopDef s;
      s.realm = *parsed;
      s.price_multiplier = opt_number(so, "price_multiplier", 1.0);
      s.item_ids = string_list(so, "items");
      db.shops.push_back(std::move(s));
    }
  }

  if (const auto* groups = json::find(root, "groups")) {
    for (const auto& gv : groups->array()) {
      const auto& o = gv.object();
      GroupDef g;
      g.id = required_string(o, "id", "groups");
      g.name = opt_string(o, "name", g.id);
      g.type = opt_string(o, "type");
      g.description = opt_string(o, "description");
      g.location = opt_string(o, "location");
      g.karma_min = static_cast<int>(opt_number(o, "karma_min", kKarmaMin));
      g.karma_max = static_cast<int>(opt_number(o, "karma_max", kKarmaMax));
      if (const auto* missions = json::find(o, "missions")) {
        for (const auto& mv : missions->array()) {
          const auto& mo = mv.object();
          MissionDef m;
          m.id = required_string(mo, "id", "group " + g.id + " missions");
          m.name = opt_string(mo, "name", m.id);
          m.description = opt_string(mo, "description");
          m.duration_seconds = static_cast<int>(opt_number(mo, "duration"));
          if (const auto* h = json::find(mo, "help")) m.help = parse_mission_option(h->object());
          if (const auto* x = json::find(mo, "exploit")) m.exploit = parse_mission_option(x->object());
          g.missions.push_back(std::move(m));
        }
      }
      db.groups.push_back(std::move(g));
    }
  }

  return db;
}

ContentDB load_content_db_from_file(const std::string& path) {
  return load_content_db_from_json(read_text_file(path));
}

} // namespace granddao
