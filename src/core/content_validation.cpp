#include "granddao/core/content_validation.h"

#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "granddao/core/enum_strings.h"
#include "granddao/core/path_rules.h"

namespace granddao {
namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

template <typename T>
void check_unique_ids(const std::vector<T>& v, const char* table, std::vector<std::string>& errors) {
  std::unordered_set<std::string> seen;
  for (const auto& e : v) {
    if (e.id.empty()) push(errors, join(table, " entry has an empty id"));
    if (!seen.insert(e.id).second) push(errors, join(table, " id '", e.id, "' is duplicated"));
  }
}

template <typename T>
void check_weights(const std::vector<T>& v, const char* table, std::vector<std::string>& errors) {
  double total = 0.0;
  for (const auto& e : v) {
    if (e.probability < 0.0) push(errors, join(table, " '", e.id, "' has a negative probability"));
    total += e.probability;
  }
  if (!v.empty() && total <= 0.0) push(errors, join(table, " weights sum to zero"));
  if (v.empty()) push(errors, join(table, " is empty"));
}

} // namespace

std::vector<std::string> validate_content_db(const ContentDB& db) {
  std::vector<std::string> errors;

  check_unique_ids(db.spirit_roots, "spirit_roots", errors);
  check_unique_ids(db.body_types, "body_types", errors);
  check_unique_ids(db.backgrounds, "backgrounds", errors);
  check_unique_ids(db.paths, "paths", errors);
  check_unique_ids(db.regions, "regions", errors);
  check_unique_ids(db.events, "events", errors);
  check_unique_ids(db.groups, "groups", errors);
  check_weights(db.spirit_roots, "spirit_roots", errors);
  check_weights(db.body_types, "body_types", errors);

  if (db.backgrounds.empty()) push(errors, "backgrounds is empty");
  for (const auto& bg : db.backgrounds) {
    if (!db.find_region(bg.start_location)) {
      push(errors, join("Background '", bg.id, "' starts in unknown region '", bg.start_location, "'"));
    }
    if (bg.effect.shop_discount < 0.0 || bg.effect.shop_discount >= 1.0) {
      push(errors, join("Background '", bg.id, "' has shop_discount outside [0, 1)"));
    }
  }

  for (const auto& p : db.paths) {
    if (static_cast<int>(p.levels.size()) != kMaxPathLevel) {
      push(errors, join("Path '", p.id, "' has ", p.levels.size(), " levels (expected ", kMaxPathLevel, ")"));
    }
    if (!find_path_rules(p.id)) push(errors, join("Path '", p.id, "' has no speed/unlock rules"));
    if (p.action == ActionType::Idle) push(errors, join("Path '", p.id, "' declares the idle action"));
  }
  if (!db.find_path("martial")) push(errors, "Path 'martial' is required (always unlocked at start)");

  for (const auto& r : db.regions) {
    for (const auto& c : r.connections) {
      if (!db.find_region(c)) push(errors, join("Region '", r.id, "' connects to unknown region '", c, "'"));
      if (c == r.id) push(errors, join("Region '", r.id, "' connects to itself"));
    }
    for (const auto& l : r.loot_table) {
      if (!db.find_item(l.item_id)) push(errors, join("Region '", r.id, "' loot references unknown item '", l.item_id, "'"));
      if (l.weight < 0.0) push(errors, join("Region '", r.id, "' loot '", l.item_id, "' has a negative weight"));
    }
    for (const auto& e : r.event_pool) {
      if (!db.find_event(e)) push(errors, join("Region '", r.id, "' event pool references unknown event '", e, "'"));
    }
    if (r.danger_level < 0) push(errors, join("Region '", r.id, "' has a negative danger level"));
  }

  for (const auto& [id, item] : db.items) {
    if (id != item.id) push(errors, join("Item key '", id, "' does not match its id '", item.id, "'"));
    if (item.sell_value < 0) push(errors, join("Item '", id, "' has a negative sell value"));
  }

  for (const auto& ev : db.events) {
    if (ev.choices.empty()) push(errors, join("Event '", ev.id, "' has no choices"));
    for (const auto& c : ev.choices) {
      for (const auto& it : c.reward_items) {
        if (!db.find_item(it)) push(errors, join("Event '", ev.id, "' rewards unknown item '", it, "'"));
      }
    }
  }

  for (const auto& shop : db.shops) {
    for (const auto& it : shop.item_ids) {
      if (!db.find_item(it)) {
        push(errors, join("Shop '", realm_to_string(shop.realm), "' stocks unknown item '", it, "'"));
      }
    }
    if (shop.price_multiplier <= 0.0) {
      push(errors, join("Shop '", realm_to_string(shop.realm), "' has a non-positive price multiplier"));
    }
  }

  for (const auto& g : db.groups) {
    if (!db.find_region(g.location)) push(errors, join("Group '", g.id, "' is located in unknown region '", g.location, "'"));
    if (g.karma_min > g.karma_max) push(errors, join("Group '", g.id, "' has karma_min > karma_max"));
    std::unordered_set<std::string> mission_ids;
    for (const auto& m : g.missions) {
      if (!mission_ids.insert(m.id).second) push(errors, join("Group '", g.id, "' repeats mission '", m.id, "'"));
    }
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace granddao
