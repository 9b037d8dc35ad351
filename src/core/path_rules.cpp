#include "granddao/core/path_rules.h"

#include <unordered_map>

#include "granddao/core/character.h"
#include "granddao/core/inventory.h"

namespace granddao {
namespace {

double qi(const ContentDB& c, const GameState& s) { return character_qi_multiplier(c, s.character); }
double body(const ContentDB& c, const GameState& s) { return character_body_multiplier(c, s.character); }
double qi_with_bonus(const ContentDB& c, const GameState& s) {
  return character_qi_multiplier(c, s.character) + character_qi_bonus(c, s.character);
}

bool already_unlocked(const GameState& s, const char* id) {
  const PathProgress* pp = find_ptr(s.path_progress, std::string(id));
  return pp && pp->unlocked;
}

bool any_underworld_discovered(const ContentDB& c, const GameState& s) {
  for (const auto& rid : s.discovered_regions) {
    const RegionDef* r = c.find_region(rid);
    if (r && r->realm == Realm::Underworld) return true;
  }
  return false;
}

const std::unordered_map<std::string, PathRules>& rules_table() {
  static const std::unordered_map<std::string, PathRules> table = {
      {"spirit",
       {[](const ContentDB& c, const GameState& s) { return qi_with_bonus(c, s); },
        [](const ContentDB& c, const GameState& s) {
          return !s.equipped_scripture.empty() || has_item_in_category(c, s, ItemCategory::Scripture);
        }}},
      {"martial",
       {[](const ContentDB& c, const GameState& s) { return body(c, s); },
        [](const ContentDB&, const GameState&) { return true; }}},
      {"rogue",
       {[](const ContentDB& c, const GameState& s) { return qi_with_bonus(c, s) * 0.8; },
        [](const ContentDB&, const GameState& s) { return s.character.rogue_status; }}},
      {"devil_soul",
       {[](const ContentDB& c, const GameState& s) { return qi_with_bonus(c, s) * 1.2; },
        [](const ContentDB&, const GameState& s) { return s.character.karma <= -100; }}},
      {"devil_body",
       {[](const ContentDB& c, const GameState& s) { return body(c, s) * 1.2; },
        [](const ContentDB&, const GameState& s) { return s.character.karma <= -100; }}},
      {"alchemy",
       {[](const ContentDB& c, const GameState& s) { return qi(c, s) * 0.5 + 0.5; },
        [](const ContentDB&, const GameState& s) {
          return has_item(s, "alchemy_manual") || already_unlocked(s, "alchemy");
        }}},
      {"formations",
       {[](const ContentDB& c, const GameState& s) { return qi(c, s) * 0.5 + 0.5; },
        [](const ContentDB&, const GameState& s) {
          return has_item(s, "formation_blueprint") || already_unlocked(s, "formations");
        }}},
      // Only opened by the spirit beast encounter while exploring.
      {"beast_tamer",
       {[](const ContentDB& c, const GameState& s) { return (qi(c, s) + body(c, s)) * 0.5; },
        [](const ContentDB&, const GameState& s) { return already_unlocked(s, "beast_tamer"); }}},
      {"artificer",
       {[](const ContentDB& c, const GameState& s) { return body(c, s) * 0.5 + 0.5; },
        [](const ContentDB&, const GameState& s) {
          return has_item(s, "artificer_blueprint") || already_unlocked(s, "artificer");
        }}},
      {"oracle",
       {[](const ContentDB& c, const GameState& s) { return qi(c, s) * 0.7 + s.character.luck * 0.5; },
        [](const ContentDB&, const GameState& s) {
          return s.karma_visible && (has_item(s, "divination_manual") || already_unlocked(s, "oracle"));
        }}},
      {"harmonic",
       {[](const ContentDB& c, const GameState& s) { return qi(c, s) * 0.8; },
        [](const ContentDB&, const GameState& s) {
          return (has_item(s, "harmonic_scripture") && has_item(s, "musical_instrument")) ||
                 already_unlocked(s, "harmonic");
        }}},
      {"scholar",
       {[](const ContentDB& c, const GameState& s) { return qi(c, s) * 0.6 + 0.4; },
        [](const ContentDB&, const GameState& s) {
          return has_item(s, "ancient_text") || already_unlocked(s, "scholar");
        }}},
      {"bloodline",
       {[](const ContentDB& c, const GameState& s) { return body(c, s) * 0.6; },
        [](const ContentDB& c, const GameState& s) {
          return body(c, s) >= 1.5 || has_item(s, "bloodline_elixir") || already_unlocked(s, "bloodline");
        }}},
      // Only opened by a lucid dream while cultivating.
      {"dream",
       {[](const ContentDB& c, const GameState& s) { return qi(c, s) * 0.7; },
        [](const ContentDB&, const GameState& s) { return already_unlocked(s, "dream"); }}},
      {"necromancy",
       {[](const ContentDB& c, const GameState& s) { return qi(c, s) * 0.9; },
        [](const ContentDB& c, const GameState& s) {
          return any_underworld_discovered(c, s) || has_item(s, "book_of_the_dead") ||
                 already_unlocked(s, "necromancy");
        }}},
  };
  return table;
}

} // namespace

const PathRules* find_path_rules(const std::string& path_id) { return find_ptr(rules_table(), path_id); }

double path_speed(const ContentDB& content, const GameState& s, const std::string& path_id) {
  const PathRules* r = find_path_rules(path_id);
  if (!r || !r->speed) return 0.0;
  double speed = r->speed(content, s);

  if (s.current_action == ActionType::Cultivate && !s.equipped_scripture.empty()) {
    const ItemDef* scripture = content.find_item(s.equipped_scripture);
    if (scripture && scripture->effects.xp_multiplier > 0.0) speed *= scripture->effects.xp_multiplier;
  }
  return speed;
}

bool path_unlock_condition_met(const ContentDB& content, const GameState& s, const std::string& path_id) {
  const PathRules* r = find_path_rules(path_id);
  if (!r || !r->unlock) return false;
  return r->unlock(content, s);
}

} // namespace granddao
