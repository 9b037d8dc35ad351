#pragma once

#include <string>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"

namespace granddao {

// Behaviour attached to a path id. Paths themselves are plain content data;
// everything that needs code lives here.
struct PathRules {
  // Speed multiplier before base rate, buffs, deviation and legacy.
  double (*speed)(const ContentDB&, const GameState&){nullptr};
  // Predicate swept once per tick (and after loot or event rewards).
  bool (*unlock)(const ContentDB&, const GameState&){nullptr};
};

// nullptr for ids without rules. validate_content_db reports such paths.
const PathRules* find_path_rules(const std::string& path_id);

// Speed for path_id in the current state, including the equipped scripture's
// multiplier while cultivating. 0 for unknown ids.
double path_speed(const ContentDB& content, const GameState& s, const std::string& path_id);

// False for unknown ids. Already-unlocked paths also report true.
bool path_unlock_condition_met(const ContentDB& content, const GameState& s, const std::string& path_id);

} // namespace granddao
