#pragma once

#include <string>
#include <vector>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"

namespace granddao {

// Validate basic invariants and referential integrity of a GameState.
//
// Used to reject corrupt or hand-edited saves before they reach the
// simulation. If `content` is provided, ids that refer to content tables
// (spirit root, regions, items, paths, events, groups) are checked too.
//
// Returns a sorted list of human-readable error strings.
// Empty => state is considered valid.
std::vector<std::string> validate_game_state(const GameState& s, const ContentDB* content = nullptr);

} // namespace granddao
