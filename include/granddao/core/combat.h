#pragma once

#include <string>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"
#include "granddao/core/random.h"

namespace granddao {

struct CombatResult {
  bool won{false};
  // Power ratio player / max(1, enemy).
  double ratio{0.0};
  std::string message;
};

// Sum over unlocked paths of level * path speed * 10, floored.
int calculate_power(const ContentDB& content, const GameState& s);

// Ratio above 1.2 always wins; above 0.8 wins 70% of the time; otherwise 30%.
// Draws from rng only in the contested bands.
CombatResult resolve_combat(int player_power, int enemy_power, RandomSource& rng);

} // namespace granddao
