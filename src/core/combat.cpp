#include "granddao/core/combat.h"

#include <algorithm>
#include <cmath>

#include "granddao/core/path_rules.h"

namespace granddao {

int calculate_power(const ContentDB& content, const GameState& s) {
  double power = 0.0;
  for (const auto& [id, pp] : s.path_progress) {
    if (!pp.unlocked) continue;
    if (!content.find_path(id)) continue;
    power += pp.level * path_speed(content, s, id) * 10.0;
  }
  return static_cast<int>(std::floor(power));
}

CombatResult resolve_combat(int player_power, int enemy_power, RandomSource& rng) {
  CombatResult r;
  r.ratio = static_cast<double>(player_power) / static_cast<double>(std::max(1, enemy_power));

  if (r.ratio > 1.2) {
    r.won = true;
    r.message = "Overwhelming victory!";
  } else if (r.ratio > 0.8) {
    r.won = rate_chance(rng, 0.7);
    r.message = r.won ? "Hard-fought victory!" : "Narrowly defeated...";
  } else {
    r.won = rate_chance(rng, 0.3);
    r.message = r.won ? "Miraculous upset!" : "Overwhelmingly defeated!";
  }
  return r;
}

} // namespace granddao
