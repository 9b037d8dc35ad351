#include "granddao/core/random.h"

#include <algorithm>
#include <cmath>

namespace granddao {

int random_int(RandomSource& rng, int lo, int hi) {
  if (hi < lo) std::swap(lo, hi);
  const double span = static_cast<double>(hi) - static_cast<double>(lo) + 1.0;
  const int offset = static_cast<int>(std::floor(rng.next_u01() * span));
  return std::min(hi, lo + offset);
}

std::size_t random_index(RandomSource& rng, std::size_t n) {
  if (n <= 1) return 0;
  const auto i = static_cast<std::size_t>(std::floor(rng.next_u01() * static_cast<double>(n)));
  return std::min(i, n - 1);
}

bool percent_chance(RandomSource& rng, double percent) { return rng.next_u01() * 100.0 < percent; }

bool rate_chance(RandomSource& rng, double rate) {
  return rng.next_u01() < std::clamp(rate, 0.0, 1.0);
}

double roll_luck(RandomSource& rng) {
  return std::clamp(std::pow(rng.next_u01(), 2.5), 0.1, 1.0);
}

Rarity roll_rarity(RandomSource& rng, double luck) {
  const double m = luck * 0.5;
  const double roll = rng.next_u01();
  if (roll < 0.0001 * (1.0 + m * 10.0)) return Rarity::Mythic;
  if (roll < 0.001 * (1.0 + m * 5.0)) return Rarity::Legendary;
  if (roll < 0.01 * (1.0 + m * 3.0)) return Rarity::Epic;
  if (roll < 0.05 * (1.0 + m * 2.0)) return Rarity::Rare;
  if (roll < 0.2 * (1.0 + m)) return Rarity::Uncommon;
  return Rarity::Common;
}

std::size_t weighted_index(RandomSource& rng, const std::vector<double>& weights) {
  if (weights.empty()) return weights.size();
  double total = 0.0;
  for (const double w : weights) total += std::max(0.0, w);

  double roll = rng.next_u01() * total;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    roll -= std::max(0.0, weights[i]);
    if (roll <= 0.0) return i;
  }
  // Only reachable through floating-point drift.
  return weights.size() - 1;
}

} // namespace granddao
