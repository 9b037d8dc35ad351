#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "granddao/core/content.h"
#include "granddao/util/hash_rng.h"

namespace granddao {

// Source of uniform draws for every probabilistic rule in the simulation.
//
// All helpers below consume exactly one draw per call, so a scripted source
// in tests can pin any outcome by feeding the right sequence of values.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Uniform in [0, 1).
  virtual double next_u01() = 0;
};

// Default source: a seeded splitmix64 stream.
class HashRandom final : public RandomSource {
 public:
  explicit HashRandom(std::uint64_t seed) : rng_(seed) {}

  double next_u01() override { return rng_.next_u01(); }

 private:
  util::HashRng rng_;
};

// Inclusive integer in [lo, hi].
int random_int(RandomSource& rng, int lo, int hi);

// Uniform index in [0, n). Returns 0 for n <= 1 without drawing.
std::size_t random_index(RandomSource& rng, std::size_t n);

// True with probability percent/100.
bool percent_chance(RandomSource& rng, double percent);

// True with probability `rate` (clamped to [0,1]).
bool rate_chance(RandomSource& rng, double rate);

// Luck roll skewed toward low values: clamp(u^2.5, 0.1, 1.0).
double roll_luck(RandomSource& rng);

// Luck-scaled rarity bucket, checked mythic first down to uncommon.
Rarity roll_rarity(RandomSource& rng, double luck);

// Weighted selection over non-negative weights.
//
// Draws r = u * total and subtracts weights in order until r <= 0, so ties and
// zero-weight tails favour earlier entries. Returns weights.size() for an
// empty list (no draw is consumed).
std::size_t weighted_index(RandomSource& rng, const std::vector<double>& weights);

} // namespace granddao
