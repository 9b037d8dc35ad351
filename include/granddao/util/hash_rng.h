#pragma once

#include <cstdint>

namespace granddao::util {

// splitmix64 mixing step (Sebastiano Vigna). Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);
}

// Deterministic splitmix64 stream: the same seed always yields the same draws.
struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  std::uint64_t next_u64() {
    s = splitmix64(s);
    return s;
  }

  double next_u01() { return u01_from_u64(next_u64()); }
};

} // namespace granddao::util
