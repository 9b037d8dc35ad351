#include "granddao/core/progression.h"

#include <cmath>

namespace granddao {

namespace {

constexpr double kBaseXp = 100.0;
constexpr double kScaleFactor = 2.2;

double tier_multiplier(int tier) {
  switch (tier) {
    case 1: return 1.0;
    case 2: return 5.0;
    default: return 25.0;
  }
}

} // namespace

double xp_required_for_level(int level) {
  return std::floor(kBaseXp * std::pow(kScaleFactor, level) * tier_multiplier(tier_for_level(level)));
}

int tier_for_level(int level) {
  if (level <= 4) return 1;
  if (level <= 8) return 2;
  return 3;
}

std::string tier_name(int tier) {
  switch (tier) {
    case 1: return "Mortal";
    case 2: return "Transcendent";
    case 3: return "Divine";
    default: return "Unknown";
  }
}

double breakthrough_base_rate(int level) {
  static constexpr double kRates[] = {0.70, 0.55, 0.40, 0.25, 0.50, 0.35, 0.25, 0.15, 0.30, 0.20, 0.10};
  if (level < 1 || level > static_cast<int>(sizeof(kRates) / sizeof(kRates[0]))) return 0.10;
  return kRates[level - 1];
}

bool is_tier_transition_level(int level) { return level == 4 || level == 8; }

const PathLevelDef* path_level(const PathDef& path, int level) {
  if (level < 1 || level > static_cast<int>(path.levels.size())) return nullptr;
  return &path.levels[static_cast<std::size_t>(level - 1)];
}

PathProgress make_path_progress(const std::string& path_id, bool unlocked) {
  PathProgress p;
  p.path_id = path_id;
  p.level = 1;
  p.xp = 0.0;
  p.xp_required = xp_required_for_level(1);
  p.breakthrough_available = false;
  p.unlocked = unlocked;
  return p;
}

} // namespace granddao
