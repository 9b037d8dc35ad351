#pragma once

#include <string>

#include "granddao/core/content.h"

namespace granddao {

// XP curve: floor(100 * 2.2^level * tier_multiplier), tier multipliers 1/5/25.
double xp_required_for_level(int level);

// 1 for levels 1-4, 2 for 5-8, 3 for 9-12.
int tier_for_level(int level);

// "Mortal", "Transcendent", "Divine".
std::string tier_name(int tier);

// Per-level base breakthrough chance; 0.10 for levels outside the table.
double breakthrough_base_rate(int level);

// Levels whose breakthrough crosses into the next tier (4 and 8).
bool is_tier_transition_level(int level);

// Level metadata for display; nullptr for out-of-range levels.
const PathLevelDef* path_level(const PathDef& path, int level);

// A level-1 progress record with no XP.
PathProgress make_path_progress(const std::string& path_id, bool unlocked);

} // namespace granddao
