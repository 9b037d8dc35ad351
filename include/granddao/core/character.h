#pragma once

#include <cstdint>
#include <string>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"
#include "granddao/core/random.h"

namespace granddao {

// Trait lookups. Unknown ids fall back to a neutral 1.0 / 1.0 / 0.0 so that a
// save referencing removed content still ticks.
double character_qi_multiplier(const ContentDB& content, const Character& c);
double character_body_multiplier(const ContentDB& content, const Character& c);
double character_qi_bonus(const ContentDB& content, const Character& c);

// nullptr when the background id is unknown.
const BackgroundDef* character_background(const ContentDB& content, const Character& c);

// Rolls a fresh character: spirit root and body type by table weight, then a
// uniform background, then luck. A background with hidden luck raises luck
// here (capped at 1.0), so the value is a stable trait from then on.
Character roll_character(const ContentDB& content, RandomSource& rng, const std::string& name);

// The playing-phase state for a freshly created character.
//
// Martial is unlocked and active, the action is idle, the start region and
// its neighbours are discovered and background stones/scripture are granted.
// Narration goes through push_log with the given log cap.
GameState create_initial_state(const ContentDB& content, const Character& c, std::int64_t now_ms,
                               int max_log_entries);

// Stones charged for the next reroll: free once, then 10^n.
std::int64_t reroll_cost(int reroll_count);

} // namespace granddao
