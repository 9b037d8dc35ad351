#include "granddao/core/tribulation.h"

#include <algorithm>
#include <cmath>

#include "granddao/core/character.h"

namespace granddao {

Tribulation Tribulation::begin(const ContentDB& content, const GameState& s, const PathProgress& pp,
                               const TribulationRules& rules, std::int64_t now_ms, std::uint64_t generation) {
  Tribulation t;
  t.generation_ = generation;
  t.path_id_ = pp.path_id;
  t.level_ = pp.level;
  t.tier_ = pp.level <= 4 ? 1 : 2;

  const int base_strikes = t.tier_ == 1 ? rules.tier1_strikes : rules.tier2_strikes;
  const int devil = s.character.devil_mark ? std::max(1, rules.devil_strike_multiplier) : 1;
  t.strikes_ = std::max(1, base_strikes * devil);

  double hp_bonus = 0.0;
  for (const auto& e : s.inventory) {
    const ItemDef* def = content.find_item(e.item_id);
    if (def) hp_bonus += def->effects.tribulation_hp_bonus;
  }
  const double power = pp.level * 10.0 + character_body_multiplier(content, s.character) * 20.0;
  t.max_hp_ = std::max(1, static_cast<int>(std::floor(power * (1.0 + hp_bonus))));
  t.hp_ = t.max_hp_;
  t.damage_ = static_cast<int>(std::floor(t.max_hp_ * rules.damage_fraction));

  t.window_ms_ = t.tier_ == 1 ? rules.tier1_window_ms : rules.tier2_window_ms;
  t.gap_ms_ = rules.strike_gap_ms;
  t.next_arm_ms_ = now_ms + rules.first_strike_delay_ms;
  t.status_ = TribulationStatus::Waiting;
  return t;
}

bool Tribulation::poll(std::int64_t now_ms) {
  bool changed = false;
  // A long gap between polls can cover several arm/expire cycles.
  while (!finished()) {
    if (status_ == TribulationStatus::Waiting && now_ms >= next_arm_ms_) {
      status_ = TribulationStatus::StrikeActive;
      strike_deadline_ms_ = next_arm_ms_ + window_ms_;
      changed = true;
      continue;
    }
    if (status_ == TribulationStatus::StrikeActive && now_ms >= strike_deadline_ms_) {
      take_damage(strike_deadline_ms_);
      changed = true;
      continue;
    }
    break;
  }
  return changed;
}

bool Tribulation::resist(std::int64_t now_ms) {
  if (status_ != TribulationStatus::StrikeActive) return false;
  if (now_ms >= strike_deadline_ms_) return false;
  advance_strike(now_ms);
  return true;
}

bool Tribulation::fail(std::int64_t now_ms) {
  if (status_ != TribulationStatus::StrikeActive) return false;
  take_damage(std::min(now_ms, strike_deadline_ms_));
  return true;
}

void Tribulation::abandon() {
  if (finished()) return;
  status_ = TribulationStatus::Abandoned;
}

void Tribulation::take_damage(std::int64_t now_ms) {
  hp_ = std::max(0, hp_ - damage_);
  if (hp_ <= 0) {
    status_ = TribulationStatus::Failed;
    return;
  }
  advance_strike(now_ms);
}

void Tribulation::advance_strike(std::int64_t now_ms) {
  current_strike_ += 1;
  if (current_strike_ >= strikes_) {
    status_ = TribulationStatus::Survived;
    return;
  }
  status_ = TribulationStatus::Waiting;
  next_arm_ms_ = now_ms + gap_ms_;
}

const char* tribulation_status_to_string(TribulationStatus s) {
  switch (s) {
    case TribulationStatus::Waiting: return "waiting";
    case TribulationStatus::StrikeActive: return "strike_active";
    case TribulationStatus::Survived: return "survived";
    case TribulationStatus::Failed: return "failed";
    case TribulationStatus::Abandoned: return "abandoned";
  }
  return "waiting";
}

} // namespace granddao
