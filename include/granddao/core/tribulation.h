#pragma once

#include <cstdint>
#include <string>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"

namespace granddao {

// Timing and balance knobs for the heavenly tribulation.
struct TribulationRules {
  int tier1_strikes{3};
  int tier2_strikes{6};
  // Strikes are doubled for a character carrying the devil mark.
  int devil_strike_multiplier{2};

  int tier1_window_ms{3000};
  int tier2_window_ms{2000};

  // The first strike arms this long after the tribulation begins.
  int first_strike_delay_ms{1000};
  // Later strikes arm this long after the previous strike resolves.
  int strike_gap_ms{800};

  // Fraction of max HP lost per failed strike.
  double damage_fraction{0.3};
};

enum class TribulationStatus {
  // Between strikes; the next one arms at next_arm_ms().
  Waiting,
  // A strike is falling and must be resisted before strike_deadline_ms().
  StrikeActive,
  Survived,
  Failed,
  Abandoned,
};

// A single tribulation run: a bounded sequence of timed strikes.
//
// This is a pure state machine over caller-supplied millisecond timestamps.
// It never reads a clock or touches GameState; Simulation applies the
// outcome. Every run carries a generation token so that a poll scheduled for
// an older run can be recognised and dropped.
class Tribulation {
 public:
  // Builds a run for `pp` (the active path, ready at a tier boundary).
  //
  // max HP = floor((level*10 + body*20) * (1 + sum of tribulation_hp_bonus
  // over inventory entries)).
  static Tribulation begin(const ContentDB& content, const GameState& s, const PathProgress& pp,
                           const TribulationRules& rules, std::int64_t now_ms, std::uint64_t generation);

  // Advances timers up to now_ms: arms the next strike when due and resolves
  // an expired strike window as a failed strike. Returns true if anything
  // changed.
  bool poll(std::int64_t now_ms);

  // Resist the active strike. Ignored (returns false) when no strike is
  // active or its window already closed.
  bool resist(std::int64_t now_ms);

  // Take the active strike head-on. Ignored when no strike is active.
  bool fail(std::int64_t now_ms);

  void abandon();

  bool finished() const {
    return status_ == TribulationStatus::Survived || status_ == TribulationStatus::Failed ||
           status_ == TribulationStatus::Abandoned;
  }

  std::uint64_t generation() const { return generation_; }
  TribulationStatus status() const { return status_; }
  const std::string& path_id() const { return path_id_; }
  int level() const { return level_; }
  int tier() const { return tier_; }
  int strikes() const { return strikes_; }
  int current_strike() const { return current_strike_; }
  int hp() const { return hp_; }
  int max_hp() const { return max_hp_; }
  int damage_per_strike() const { return damage_; }
  int window_ms() const { return window_ms_; }
  std::int64_t next_arm_ms() const { return next_arm_ms_; }
  std::int64_t strike_deadline_ms() const { return strike_deadline_ms_; }

 private:
  void take_damage(std::int64_t now_ms);
  void advance_strike(std::int64_t now_ms);

  std::uint64_t generation_{0};
  TribulationStatus status_{TribulationStatus::Waiting};
  std::string path_id_;
  int level_{0};
  int tier_{1};
  int strikes_{0};
  int current_strike_{0};
  int hp_{0};
  int max_hp_{0};
  int damage_{0};
  int window_ms_{0};
  int gap_ms_{0};
  std::int64_t next_arm_ms_{0};
  std::int64_t strike_deadline_ms_{0};
};

const char* tribulation_status_to_string(TribulationStatus s);

} // namespace granddao
