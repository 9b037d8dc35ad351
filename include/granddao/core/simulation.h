#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"
#include "granddao/core/random.h"
#include "granddao/core/tribulation.h"
#include "granddao/util/time.h"

namespace granddao {

struct SimConfig {
  // XP per second at speed 1.0 before any multipliers.
  double base_xp_per_second{1.0};

  // XP multiplier for a tick that follows a player click.
  double click_boost_multiplier{2.0};

  // Every N ticks an exploring character may be handed a region event.
  int event_check_interval_ticks{60};

  // Fated encounter chance per exploring tick, scaled by (1 + luck * 5).
  double fated_encounter_base_chance{0.0001};

  // Exploration rolls (per tick, while the action is explore).
  double stone_trickle_chance{0.033};
  // Only some trickle finds are narrated to keep the log readable.
  double stone_trickle_log_chance{0.3};
  double loot_base_chance{0.005};
  double loot_luck_chance{0.025};
  double rogue_loot_bonus{0.005};

  // Special unlock rolls.
  double beast_tamer_chance_per_luck{0.005};
  double dream_unlock_chance{0.0002};

  // Maximum number of entries kept in GameState::log.
  int max_log_entries{50};

  // Offline catch-up. Gaps shorter than the minimum are ignored, longer ones
  // are capped.
  int offline_cap_seconds{8 * 3600};
  int offline_min_seconds{5};
  // One spirit stone per this many offline seconds.
  int offline_seconds_per_stone{600};

  // Duration of the half-speed debuff after a qi deviation.
  int qi_deviation_seconds{1800};

  // Spirit stone boost: cost = base + step * (boosts already running).
  std::int64_t boost_base_cost{10};
  std::int64_t boost_cost_step{10};
  double boost_multiplier{5.0};
  int boost_duration_seconds{600};

  // Legacy XP bonus gained per level of the highest path reached, per rebirth.
  double legacy_per_level{0.01};

  // Travel time = base + danger_level * per_danger.
  int travel_base_seconds{30};
  int travel_seconds_per_danger{30};

  // Breakthrough success chance is capped here.
  double max_breakthrough_chance{0.95};
  double luck_breakthrough_factor{0.05};

  TribulationRules tribulation;

  // Seed for the default HashRandom source.
  std::uint64_t rng_seed{1};
};

enum class BreakthroughOutcome {
  Success,
  MinorSetback,
  QiDeviation,
  CripplingInjury,
  Death,
  // Precondition failed (no active path, not ready, already at the top
  // level, or a tier boundary that needs a tribulation); nothing was changed.
  NotReady,
  // The attempt crosses a tier boundary and a tribulation was started
  // instead of rolling (Session routing only).
  TribulationStarted,
};

struct BreakthroughResult {
  BreakthroughOutcome outcome{BreakthroughOutcome::NotReady};
  bool success{false};
  // The success chance that was rolled against (0 when not rolled).
  double chance{0.0};
  std::string message;
};

struct OfflineReport {
  bool applied{false};
  std::int64_t elapsed_seconds{0};
  double xp_gained{0.0};
  std::int64_t stones_gained{0};
  bool arrived{false};
};

struct TribulationUpdate {
  // False when the input was ignored (no tribulation, stale generation, no
  // strike to resist).
  bool accepted{false};
  TribulationStatus status{TribulationStatus::Waiting};
  // The tribulation ended in this call (Survived, Failed or Abandoned).
  bool finished{false};
};

const char* breakthrough_outcome_to_string(BreakthroughOutcome o);

class Simulation {
 public:
  Simulation(ContentDB content, SimConfig cfg);

  const ContentDB& content() const { return content_; }
  const SimConfig& cfg() const { return cfg_; }

  GameState& state() { return state_; }
  const GameState& state() const { return state_; }

  // Replace the random source (tests use a scripted one).
  void set_random_source(std::unique_ptr<RandomSource> rng);
  RandomSource& rng() { return *rng_; }

  // Non-owning. nullptr restores the built-in system clock.
  void set_clock(const Clock* clock);
  std::int64_t now_ms() const;

  // --- Character creation ---
  // Rolls a character and enters the creation phase.
  void begin_character_creation(const std::string& name);
  // Pays reroll_cost() from the creation-phase stones and rolls again.
  // Returns false outside character creation or when the stones are short.
  bool reroll_character();
  // Accepts the rolled character and builds the playing state.
  bool confirm_character();
  // begin_character_creation + confirm_character.
  void new_game(const std::string& name);
  void load_game(GameState loaded);

  // --- Time ---
  // One game second. No-op outside the playing phase.
  void tick(bool click_boosted = false);
  void advance_seconds(int seconds);

  // Applies the time since state().last_save_timestamp_ms in closed form.
  OfflineReport catch_up(std::int64_t now_ms);

  // --- Breakthrough ---
  double breakthrough_chance(double pill_bonus = 0.0) const;
  // The active path is unlocked, full of XP and below the top level.
  bool breakthrough_ready() const;
  // Rolls a breakthrough. Tier boundaries never roll: they return NotReady
  // and must go through start_tribulation().
  BreakthroughResult attempt_breakthrough(double pill_bonus = 0.0);
  // Removes every breakthrough pill and returns their summed bonus.
  double consume_breakthrough_pills();
  // The active path is ready at a tier boundary (levels 4 and 8).
  bool tribulation_required() const;

  // --- Tribulation ---
  bool start_tribulation();
  const Tribulation* tribulation() const { return tribulation_ ? &*tribulation_ : nullptr; }
  // Advances the strike timers of the tribulation with the given generation.
  TribulationUpdate poll_tribulation(std::uint64_t generation, std::int64_t now_ms);
  TribulationUpdate resist_strike();
  TribulationUpdate fail_strike();
  void abandon_tribulation();

  // --- Rebirth ---
  // Replaces the character after a death, carrying legacy forward.
  void rebirth();

  // --- Commands ---
  // Sets the current action and auto-selects a matching unlocked path.
  bool set_action(ActionType action);
  bool select_path(const std::string& path_id);
  bool set_rogue_status(bool rogue);

  std::int64_t boost_cost() const;
  bool buy_boost();
  bool use_item(const std::string& item_id);
  bool equip_scripture(const std::string& item_id);

  int travel_seconds_to(const std::string& region_id) const;
  bool travel_to(const std::string& region_id);

  bool choose_event_option(int index);

  // --- Shops ---
  bool shop_available() const;
  std::vector<std::string> shop_stock() const;
  // -1 for unknown items.
  std::int64_t shop_price(const std::string& item_id) const;
  bool buy_item(const std::string& item_id);
  bool sell_item(const std::string& item_id);

  // --- Groups ---
  bool can_join_group(const std::string& group_id) const;
  std::vector<std::string> available_groups() const;
  bool join_group(const std::string& group_id);
  bool leave_group();
  bool complete_mission(const std::string& mission_id, bool help);

 private:
  void push_event(LogKind kind, std::string message);

  bool playing() const { return state_.phase == GamePhase::Playing; }

  // Tick phases (simulation_tick.cpp / simulation_exploration.cpp).
  bool tick_travel();
  void tick_buffs();
  void tick_qi_deviation();
  void tick_xp(bool click_boosted);
  void tick_exploration();
  void tick_karma_visibility();
  void tick_highest_level();
  void tick_special_unlocks();

  void arrive_at_destination();
  void generate_loot(const RegionDef& region);
  void assign_event(const EventDef& ev);

  // Path bookkeeping.
  PathProgress* active_progress();
  const PathProgress* active_progress() const;
  // The active path that would accrue XP right now (gate shared by the live
  // tick and offline catch-up), or nullptr.
  PathProgress* accruing_progress();
  double xp_per_second(const std::string& path_id, bool with_buffs) const;
  bool add_xp(PathProgress& pp, double amount);
  bool unlock_path(const std::string& path_id, LogKind kind, const std::string& message);
  void check_path_unlocks();
  void check_devil_mark();
  void apply_breakthrough_success(PathProgress& pp);

  ContentDB content_;
  SimConfig cfg_;
  GameState state_;

  std::unique_ptr<RandomSource> rng_;
  SystemClock system_clock_;
  const Clock* clock_{nullptr};

  std::optional<Tribulation> tribulation_;
  std::uint64_t next_tribulation_generation_{1};
};

} // namespace granddao
