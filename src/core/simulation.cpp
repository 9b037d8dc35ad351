#include "granddao/core/simulation.h"

#include <algorithm>
#include <initializer_list>
#include <utility>

#include "granddao/core/character.h"
#include "granddao/core/inventory.h"
#include "granddao/core/path_rules.h"
#include "granddao/core/progression.h"
#include "granddao/util/log.h"
#include "granddao/util/strings.h"

namespace granddao {

const char* breakthrough_outcome_to_string(BreakthroughOutcome o) {
  switch (o) {
    case BreakthroughOutcome::Success: return "success";
    case BreakthroughOutcome::MinorSetback: return "minor_setback";
    case BreakthroughOutcome::QiDeviation: return "qi_deviation";
    case BreakthroughOutcome::CripplingInjury: return "crippling_injury";
    case BreakthroughOutcome::Death: return "death";
    case BreakthroughOutcome::NotReady: return "not_ready";
    case BreakthroughOutcome::TribulationStarted: return "tribulation_started";
  }
  return "not_ready";
}

Simulation::Simulation(ContentDB content, SimConfig cfg)
    : content_(std::move(content)), cfg_(std::move(cfg)), rng_(std::make_unique<HashRandom>(cfg_.rng_seed)) {}

void Simulation::set_random_source(std::unique_ptr<RandomSource> rng) {
  if (!rng) {
    rng_ = std::make_unique<HashRandom>(cfg_.rng_seed);
    return;
  }
  rng_ = std::move(rng);
}

void Simulation::set_clock(const Clock* clock) { clock_ = clock; }

std::int64_t Simulation::now_ms() const { return clock_ ? clock_->now_ms() : system_clock_.now_ms(); }

void Simulation::push_event(LogKind kind, std::string message) {
  push_log(state_, kind, std::move(message), now_ms(), cfg_.max_log_entries);
}

// --- Character creation ---

void Simulation::begin_character_creation(const std::string& name) {
  tribulation_.reset();
  state_ = GameState{};
  state_.phase = GamePhase::CharacterCreation;
  state_.character = roll_character(content_, *rng_, name.empty() ? "Unnamed Cultivator" : name);
}

bool Simulation::reroll_character() {
  if (state_.phase != GamePhase::CharacterCreation) return false;
  const std::int64_t cost = reroll_cost(state_.reroll_count);
  if (state_.spirit_stones < cost) return false;

  state_.spirit_stones -= cost;
  state_.reroll_count += 1;
  state_.character = roll_character(content_, *rng_, state_.character.name);
  return true;
}

bool Simulation::confirm_character() {
  if (state_.phase != GamePhase::CharacterCreation) return false;
  const int rerolls = state_.reroll_count;
  state_ = create_initial_state(content_, state_.character, now_ms(), cfg_.max_log_entries);
  state_.reroll_count = rerolls;
  return true;
}

void Simulation::new_game(const std::string& name) {
  begin_character_creation(name);
  confirm_character();
}

void Simulation::load_game(GameState loaded) {
  tribulation_.reset();
  state_ = std::move(loaded);
}

// --- Path bookkeeping ---

PathProgress* Simulation::active_progress() {
  if (state_.active_path_id.empty()) return nullptr;
  return find_ptr(state_.path_progress, state_.active_path_id);
}

const PathProgress* Simulation::active_progress() const {
  if (state_.active_path_id.empty()) return nullptr;
  return find_ptr(state_.path_progress, state_.active_path_id);
}

PathProgress* Simulation::accruing_progress() {
  if (state_.current_action == ActionType::Idle || state_.current_action == ActionType::Explore) return nullptr;
  PathProgress* pp = active_progress();
  if (!pp || !pp->unlocked || pp->breakthrough_available) return nullptr;
  const PathDef* path = content_.find_path(pp->path_id);
  if (!path || path->action != state_.current_action) return nullptr;
  return pp;
}

double Simulation::xp_per_second(const std::string& path_id, bool with_buffs) const {
  const double deviation = state_.qi_deviation.active ? 0.5 : 1.0;
  const double legacy = 1.0 + state_.character.legacy_bonus;
  double buffs = 1.0;
  if (with_buffs) {
    for (const auto& b : state_.buffs) buffs *= b.multiplier;
  }
  return cfg_.base_xp_per_second * path_speed(content_, state_, path_id) * deviation * legacy * buffs;
}

bool Simulation::add_xp(PathProgress& pp, double amount) {
  if (amount <= 0.0 || pp.breakthrough_available) return false;
  pp.xp = std::min(pp.xp + amount, pp.xp_required);
  if (pp.xp >= pp.xp_required) {
    pp.xp = pp.xp_required;
    pp.breakthrough_available = true;
    return true;
  }
  return false;
}

bool Simulation::unlock_path(const std::string& path_id, LogKind kind, const std::string& message) {
  PathProgress* existing = find_ptr(state_.path_progress, path_id);
  if (existing && existing->unlocked) return false;
  if (!content_.find_path(path_id)) return false;

  state_.path_progress[path_id] = make_path_progress(path_id, true);
  push_event(kind, message);
  return true;
}

void Simulation::check_path_unlocks() {
  for (const auto& path : content_.paths) {
    const PathProgress* pp = find_ptr(state_.path_progress, path.id);
    if (pp && pp->unlocked) continue;
    if (!path_unlock_condition_met(content_, state_, path.id)) continue;
    unlock_path(path.id, LogKind::Legendary, "New Path Unlocked: " + path.name + "!");
  }
}

void Simulation::check_devil_mark() {
  if (state_.character.karma > -100 || state_.character.devil_mark) return;
  const PathProgress* soul = find_ptr(state_.path_progress, std::string("devil_soul"));
  const PathProgress* body = find_ptr(state_.path_progress, std::string("devil_body"));
  if ((soul && soul->unlocked) || (body && body->unlocked)) {
    state_.character.devil_mark = true;
    push_event(LogKind::Danger, "You have been permanently marked as a Devil Cultivator!");
  }
}

// --- Commands ---

bool Simulation::set_action(ActionType action) {
  if (!playing()) return false;
  state_.current_action = action;

  auto first_unlocked = [&](std::initializer_list<const char*> ids) -> std::string {
    for (const char* id : ids) {
      const PathProgress* pp = find_ptr(state_.path_progress, std::string(id));
      if (pp && pp->unlocked) return id;
    }
    return {};
  };

  std::string pick;
  switch (action) {
    case ActionType::Idle:
    case ActionType::Explore:
      // Exploring never advances a path; leave the selection alone.
      return true;
    case ActionType::Cultivate:
      pick = first_unlocked({"spirit", "rogue", "devil_soul", "oracle", "harmonic", "bloodline", "dream", "necromancy"});
      if (pick.empty()) {
        push_event(LogKind::Warning,
                   "You need a Cultivation Scripture to cultivate the Spirit. Try Exploring or Training first!");
      }
      break;
    case ActionType::Train:
      pick = first_unlocked({"martial", "devil_body"});
      break;
    default:
      for (const auto& path : content_.paths) {
        if (path.action != action) continue;
        const PathProgress* pp = find_ptr(state_.path_progress, path.id);
        if (pp && pp->unlocked) {
          pick = path.id;
          break;
        }
      }
      break;
  }

  if (!pick.empty()) state_.active_path_id = pick;
  return true;
}

bool Simulation::select_path(const std::string& path_id) {
  if (!playing()) return false;
  const PathProgress* pp = find_ptr(state_.path_progress, path_id);
  if (!pp || !pp->unlocked) return false;
  state_.active_path_id = path_id;
  return true;
}

bool Simulation::set_rogue_status(bool rogue) {
  if (!playing()) return false;
  if (state_.character.rogue_status == rogue) return false;

  state_.character.rogue_status = rogue;
  if (rogue) state_.group_id.clear();
  push_event(LogKind::Info, rogue ? "You walk the path alone..." : "You rejoin society.");
  check_path_unlocks();
  return true;
}

std::int64_t Simulation::boost_cost() const {
  const auto running = std::count_if(state_.buffs.begin(), state_.buffs.end(),
                                     [](const ActiveBuff& b) { return b.id == "ss_boost"; });
  return cfg_.boost_base_cost + cfg_.boost_cost_step * static_cast<std::int64_t>(running);
}

bool Simulation::buy_boost() {
  if (!playing()) return false;
  const std::int64_t cost = boost_cost();
  if (state_.spirit_stones < cost) return false;

  state_.spirit_stones -= cost;
  ActiveBuff b;
  b.id = "ss_boost";
  b.name = "Spirit Stone Boost";
  b.multiplier = cfg_.boost_multiplier;
  b.remaining_seconds = cfg_.boost_duration_seconds;
  state_.buffs.push_back(std::move(b));

  push_event(LogKind::Success, "Activated " + format_fixed(cfg_.boost_multiplier, 0) + "x speed boost for " +
                                   format_duration(cfg_.boost_duration_seconds) + "! (Cost: " + std::to_string(cost) +
                                   " SS)");
  return true;
}

bool Simulation::use_item(const std::string& item_id) {
  if (!playing() || !has_item(state_, item_id)) return false;
  const ItemDef* def = content_.find_item(item_id);
  if (!def || def->category != ItemCategory::Pill) return false;

  const bool cures = def->effects.heal_qi_deviation && state_.qi_deviation.active;
  const bool buffs = def->effects.xp_multiplier > 0.0 && def->effects.xp_multiplier_duration > 0;
  if (!cures && !buffs) return false;

  if (cures) {
    state_.qi_deviation = QiDeviation{};
    push_event(LogKind::Success, "Qi Deviation cured!");
  }
  if (buffs) {
    ActiveBuff b;
    b.id = "pill_" + item_id + "_" + std::to_string(now_ms());
    b.name = def->name;
    b.multiplier = def->effects.xp_multiplier;
    b.remaining_seconds = def->effects.xp_multiplier_duration;
    state_.buffs.push_back(std::move(b));
    push_event(LogKind::Success, def->name + " consumed! " + format_fixed(def->effects.xp_multiplier, 1) +
                                     "x XP for " + format_duration(def->effects.xp_multiplier_duration));
  }

  remove_item(state_, item_id);
  return true;
}

bool Simulation::equip_scripture(const std::string& item_id) {
  if (!playing() || !has_item(state_, item_id)) return false;
  const ItemDef* def = content_.find_item(item_id);
  if (!def || def->category != ItemCategory::Scripture) return false;

  state_.equipped_scripture = item_id;
  push_event(LogKind::Success, "Equipped: " + def->name);
  check_path_unlocks();
  return true;
}

int Simulation::travel_seconds_to(const std::string& region_id) const {
  const RegionDef* r = content_.find_region(region_id);
  if (!r) return -1;
  return cfg_.travel_base_seconds + r->danger_level * cfg_.travel_seconds_per_danger;
}

bool Simulation::travel_to(const std::string& region_id) {
  if (!playing() || state_.travel.traveling) return false;
  if (region_id == state_.location_id) return false;
  const RegionDef* target = content_.find_region(region_id);
  if (!target) return false;

  const RegionDef* here = content_.find_region(state_.location_id);
  const bool connected =
      (here && std::find(here->connections.begin(), here->connections.end(), region_id) != here->connections.end()) ||
      std::find(target->connections.begin(), target->connections.end(), state_.location_id) !=
          target->connections.end();
  if (!connected) return false;

  const int seconds = travel_seconds_to(region_id);
  state_.travel.traveling = true;
  state_.travel.destination_id = region_id;
  state_.travel.remaining_seconds = seconds;
  push_event(LogKind::Info, "Traveling to " + target->name + "... (" + format_duration(seconds) + ")");
  return true;
}

bool Simulation::choose_event_option(int index) {
  if (!playing() || state_.pending_event_id.empty()) return false;
  const EventDef* ev = content_.find_event(state_.pending_event_id);
  if (!ev) {
    // Content changed under a saved pending event; drop it.
    log::warn("Dropping unknown pending event '" + state_.pending_event_id + "'");
    state_.pending_event_id.clear();
    return false;
  }
  if (index < 0 || index >= static_cast<int>(ev->choices.size())) return false;
  const EventChoiceDef& choice = ev->choices[static_cast<std::size_t>(index)];

  state_.character.karma = std::clamp(state_.character.karma + choice.karma_change, kKarmaMin, kKarmaMax);
  if (choice.reward_stones > 0) state_.spirit_stones += choice.reward_stones;
  if (choice.loss_stones > 0) state_.spirit_stones = std::max<std::int64_t>(0, state_.spirit_stones - choice.loss_stones);
  for (const auto& item_id : choice.reward_items) {
    if (content_.find_item(item_id)) add_item(content_, state_, item_id);
  }

  push_event(choice.karma_change >= 0 ? LogKind::Success : LogKind::Warning, ev->title + ": " + choice.text);
  check_path_unlocks();
  check_devil_mark();

  state_.pending_event_id.clear();
  return true;
}

} // namespace granddao
