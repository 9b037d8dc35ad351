#include "granddao/core/simulation.h"

#include <algorithm>

#include "granddao/core/progression.h"

namespace granddao {

void Simulation::tick(bool click_boosted) {
  if (!playing()) return;

  state_.tick_count += 1;
  state_.total_play_time += 1;

  // While on the road nothing else happens.
  if (tick_travel()) return;

  tick_buffs();
  tick_qi_deviation();
  tick_xp(click_boosted);
  if (state_.current_action == ActionType::Explore) tick_exploration();
  tick_karma_visibility();
  tick_highest_level();
  tick_special_unlocks();
}

void Simulation::advance_seconds(int seconds) {
  for (int i = 0; i < seconds; ++i) tick(false);
}

bool Simulation::tick_travel() {
  if (!state_.travel.traveling) return false;
  state_.travel.remaining_seconds -= 1;
  if (state_.travel.remaining_seconds <= 0) arrive_at_destination();
  return true;
}

void Simulation::arrive_at_destination() {
  state_.travel.traveling = false;
  state_.travel.remaining_seconds = 0;

  if (!state_.travel.destination_id.empty()) {
    state_.location_id = state_.travel.destination_id;
    discover_region(state_, state_.location_id);
    if (const RegionDef* region = content_.find_region(state_.location_id)) {
      push_event(LogKind::Success, "Arrived at " + region->name);
      for (const auto& c : region->connections) discover_region(state_, c);
    }
  }
  state_.travel.destination_id.clear();
}

void Simulation::tick_buffs() {
  auto& buffs = state_.buffs;
  for (auto& b : buffs) b.remaining_seconds -= 1;

  std::vector<std::string> expired;
  for (const auto& b : buffs) {
    if (b.remaining_seconds <= 0) expired.push_back(b.name);
  }
  buffs.erase(std::remove_if(buffs.begin(), buffs.end(), [](const ActiveBuff& b) { return b.remaining_seconds <= 0; }),
              buffs.end());
  for (auto& name : expired) push_event(LogKind::Info, name + " has expired.");
}

void Simulation::tick_qi_deviation() {
  if (!state_.qi_deviation.active) return;
  state_.qi_deviation.remaining_seconds -= 1;
  if (state_.qi_deviation.remaining_seconds <= 0) {
    state_.qi_deviation = QiDeviation{};
    push_event(LogKind::Success, "Qi Deviation has cleared. Your mind is calm again.");
  }
}

void Simulation::tick_xp(bool click_boosted) {
  PathProgress* pp = accruing_progress();
  if (!pp) return;

  double gain = xp_per_second(pp->path_id, /*with_buffs=*/true);
  if (click_boosted) gain *= cfg_.click_boost_multiplier;

  if (add_xp(*pp, gain)) {
    std::string level_name = "Level " + std::to_string(pp->level);
    if (const PathDef* path = content_.find_path(pp->path_id)) {
      if (const PathLevelDef* lvl = path_level(*path, pp->level)) level_name = lvl->name;
    }
    push_event(LogKind::Warning, level_name + " XP maxed! Attempt Breakthrough!");
  }
}

void Simulation::tick_karma_visibility() {
  if (state_.karma_visible) return;
  for (const auto& [_, pp] : state_.path_progress) {
    if (pp.unlocked && pp.level >= 5) {
      state_.karma_visible = true;
      push_event(LogKind::Legendary, "Your karma becomes visible to your inner eye...");
      return;
    }
  }
}

void Simulation::tick_highest_level() {
  for (const auto& [_, pp] : state_.path_progress) {
    if (pp.unlocked) state_.highest_path_level = std::max(state_.highest_path_level, pp.level);
  }
}

void Simulation::tick_special_unlocks() {
  const auto is_unlocked = [&](const char* id) {
    const PathProgress* pp = find_ptr(state_.path_progress, std::string(id));
    return pp && pp->unlocked;
  };

  if (state_.current_action == ActionType::Explore && !is_unlocked("beast_tamer") &&
      state_.location_id == "spirit_beast_territory") {
    if (rate_chance(*rng_, cfg_.beast_tamer_chance_per_luck * state_.character.luck)) {
      unlock_path("beast_tamer", LogKind::Legendary, "A spirit beast approaches! The Resonance Path is unlocked!");
    }
  }

  if (state_.current_action == ActionType::Cultivate && !is_unlocked("dream")) {
    if (rate_chance(*rng_, cfg_.dream_unlock_chance)) {
      unlock_path("dream", LogKind::Legendary, "A lucid dream overtakes you... The Illusion Path is unlocked!");
    }
  }

  if (state_.character.rogue_status && !is_unlocked("rogue")) {
    unlock_path("rogue", LogKind::Legendary, "The Wild Path opens before you!");
  }

  if (state_.character.karma <= -100) {
    unlock_path("devil_soul", LogKind::Danger, "Soul Corruption path unlocked! You are marked as a Devil Cultivator!");
    unlock_path("devil_body", LogKind::Danger, "Body Corruption path unlocked!");
    state_.character.devil_mark = true;
  }

  check_path_unlocks();
}

} // namespace granddao
