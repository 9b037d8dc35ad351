#include "granddao/core/simulation.h"

#include <algorithm>

#include "granddao/core/character.h"

namespace granddao {

bool Simulation::can_join_group(const std::string& group_id) const {
  if (!playing() || !state_.group_id.empty() || state_.character.rogue_status) return false;
  const GroupDef* g = content_.find_group(group_id);
  if (!g) return false;

  const int karma = state_.character.karma;
  if (karma < g->karma_min || karma > g->karma_max) return false;

  const BackgroundDef* bg = character_background(content_, state_.character);
  const bool sect_access = bg && bg->effect.sect_access;
  return sect_access || is_discovered(state_, g->location);
}

std::vector<std::string> Simulation::available_groups() const {
  std::vector<std::string> out;
  for (const auto& g : content_.groups) {
    if (can_join_group(g.id)) out.push_back(g.id);
  }
  return out;
}

bool Simulation::join_group(const std::string& group_id) {
  if (!can_join_group(group_id)) return false;
  state_.group_id = group_id;
  state_.group_contribution = 0;
  push_event(LogKind::Success, "Joined " + content_.find_group(group_id)->name + "!");
  return true;
}

bool Simulation::leave_group() {
  if (!playing() || state_.group_id.empty()) return false;
  const GroupDef* g = content_.find_group(state_.group_id);
  push_event(LogKind::Warning, "Left " + (g ? g->name : state_.group_id));
  state_.group_id.clear();
  return true;
}

bool Simulation::complete_mission(const std::string& mission_id, bool help) {
  if (!playing() || state_.group_id.empty()) return false;
  const GroupDef* g = content_.find_group(state_.group_id);
  if (!g) return false;

  const auto it = std::find_if(g->missions.begin(), g->missions.end(),
                               [&](const MissionDef& m) { return m.id == mission_id; });
  if (it == g->missions.end()) return false;
  if (std::find(state_.completed_missions.begin(), state_.completed_missions.end(), mission_id) !=
      state_.completed_missions.end()) {
    return false;
  }

  const MissionOption& opt = help ? it->help : it->exploit;
  state_.spirit_stones += opt.reward;
  state_.character.karma = std::clamp(state_.character.karma + opt.karma_change, kKarmaMin, kKarmaMax);
  state_.group_contribution += static_cast<int>(opt.reward);
  state_.completed_missions.push_back(mission_id);

  push_event(opt.karma_change >= 0 ? LogKind::Success : LogKind::Warning,
             "Mission complete: " + it->name + " - +" + std::to_string(opt.reward) + " SS, " +
                 (opt.karma_change > 0 ? "+" : "") + std::to_string(opt.karma_change) + " Karma");
  check_path_unlocks();
  check_devil_mark();
  return true;
}

} // namespace granddao
