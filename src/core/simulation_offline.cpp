#include "granddao/core/simulation.h"

#include <algorithm>

#include "granddao/util/strings.h"

namespace granddao {

OfflineReport Simulation::catch_up(std::int64_t now_ms) {
  OfflineReport rep;
  if (!playing()) return rep;

  const std::int64_t delta_ms = now_ms - state_.last_save_timestamp_ms;
  const std::int64_t elapsed = std::min<std::int64_t>(delta_ms / 1000, cfg_.offline_cap_seconds);
  if (elapsed < cfg_.offline_min_seconds) return rep;

  rep.applied = true;
  rep.elapsed_seconds = elapsed;

  // Travel seconds are spent on the road, as in the live tick (the arrival
  // second included). Only the time after arrival counts as active.
  std::int64_t active = elapsed;
  if (state_.travel.traveling) {
    const std::int64_t on_road = std::min<std::int64_t>(elapsed, std::max(0, state_.travel.remaining_seconds));
    active = elapsed - on_road;
    state_.travel.remaining_seconds -= static_cast<int>(on_road);
    if (state_.travel.remaining_seconds <= 0) {
      arrive_at_destination();
      rep.arrived = true;
    }
  }

  if (active > 0) {
    // Same gate as the live tick, but buffs and click boost are ignored.
    if (PathProgress* pp = accruing_progress()) {
      const double before = pp->xp;
      add_xp(*pp, xp_per_second(pp->path_id, /*with_buffs=*/false) * static_cast<double>(active));
      rep.xp_gained = pp->xp - before;
    }

    if (state_.qi_deviation.active) {
      state_.qi_deviation.remaining_seconds =
          static_cast<int>(std::max<std::int64_t>(0, state_.qi_deviation.remaining_seconds - active));
      if (state_.qi_deviation.remaining_seconds <= 0) state_.qi_deviation = QiDeviation{};
    }

    auto& buffs = state_.buffs;
    for (auto& b : buffs) {
      b.remaining_seconds = static_cast<int>(std::max<std::int64_t>(0, b.remaining_seconds - active));
    }
    buffs.erase(
        std::remove_if(buffs.begin(), buffs.end(), [](const ActiveBuff& b) { return b.remaining_seconds <= 0; }),
        buffs.end());
  }

  if (cfg_.offline_seconds_per_stone > 0) {
    rep.stones_gained = elapsed / cfg_.offline_seconds_per_stone;
    state_.spirit_stones += rep.stones_gained;
  }

  state_.last_save_timestamp_ms = now_ms;
  state_.total_play_time += elapsed;

  std::string summary = "Offline progress: " + format_duration(elapsed);
  if (rep.xp_gained > 0.0) summary += " - gained " + format_fixed(rep.xp_gained, 0) + " XP";
  if (rep.stones_gained > 0) summary += ", found " + std::to_string(rep.stones_gained) + " Spirit Stones";
  push_event(LogKind::System, summary);
  return rep;
}

} // namespace granddao
