#include "granddao/util/autosave.h"

namespace granddao {

bool AutosaveManager::maybe_autosave(std::int64_t now_ms, const AutosaveConfig& cfg,
                                     const std::function<bool()>& save) {
  if (!cfg.enabled || cfg.interval_seconds <= 0 || !save) return false;

  if (last_ms_ < 0 || now_ms < last_ms_) {
    // Establish (or, if the clock moved backwards, re-establish) the baseline.
    last_ms_ = now_ms;
    return false;
  }

  if (now_ms - last_ms_ < static_cast<std::int64_t>(cfg.interval_seconds) * 1000) return false;

  // Failed saves still move the baseline so a broken disk is not retried every tick.
  last_ms_ = now_ms;
  return save();
}

} // namespace granddao
