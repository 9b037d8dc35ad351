#pragma once

#include <cstdint>
#include <functional>

namespace granddao {

struct AutosaveConfig {
  bool enabled{true};

  // Minimum wall-clock time between autosaves. Values <= 0 disable autosaving.
  int interval_seconds{30};
};

// Tracks time since the last autosave and invokes a save callback once the
// interval has elapsed.
class AutosaveManager {
 public:
  AutosaveManager() = default;

  // Forget the baseline; the next maybe_autosave() call re-establishes it.
  void reset() { last_ms_ = -1; }

  // The first call only records a baseline (no save right after start/load).
  // Returns true when `save` ran and reported success.
  bool maybe_autosave(std::int64_t now_ms, const AutosaveConfig& cfg, const std::function<bool()>& save);

  std::int64_t last_autosave_ms() const { return last_ms_; }

 private:
  std::int64_t last_ms_{-1};
};

} // namespace granddao
