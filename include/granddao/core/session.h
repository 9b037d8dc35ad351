#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

#include "granddao/core/save_store.h"
#include "granddao/core/simulation.h"
#include "granddao/util/autosave.h"

namespace granddao {

struct SessionConfig {
  AutosaveConfig autosave;

  // Upper bound on ticks run by a single pump(). A host that stalls for
  // longer than this drops the excess instead of spiralling.
  int max_ticks_per_pump{600};
};

struct PumpResult {
  int ticks{0};
  // Set when a tribulation ended in this pump.
  std::optional<TribulationStatus> tribulation_finished;
  bool reborn{false};
  bool autosaved{false};
};

// Thread-safe owner of a running game.
//
// The host calls pump(now_ms) from its own loop. Each pump runs the 1 Hz
// ticks that came due by now_ms, advances the tribulation strike timers and
// maybe autosaves. Strike timing always reads the simulation's clock (the
// same one resist_strike()/fail_strike() use), whatever now_ms is. There are no timer threads, so destroying a Session leaves
// nothing scheduled. Every entry point takes the same mutex, which serializes
// player commands with ticks.
class Session {
 public:
  // `store` may be null (no persistence). It must outlive the Session.
  explicit Session(Simulation sim, SaveStore* store = nullptr, SessionConfig cfg = {});

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Runs offline catch-up once and enables ticking. Returns nullopt if the
  // session was already started.
  std::optional<OfflineReport> start(std::int64_t now_ms);

  PumpResult pump(std::int64_t now_ms);

  // Halts ticking; later pumps do nothing.
  void stop();

  bool running() const;

  // The next tick runs click-boosted.
  void click();

  // Consumes breakthrough pills and attempts a breakthrough. A ready path at
  // a tier boundary starts the tribulation instead (TribulationStarted).
  // A fatal outcome triggers rebirth before returning.
  BreakthroughResult attempt_breakthrough();

  TribulationUpdate resist_strike();
  TribulationUpdate fail_strike();
  void abandon_tribulation();

  // Writes the save now (no-op without a store).
  bool save_now(std::int64_t now_ms);

  // Runs fn(Simulation&) under the session lock.
  template <typename Fn>
  auto with_simulation(Fn&& fn) -> decltype(std::forward<Fn>(fn)(std::declval<Simulation&>())) {
    std::lock_guard<std::mutex> lock(mu_);
    return std::forward<Fn>(fn)(sim_);
  }

  GameState snapshot() const;

 private:
  bool save_locked(std::int64_t now_ms);
  // Applies rebirth when a tribulation update reports a failure.
  bool route_tribulation(const TribulationUpdate& u, std::int64_t now_ms);

  mutable std::mutex mu_;
  Simulation sim_;
  SaveStore* store_{nullptr};
  SessionConfig cfg_;
  AutosaveManager autosave_;

  bool started_{false};
  bool stopped_{false};
  bool click_pending_{false};
  std::int64_t next_tick_ms_{0};
};

} // namespace granddao
