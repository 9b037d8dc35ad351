#include "granddao/core/session.h"

#include <utility>

#include "granddao/util/log.h"

namespace granddao {

Session::Session(Simulation sim, SaveStore* store, SessionConfig cfg)
    : sim_(std::move(sim)), store_(store), cfg_(std::move(cfg)) {}

std::optional<OfflineReport> Session::start(std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_) {
    log::warn("Session::start called twice; ignoring");
    return std::nullopt;
  }

  const OfflineReport rep = sim_.catch_up(now_ms);
  if (rep.applied) {
    log::info("Offline catch-up applied " + std::to_string(rep.elapsed_seconds) + "s");
  }

  started_ = true;
  stopped_ = false;
  next_tick_ms_ = now_ms + 1000;
  autosave_.reset();
  return rep;
}

PumpResult Session::pump(std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  PumpResult res;
  if (!started_ || stopped_) return res;

  while (next_tick_ms_ <= now_ms) {
    if (res.ticks >= cfg_.max_ticks_per_pump) {
      log::debug("Session fell behind; dropping " + std::to_string((now_ms - next_tick_ms_) / 1000 + 1) + " tick(s)");
      next_tick_ms_ = now_ms + 1000;
      break;
    }
    sim_.tick(click_pending_);
    click_pending_ = false;
    next_tick_ms_ += 1000;
    res.ticks += 1;
  }

  if (const Tribulation* t = sim_.tribulation()) {
    // Strike deadlines were set from the simulation clock; poll on the same one.
    const TribulationUpdate u = sim_.poll_tribulation(t->generation(), sim_.now_ms());
    if (u.finished) {
      res.tribulation_finished = u.status;
      res.reborn = route_tribulation(u, now_ms);
    }
  }

  if (store_ && sim_.state().phase == GamePhase::Playing && sim_.state().auto_save_enabled) {
    res.autosaved = autosave_.maybe_autosave(now_ms, cfg_.autosave, [&]() { return save_locked(now_ms); });
  }
  return res;
}

void Session::stop() {
  std::lock_guard<std::mutex> lock(mu_);
  stopped_ = true;
}

bool Session::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return started_ && !stopped_;
}

void Session::click() {
  std::lock_guard<std::mutex> lock(mu_);
  click_pending_ = true;
}

BreakthroughResult Session::attempt_breakthrough() {
  std::lock_guard<std::mutex> lock(mu_);

  if (sim_.tribulation()) {
    BreakthroughResult r;
    r.message = "A tribulation is already underway.";
    return r;
  }
  if (sim_.tribulation_required()) {
    BreakthroughResult r;
    if (sim_.start_tribulation()) {
      r.outcome = BreakthroughOutcome::TribulationStarted;
      r.message = "The heavens answer with a tribulation.";
    }
    return r;
  }

  // Pills are only spent on an attempt that will actually roll.
  const double pill_bonus = sim_.breakthrough_ready() ? sim_.consume_breakthrough_pills() : 0.0;
  BreakthroughResult r = sim_.attempt_breakthrough(pill_bonus);
  if (r.outcome == BreakthroughOutcome::Death) {
    sim_.rebirth();
    save_locked(sim_.now_ms());
  }
  return r;
}

TribulationUpdate Session::resist_strike() {
  std::lock_guard<std::mutex> lock(mu_);
  const TribulationUpdate u = sim_.resist_strike();
  route_tribulation(u, sim_.now_ms());
  return u;
}

TribulationUpdate Session::fail_strike() {
  std::lock_guard<std::mutex> lock(mu_);
  const TribulationUpdate u = sim_.fail_strike();
  route_tribulation(u, sim_.now_ms());
  return u;
}

void Session::abandon_tribulation() {
  std::lock_guard<std::mutex> lock(mu_);
  sim_.abandon_tribulation();
}

bool Session::save_now(std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  return save_locked(now_ms);
}

GameState Session::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_.state();
}

bool Session::save_locked(std::int64_t now_ms) {
  if (!store_) return false;
  sim_.state().last_save_timestamp_ms = now_ms;
  std::string err;
  if (!store_->save(sim_.state(), &err)) {
    log::error("Autosave failed: " + err);
    return false;
  }
  return true;
}

bool Session::route_tribulation(const TribulationUpdate& u, std::int64_t now_ms) {
  if (!u.finished || u.status != TribulationStatus::Failed) return false;
  sim_.rebirth();
  save_locked(now_ms);
  return true;
}

} // namespace granddao
