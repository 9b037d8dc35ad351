#include "granddao/core/simulation.h"

#include <algorithm>
#include <string>
#include <vector>

#include "granddao/core/inventory.h"
#include "granddao/core/progression.h"

namespace granddao {

double Simulation::breakthrough_chance(double pill_bonus) const {
  const PathProgress* pp = active_progress();
  if (!pp) return 0.0;
  const double chance = breakthrough_base_rate(pp->level) + std::max(0.0, pill_bonus) +
                        state_.character.luck * cfg_.luck_breakthrough_factor;
  return std::clamp(chance, 0.0, cfg_.max_breakthrough_chance);
}

bool Simulation::breakthrough_ready() const {
  const PathProgress* pp = active_progress();
  return playing() && pp && pp->unlocked && pp->breakthrough_available && pp->level < kMaxPathLevel;
}

bool Simulation::tribulation_required() const {
  const PathProgress* pp = active_progress();
  return pp && pp->unlocked && pp->breakthrough_available && is_tier_transition_level(pp->level);
}

double Simulation::consume_breakthrough_pills() {
  double bonus = 0.0;
  std::vector<std::string> pills;
  for (const auto& e : state_.inventory) {
    const ItemDef* def = content_.find_item(e.item_id);
    if (!def || def->category != ItemCategory::Pill || def->effects.breakthrough_bonus <= 0.0) continue;
    bonus += def->effects.breakthrough_bonus * e.quantity;
    pills.push_back(e.item_id);
  }
  for (const auto& id : pills) remove_item(state_, id, item_quantity(state_, id));
  return bonus;
}

void Simulation::apply_breakthrough_success(PathProgress& pp) {
  pp.level = std::min(kMaxPathLevel, pp.level + 1);
  pp.xp = 0.0;
  pp.xp_required = xp_required_for_level(pp.level);
  pp.breakthrough_available = false;
  state_.highest_path_level = std::max(state_.highest_path_level, pp.level);

  const PathDef* path = content_.find_path(pp.path_id);
  std::string level_name = "Level " + std::to_string(pp.level);
  if (path) {
    if (const PathLevelDef* lvl = path_level(*path, pp.level)) level_name = lvl->name;
  }
  push_event(LogKind::Legendary, "BREAKTHROUGH SUCCESS! Advanced to " + level_name + "!");
  if (pp.level >= kMaxPathLevel && path) {
    push_event(LogKind::Legendary, "You have reached the pinnacle of " + path->name + "! You are a true immortal!");
  }
}

BreakthroughResult Simulation::attempt_breakthrough(double pill_bonus) {
  BreakthroughResult r;
  PathProgress* pp = active_progress();
  if (!breakthrough_ready()) {
    r.message = "Not ready for breakthrough.";
    return r;
  }
  if (tribulation_required()) {
    r.message = "This breakthrough must pass a Heavenly Tribulation.";
    return r;
  }

  r.chance = breakthrough_chance(pill_bonus);
  if (rng_->next_u01() < r.chance) {
    apply_breakthrough_success(*pp);
    r.outcome = BreakthroughOutcome::Success;
    r.success = true;
    r.message = "Advanced to level " + std::to_string(pp->level) + "!";
    return r;
  }

  const double f = rng_->next_u01();
  if (f < 0.05) {
    push_event(LogKind::Danger, "CATASTROPHIC FAILURE! Your body shatters... Death claims you.");
    r.outcome = BreakthroughOutcome::Death;
    r.message = "Your cultivation backfired fatally. Death claims you.";
  } else if (f < 0.15) {
    pp->level = std::max(1, pp->level - 1);
    pp->xp_required = xp_required_for_level(pp->level);
    pp->xp = pp->xp_required * 0.5;
    pp->breakthrough_available = false;
    push_event(LogKind::Danger, "CRIPPLING INJURY! Dropped back to Level " + std::to_string(pp->level) + "!");
    r.outcome = BreakthroughOutcome::CripplingInjury;
    r.message = "A crippling injury sends you back a level!";
  } else if (f < 0.50) {
    pp->xp = 0.0;
    pp->breakthrough_available = false;
    state_.qi_deviation.active = true;
    state_.qi_deviation.remaining_seconds = cfg_.qi_deviation_seconds;
    push_event(LogKind::Danger, "QI DEVIATION! All progress lost and speed halved for " +
                                    format_duration(cfg_.qi_deviation_seconds) + "!");
    r.outcome = BreakthroughOutcome::QiDeviation;
    r.message = "Qi Deviation! All XP lost and speed halved.";
  } else {
    pp->xp = pp->xp_required * 0.7;
    pp->breakthrough_available = false;
    push_event(LogKind::Warning, "Minor Setback - lost 30% XP progress.");
    r.outcome = BreakthroughOutcome::MinorSetback;
    r.message = "Minor setback. Lost 30% of your XP progress.";
  }
  return r;
}

// --- Tribulation ---

bool Simulation::start_tribulation() {
  if (!playing() || tribulation_) return false;
  if (!tribulation_required()) return false;

  const PathProgress* pp = active_progress();
  tribulation_ = Tribulation::begin(content_, state_, *pp, cfg_.tribulation, now_ms(), next_tribulation_generation_);
  next_tribulation_generation_ += 1;
  push_event(LogKind::Danger, "HEAVENLY TRIBULATION BEGINS! " + std::to_string(tribulation_->strikes()) +
                                  " strikes will fall.");
  return true;
}

namespace {

TribulationUpdate make_update(const Tribulation& t, bool accepted) {
  TribulationUpdate u;
  u.accepted = accepted;
  u.status = t.status();
  u.finished = t.finished();
  return u;
}

} // namespace

TribulationUpdate Simulation::poll_tribulation(std::uint64_t generation, std::int64_t now_ms) {
  if (!tribulation_ || tribulation_->generation() != generation) return TribulationUpdate{};

  const bool changed = tribulation_->poll(now_ms);
  TribulationUpdate u = make_update(*tribulation_, changed);
  if (!u.finished) return u;

  PathProgress* pp = find_ptr(state_.path_progress, tribulation_->path_id());
  if (u.status == TribulationStatus::Survived) {
    push_event(LogKind::Legendary, "Heavenly Tribulation SURVIVED!");
    if (pp && pp->breakthrough_available) apply_breakthrough_success(*pp);
  } else if (u.status == TribulationStatus::Failed) {
    push_event(LogKind::Danger, "TRIBULATION FAILED! Your body is destroyed...");
  }
  tribulation_.reset();
  return u;
}

TribulationUpdate Simulation::resist_strike() {
  if (!tribulation_) return TribulationUpdate{};
  const std::int64_t now = now_ms();
  // Expire a window that closed before this input arrived.
  tribulation_->poll(now);
  const bool accepted = !tribulation_->finished() && tribulation_->resist(now);
  TribulationUpdate u = poll_tribulation(tribulation_->generation(), now);
  u.accepted = accepted;
  return u;
}

TribulationUpdate Simulation::fail_strike() {
  if (!tribulation_) return TribulationUpdate{};
  const std::int64_t now = now_ms();
  tribulation_->poll(now);
  const bool accepted = !tribulation_->finished() && tribulation_->fail(now);
  TribulationUpdate u = poll_tribulation(tribulation_->generation(), now);
  u.accepted = accepted;
  return u;
}

void Simulation::abandon_tribulation() {
  if (!tribulation_) return;
  tribulation_->abandon();
  push_event(LogKind::Warning, "The tribulation clouds disperse.");
  tribulation_.reset();
}

} // namespace granddao
