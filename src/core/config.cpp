#include "granddao/core/config.h"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "granddao/util/file_io.h"

namespace granddao {
namespace {

const json::Value* typed(const json::Object& o, const std::string& key, bool (json::Value::*is)() const,
                         const char* type_name) {
  const json::Value* v = json::find(o, key);
  if (!v) return nullptr;
  if (!(v->*is)()) throw std::runtime_error("config: '" + key + "' must be " + type_name);
  return v;
}

void read(const json::Object& o, const std::string& key, double* out) {
  if (const auto* v = typed(o, key, &json::Value::is_number, "a number")) *out = v->number_value();
}

// Whole number in [lo, hi], checked before any narrowing conversion.
double read_integral(const json::Value& v, const std::string& key, double lo, double hi) {
  const double d = v.number_value();
  if (d != std::floor(d)) throw std::runtime_error("config: '" + key + "' must be an integer");
  if (d < lo || d > hi) throw std::runtime_error("config: '" + key + "' is out of range");
  return d;
}

void read(const json::Object& o, const std::string& key, int* out) {
  if (const auto* v = typed(o, key, &json::Value::is_number, "a number")) {
    *out = static_cast<int>(read_integral(*v, key, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
  }
}

void read(const json::Object& o, const std::string& key, std::int64_t* out) {
  if (const auto* v = typed(o, key, &json::Value::is_number, "a number")) {
    // 2^63 itself is out of range; the largest double below it is fine.
    *out = static_cast<std::int64_t>(read_integral(*v, key, -9223372036854775808.0, 9223372036854774784.0));
  }
}

void read(const json::Object& o, const std::string& key, std::uint64_t* out) {
  if (const auto* v = typed(o, key, &json::Value::is_number, "a number")) {
    if (v->number_value() < 0.0) throw std::runtime_error("config: '" + key + "' must be non-negative");
    *out = static_cast<std::uint64_t>(read_integral(*v, key, 0.0, 18446744073709549568.0));
  }
}

void read(const json::Object& o, const std::string& key, bool* out) {
  if (const auto* v = typed(o, key, &json::Value::is_bool, "a boolean")) *out = v->bool_value();
}

void apply_tribulation(const json::Object& o, TribulationRules* t) {
  read(o, "tier1_strikes", &t->tier1_strikes);
  read(o, "tier2_strikes", &t->tier2_strikes);
  read(o, "devil_strike_multiplier", &t->devil_strike_multiplier);
  read(o, "tier1_window_ms", &t->tier1_window_ms);
  read(o, "tier2_window_ms", &t->tier2_window_ms);
  read(o, "first_strike_delay_ms", &t->first_strike_delay_ms);
  read(o, "strike_gap_ms", &t->strike_gap_ms);
  read(o, "damage_fraction", &t->damage_fraction);
}

} // namespace

void apply_sim_config_json(const json::Value& root, SimConfig* cfg) {
  if (!cfg) return;
  const json::Object& o = root.object();

  read(o, "base_xp_per_second", &cfg->base_xp_per_second);
  read(o, "click_boost_multiplier", &cfg->click_boost_multiplier);
  read(o, "event_check_interval_ticks", &cfg->event_check_interval_ticks);
  read(o, "fated_encounter_base_chance", &cfg->fated_encounter_base_chance);

  read(o, "stone_trickle_chance", &cfg->stone_trickle_chance);
  read(o, "stone_trickle_log_chance", &cfg->stone_trickle_log_chance);
  read(o, "loot_base_chance", &cfg->loot_base_chance);
  read(o, "loot_luck_chance", &cfg->loot_luck_chance);
  read(o, "rogue_loot_bonus", &cfg->rogue_loot_bonus);
  read(o, "beast_tamer_chance_per_luck", &cfg->beast_tamer_chance_per_luck);
  read(o, "dream_unlock_chance", &cfg->dream_unlock_chance);

  read(o, "max_log_entries", &cfg->max_log_entries);
  read(o, "offline_cap_seconds", &cfg->offline_cap_seconds);
  read(o, "offline_min_seconds", &cfg->offline_min_seconds);
  read(o, "offline_seconds_per_stone", &cfg->offline_seconds_per_stone);
  read(o, "qi_deviation_seconds", &cfg->qi_deviation_seconds);

  read(o, "boost_base_cost", &cfg->boost_base_cost);
  read(o, "boost_cost_step", &cfg->boost_cost_step);
  read(o, "boost_multiplier", &cfg->boost_multiplier);
  read(o, "boost_duration_seconds", &cfg->boost_duration_seconds);

  read(o, "legacy_per_level", &cfg->legacy_per_level);
  read(o, "travel_base_seconds", &cfg->travel_base_seconds);
  read(o, "travel_seconds_per_danger", &cfg->travel_seconds_per_danger);
  read(o, "max_breakthrough_chance", &cfg->max_breakthrough_chance);
  read(o, "luck_breakthrough_factor", &cfg->luck_breakthrough_factor);
  read(o, "rng_seed", &cfg->rng_seed);

  if (const auto* t = typed(o, "tribulation", &json::Value::is_object, "an object")) {
    apply_tribulation(t->object(), &cfg->tribulation);
  }
}

void apply_autosave_config_json(const json::Value& root, AutosaveConfig* cfg) {
  if (!cfg) return;
  const auto* a = typed(root.object(), "autosave", &json::Value::is_object, "an object");
  if (!a) return;
  read(a->object(), "enabled", &cfg->enabled);
  read(a->object(), "interval_seconds", &cfg->interval_seconds);
}

SimConfig load_sim_config_from_file(const std::string& path, AutosaveConfig* autosave) {
  const json::Value root = json::parse(read_text_file(path));
  if (!root.is_object()) throw std::runtime_error("config: top-level value must be an object: " + path);

  SimConfig cfg;
  apply_sim_config_json(root, &cfg);
  apply_autosave_config_json(root, autosave);
  return cfg;
}

} // namespace granddao
