#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "granddao/core/config.h"
#include "granddao/util/file_io.h"
#include "granddao/util/json.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool throws_with(const std::string& text, const std::string& needle) {
  granddao::SimConfig cfg;
  try {
    granddao::apply_sim_config_json(granddao::json::parse(text), &cfg);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

} // namespace

int test_config() {
  using namespace granddao;

  // Only the keys present are overridden.
  {
    SimConfig cfg;
    apply_sim_config_json(json::parse(R"({
      "base_xp_per_second": 2.5,
      "max_log_entries": 10,
      "offline_cap_seconds": 3600,
      "rng_seed": 42,
      "something_new": [1, 2, 3],
      "tribulation": {"tier1_strikes": 2, "damage_fraction": 0.5}
    })"),
                          &cfg);
    GD_ASSERT(cfg.base_xp_per_second == 2.5);
    GD_ASSERT(cfg.max_log_entries == 10);
    GD_ASSERT(cfg.offline_cap_seconds == 3600);
    GD_ASSERT(cfg.rng_seed == 42u);
    GD_ASSERT(cfg.tribulation.tier1_strikes == 2);
    GD_ASSERT(cfg.tribulation.damage_fraction == 0.5);

    const SimConfig defaults;
    GD_ASSERT(cfg.click_boost_multiplier == defaults.click_boost_multiplier);
    GD_ASSERT(cfg.offline_min_seconds == defaults.offline_min_seconds);
    GD_ASSERT(cfg.tribulation.tier2_strikes == defaults.tribulation.tier2_strikes);
    GD_ASSERT(cfg.tribulation.tier1_window_ms == defaults.tribulation.tier1_window_ms);
  }

  // Wrong types are reported, not ignored.
  GD_ASSERT(throws_with(R"({"max_log_entries": "fifty"})", "'max_log_entries' must be a number"));
  GD_ASSERT(throws_with(R"({"tribulation": 3})", "'tribulation' must be an object"));
  GD_ASSERT(throws_with(R"({"tribulation": {"strike_gap_ms": true}})", "strike_gap_ms"));
  GD_ASSERT(throws_with(R"({"rng_seed": -1})", "non-negative"));
  GD_ASSERT(throws_with("[]", "object"));
  GD_ASSERT(throws_with(R"({"max_log_entries": 1e12})", "out of range"));
  GD_ASSERT(throws_with(R"({"boost_base_cost": 1e30})", "out of range"));
  GD_ASSERT(throws_with(R"({"offline_cap_seconds": 2.5})", "must be an integer"));

  // Autosave section.
  {
    AutosaveConfig a;
    apply_autosave_config_json(json::parse(R"({"autosave": {"enabled": false, "interval_seconds": 5}})"), &a);
    GD_ASSERT(!a.enabled);
    GD_ASSERT(a.interval_seconds == 5);

    AutosaveConfig untouched;
    apply_autosave_config_json(json::parse(R"({"base_xp_per_second": 1})"), &untouched);
    GD_ASSERT(untouched.enabled);
    GD_ASSERT(untouched.interval_seconds == 30);
  }

  // The shipped config restates the defaults.
  {
    AutosaveConfig a;
    const SimConfig cfg = load_sim_config_from_file("data/config/default_sim.json", &a);
    const SimConfig defaults;
    GD_ASSERT(cfg.offline_cap_seconds == defaults.offline_cap_seconds);
    GD_ASSERT(cfg.tribulation.strike_gap_ms == defaults.tribulation.strike_gap_ms);
    GD_ASSERT(cfg.tribulation.damage_fraction == defaults.tribulation.damage_fraction);
    GD_ASSERT(a.enabled);
    GD_ASSERT(a.interval_seconds == 30);
  }

  // From a file.
  {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) dir = fs::path(".");
    const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
    dir = dir / "granddao_test_config" / std::to_string(static_cast<long long>(nonce));
    const std::string path = (dir / "sim.json").string();

    write_text_file(path, R"({"qi_deviation_seconds": 60, "autosave": {"interval_seconds": 120}})");
    AutosaveConfig a;
    const SimConfig cfg = load_sim_config_from_file(path, &a);
    GD_ASSERT(cfg.qi_deviation_seconds == 60);
    GD_ASSERT(a.interval_seconds == 120);

    write_text_file(path, "\"just a string\"");
    bool threw = false;
    try {
      (void)load_sim_config_from_file(path);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    GD_ASSERT(threw);

    threw = false;
    try {
      (void)load_sim_config_from_file((dir / "missing.json").string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    GD_ASSERT(threw);

    fs::remove_all(dir, ec);
  }

  return 0;
}
