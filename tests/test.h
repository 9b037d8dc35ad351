#pragma once

// Shared helpers for the test runner.
//
// Individual tests use their own local GD_ASSERT macro. This header only
// carries fixtures that several tests need.

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <utility>

#include "granddao/core/content.h"
#include "granddao/core/random.h"
#include "granddao/core/simulation.h"
#include "granddao/util/time.h"

namespace granddao::test {

// Random source that replays a fixed list of draws, then repeats `fallback`.
//
// The default fallback (0.99) fails every rate roll the simulation makes, so
// a test only scripts the draws it cares about.
class ScriptedRandom final : public RandomSource {
 public:
  explicit ScriptedRandom(std::deque<double> values = {}, double fallback = 0.99)
      : values_(std::move(values)), fallback_(fallback) {}

  double next_u01() override {
    draws_ += 1;
    if (values_.empty()) return fallback_;
    const double v = values_.front();
    values_.pop_front();
    return v;
  }

  void push(double v) { values_.push_back(v); }
  std::size_t remaining() const { return values_.size(); }
  int draws() const { return draws_; }

 private:
  std::deque<double> values_;
  double fallback_{0.99};
  int draws_{0};
};

// The shipped content tables (data/content/cultivation.json).
inline const ContentDB& shipped_content() {
  static const ContentDB db = load_content_db_from_file("data/content/cultivation.json");
  return db;
}

// A simulation in the playing phase with a fixed, known character:
// earth root (qi 1.0), vajra body (body 1.2), village orphan, luck 0.5.
//
// The returned ScriptedRandom pointer stays owned by the simulation.
struct Fixture {
  ManualClock clock{1'000'000};
  std::unique_ptr<Simulation> sim;
  ScriptedRandom* rng{nullptr};

  Fixture(const Fixture&) = delete;
  Fixture& operator=(const Fixture&) = delete;

  explicit Fixture(SimConfig cfg = {}) {
    sim = std::make_unique<Simulation>(shipped_content(), cfg);
    sim->set_clock(&clock);
    auto r = std::make_unique<ScriptedRandom>();
    rng = r.get();
    sim->set_random_source(std::move(r));

    sim->new_game("Tester");
    auto& c = sim->state().character;
    c.spirit_root_id = "earth_root";
    c.body_type_id = "vajra_body";
    c.background_id = "village_orphan";
    c.luck = 0.5;
    auto& st = sim->state();
    st.location_id = "peaceful_village";
    st.spirit_stones = 0;
    st.inventory.clear();
    st.equipped_scripture.clear();
    st.path_progress.erase("spirit");
    st.discovered_regions = {"peaceful_village", "forest_path", "river_delta"};
  }

  Simulation& s() { return *sim; }
  GameState& st() { return sim->state(); }

  // Replaces the scripted draws (fallback resets to 0.99).
  void script(std::deque<double> values, double fallback = 0.99) {
    auto r = std::make_unique<ScriptedRandom>(std::move(values), fallback);
    rng = r.get();
    sim->set_random_source(std::move(r));
  }

  // Makes the active path ready for a breakthrough at `level`.
  PathProgress& ready_at(const std::string& path_id, int level);
};

PathProgress& ready_path(GameState& st, const std::string& path_id, int level);

inline PathProgress& Fixture::ready_at(const std::string& path_id, int level) {
  return ready_path(st(), path_id, level);
}

} // namespace granddao::test
