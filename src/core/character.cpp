#include "granddao/core/character.h"

#include <algorithm>
#include <vector>

#include "granddao/core/inventory.h"
#include "granddao/core/progression.h"
#include "granddao/util/strings.h"

namespace granddao {

double character_qi_multiplier(const ContentDB& content, const Character& c) {
  const SpiritRootDef* r = content.find_spirit_root(c.spirit_root_id);
  return r ? r->qi_multiplier : 1.0;
}

double character_body_multiplier(const ContentDB& content, const Character& c) {
  const BodyTypeDef* b = content.find_body_type(c.body_type_id);
  return b ? b->body_multiplier : 1.0;
}

double character_qi_bonus(const ContentDB& content, const Character& c) {
  const BodyTypeDef* b = content.find_body_type(c.body_type_id);
  return b ? b->qi_bonus_multiplier : 0.0;
}

const BackgroundDef* character_background(const ContentDB& content, const Character& c) {
  return content.find_background(c.background_id);
}

Character roll_character(const ContentDB& content, RandomSource& rng, const std::string& name) {
  Character c;
  c.name = name;

  {
    std::vector<double> w;
    w.reserve(content.spirit_roots.size());
    for (const auto& r : content.spirit_roots) w.push_back(r.probability);
    const std::size_t idx = weighted_index(rng, w);
    if (idx < content.spirit_roots.size()) c.spirit_root_id = content.spirit_roots[idx].id;
  }
  {
    std::vector<double> w;
    w.reserve(content.body_types.size());
    for (const auto& b : content.body_types) w.push_back(b.probability);
    const std::size_t idx = weighted_index(rng, w);
    if (idx < content.body_types.size()) c.body_type_id = content.body_types[idx].id;
  }
  if (!content.backgrounds.empty()) {
    c.background_id = content.backgrounds[random_index(rng, content.backgrounds.size())].id;
  }

  c.luck = roll_luck(rng);
  if (const BackgroundDef* bg = content.find_background(c.background_id)) {
    if (bg->effect.hidden_luck > 0.0) c.luck = std::min(1.0, c.luck + bg->effect.hidden_luck);
  }
  return c;
}

GameState create_initial_state(const ContentDB& content, const Character& c, std::int64_t now_ms,
                               int max_log_entries) {
  GameState s;
  s.phase = GamePhase::Playing;
  s.character = c;
  s.current_action = ActionType::Idle;
  s.last_save_timestamp_ms = now_ms;

  s.path_progress["martial"] = make_path_progress("martial", true);
  s.active_path_id = "martial";

  const BackgroundDef* bg = content.find_background(c.background_id);
  if (bg) {
    s.location_id = bg->start_location;
    s.spirit_stones = std::max<std::int64_t>(0, bg->effect.spirit_stones);
    if (bg->effect.random_scripture) {
      add_item(content, s, "basic_scripture");
      s.path_progress["spirit"] = make_path_progress("spirit", true);
    }
  } else if (!content.regions.empty()) {
    s.location_id = content.regions.front().id;
  }

  discover_region(s, s.location_id);
  if (const RegionDef* r = content.find_region(s.location_id)) {
    for (const auto& n : r->connections) discover_region(s, n);
  }

  auto log = [&](LogKind kind, std::string msg) { push_log(s, kind, std::move(msg), now_ms, max_log_entries); };

  log(LogKind::System, "Your journey on the Grand Dao begins...");
  if (const SpiritRootDef* r = content.find_spirit_root(c.spirit_root_id)) {
    log(LogKind::Info, "Spirit Root: " + r->name + " (" + format_fixed(r->qi_multiplier, 1) + "x)");
  }
  if (const BodyTypeDef* b = content.find_body_type(c.body_type_id)) {
    log(LogKind::Info, "Body Type: " + b->name + " (" + format_fixed(b->body_multiplier, 1) + "x)");
  }
  if (bg) log(LogKind::Info, "Background: " + bg->name);
  log(LogKind::System, "Train to strengthen your body. Explore to find Scriptures and unlock Cultivation!");
  return s;
}

std::int64_t reroll_cost(int reroll_count) {
  if (reroll_count <= 0) return 0;
  std::int64_t cost = 1;
  for (int i = 0; i < reroll_count && i < 18; ++i) cost *= 10;
  return cost;
}

} // namespace granddao
