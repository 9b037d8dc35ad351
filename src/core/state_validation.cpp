#include "granddao/core/state_validation.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace granddao {
namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

// XP is a running double sum; allow rounding noise at the cap.
constexpr double kXpEpsilon = 1e-6;

} // namespace

std::vector<std::string> validate_game_state(const GameState& s, const ContentDB* content) {
  std::vector<std::string> errors;

  const Character& c = s.character;
  if (s.phase == GamePhase::Playing && c.name.empty()) push(errors, "Character has no name");
  if (!(c.luck >= 0.0 && c.luck <= 1.0)) push(errors, join("Character luck ", c.luck, " outside [0, 1]"));
  if (c.karma < kKarmaMin || c.karma > kKarmaMax) push(errors, join("Character karma ", c.karma, " outside [-1000, 1000]"));
  if (c.rebirth_count < 0) push(errors, "Character rebirth_count is negative");
  if (c.legacy_bonus < 0.0) push(errors, "Character legacy_bonus is negative");

  for (const auto& [id, pp] : s.path_progress) {
    if (pp.path_id != id) push(errors, join("PathProgress key '", id, "' holds path_id '", pp.path_id, "'"));
    if (pp.level < 1 || pp.level > kMaxPathLevel) push(errors, join("Path '", id, "' level ", pp.level, " out of range"));
    if (pp.xp < 0.0) push(errors, join("Path '", id, "' has negative xp"));
    if (pp.xp > pp.xp_required + kXpEpsilon) push(errors, join("Path '", id, "' xp exceeds xp_required"));
    if (pp.breakthrough_available && std::fabs(pp.xp - pp.xp_required) > kXpEpsilon) {
      push(errors, join("Path '", id, "' is breakthrough-ready without full xp"));
    }
  }

  if (!s.active_path_id.empty() && s.path_progress.find(s.active_path_id) == s.path_progress.end()) {
    push(errors, join("Active path '", s.active_path_id, "' has no progress entry"));
  }
  if (s.phase == GamePhase::Playing && s.location_id.empty()) push(errors, "Location is empty");
  if (s.spirit_stones < 0) push(errors, "Spirit stones are negative");

  for (const auto& e : s.inventory) {
    if (e.item_id.empty()) push(errors, "Inventory entry has an empty item id");
    if (e.quantity <= 0) push(errors, join("Inventory entry '", e.item_id, "' has quantity ", e.quantity));
  }

  if (s.travel.traveling && s.travel.destination_id.empty()) push(errors, "Traveling without a destination");
  if (s.qi_deviation.active && s.qi_deviation.remaining_seconds <= 0) {
    push(errors, "Qi deviation is active with no remaining time");
  }
  for (const auto& b : s.buffs) {
    if (b.remaining_seconds <= 0) push(errors, join("Buff '", b.id, "' has no remaining time"));
  }

  for (const auto& e : s.log) {
    if (e.seq >= s.next_log_seq) push(errors, join("Log entry seq ", e.seq, " >= next_log_seq ", s.next_log_seq));
  }

  if (s.highest_path_level < 1 || s.highest_path_level > kMaxPathLevel) {
    push(errors, join("highest_path_level ", s.highest_path_level, " out of range"));
  }
  if (s.tick_count < 0 || s.total_play_time < 0 || s.total_deaths < 0 || s.reroll_count < 0) {
    push(errors, "Negative counter");
  }

  if (content) {
    const ContentDB& db = *content;
    if (!c.spirit_root_id.empty() && !db.find_spirit_root(c.spirit_root_id)) {
      push(errors, join("Unknown spirit root '", c.spirit_root_id, "'"));
    }
    if (!c.body_type_id.empty() && !db.find_body_type(c.body_type_id)) {
      push(errors, join("Unknown body type '", c.body_type_id, "'"));
    }
    if (!c.background_id.empty() && !db.find_background(c.background_id)) {
      push(errors, join("Unknown background '", c.background_id, "'"));
    }
    for (const auto& [id, _] : s.path_progress) {
      if (!db.find_path(id)) push(errors, join("Unknown path '", id, "'"));
    }
    if (!s.location_id.empty() && !db.find_region(s.location_id)) {
      push(errors, join("Unknown location '", s.location_id, "'"));
    }
    for (const auto& r : s.discovered_regions) {
      if (!db.find_region(r)) push(errors, join("Unknown discovered region '", r, "'"));
    }
    if (s.travel.traveling && !db.find_region(s.travel.destination_id)) {
      push(errors, join("Unknown travel destination '", s.travel.destination_id, "'"));
    }
    for (const auto& e : s.inventory) {
      if (!db.find_item(e.item_id)) push(errors, join("Unknown inventory item '", e.item_id, "'"));
    }
    if (!s.equipped_scripture.empty() && !db.find_item(s.equipped_scripture)) {
      push(errors, join("Unknown equipped scripture '", s.equipped_scripture, "'"));
    }
    if (!s.pending_event_id.empty() && !db.find_event(s.pending_event_id)) {
      push(errors, join("Unknown pending event '", s.pending_event_id, "'"));
    }
    if (!s.group_id.empty() && !db.find_group(s.group_id)) {
      push(errors, join("Unknown group '", s.group_id, "'"));
    }
  }

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace granddao
