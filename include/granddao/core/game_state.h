#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace granddao {

// Bump when the save layout changes in a way older readers cannot handle.
inline constexpr int kCurrentSaveVersion = 1;

inline constexpr int kMaxPathLevel = 12;
inline constexpr int kKarmaMin = -1000;
inline constexpr int kKarmaMax = 1000;

enum class GamePhase { CharacterCreation, Playing };

// What the character spends each second on. A path only gains XP while the
// current action equals the path's declared action.
enum class ActionType { Idle, Cultivate, Train, Explore, Refine, Inscribe, Forge, Study, Sleep };

enum class LogKind { Info, Success, Warning, Danger, Legendary, System };

struct Character {
  std::string name;

  // Rolled at creation; ids into ContentDB tables.
  std::string spirit_root_id;
  std::string body_type_id;
  std::string background_id;
  double luck{0.5};

  int karma{0};
  bool rogue_status{false};
  int rebirth_count{0};
  // Cumulative XP bonus carried across rebirths (0.05 => +5%).
  double legacy_bonus{0.0};
  // Set once karma drops to the devil threshold with a devil path open; never cleared.
  bool devil_mark{false};
  bool redeemed_devil{false};
};

struct PathProgress {
  std::string path_id;
  int level{1};
  double xp{0.0};
  double xp_required{0.0};
  // True exactly when xp == xp_required; accrual stops until an attempt.
  bool breakthrough_available{false};
  bool unlocked{false};
};

struct ActiveBuff {
  std::string id;
  std::string name;
  double multiplier{1.0};
  int remaining_seconds{0};
};

struct QiDeviation {
  bool active{false};
  int remaining_seconds{0};
};

struct TravelState {
  bool traveling{false};
  std::string destination_id;
  int remaining_seconds{0};
};

struct InventoryItem {
  std::string item_id;
  int quantity{0};
};

struct LogEntry {
  std::uint64_t seq{0};
  std::int64_t timestamp_ms{0};
  LogKind kind{LogKind::Info};
  std::string message;
};

struct GameState {
  int save_version{kCurrentSaveVersion};
  GamePhase phase{GamePhase::CharacterCreation};

  Character character;
  std::map<std::string, PathProgress> path_progress;

  ActionType current_action{ActionType::Idle};
  std::string active_path_id;

  std::int64_t spirit_stones{0};
  std::vector<InventoryItem> inventory;
  std::string equipped_scripture;

  std::string location_id;
  std::vector<std::string> discovered_regions;
  TravelState travel;

  std::vector<ActiveBuff> buffs;
  QiDeviation qi_deviation;

  std::string group_id;
  int group_contribution{0};
  std::vector<std::string> completed_missions;

  // Narrative event waiting for a player choice. Empty => none.
  std::string pending_event_id;

  // Player-facing narration, newest first.
  std::vector<LogEntry> log;
  // Persisted so that trimming the log (or a rebirth) never reuses a sequence number.
  std::uint64_t next_log_seq{1};

  std::int64_t tick_count{0};
  std::int64_t total_play_time{0};
  int highest_path_level{1};
  int total_deaths{0};
  int reroll_count{0};

  bool karma_visible{false};
  bool auto_save_enabled{true};
  std::int64_t last_save_timestamp_ms{0};
};

template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

bool is_discovered(const GameState& s, const std::string& region_id);

// Adds region_id to the discovered set if missing. Returns true if it was new.
bool discover_region(GameState& s, const std::string& region_id);

// Prepends a narration entry and trims the log to max_entries (0 => unlimited).
void push_log(GameState& s, LogKind kind, std::string message, std::int64_t timestamp_ms, int max_entries);

} // namespace granddao
