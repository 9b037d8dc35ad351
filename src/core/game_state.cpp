#include "granddao/core/game_state.h"

#include <algorithm>
#include <utility>

namespace granddao {

bool is_discovered(const GameState& s, const std::string& region_id) {
  return std::find(s.discovered_regions.begin(), s.discovered_regions.end(), region_id) !=
         s.discovered_regions.end();
}

bool discover_region(GameState& s, const std::string& region_id) {
  if (region_id.empty() || is_discovered(s, region_id)) return false;
  s.discovered_regions.push_back(region_id);
  return true;
}

void push_log(GameState& s, LogKind kind, std::string message, std::int64_t timestamp_ms, int max_entries) {
  LogEntry e;
  e.seq = s.next_log_seq;
  s.next_log_seq += 1;
  if (s.next_log_seq == 0) s.next_log_seq = 1;

  e.timestamp_ms = timestamp_ms;
  e.kind = kind;
  e.message = std::move(message);
  s.log.insert(s.log.begin(), std::move(e));

  if (max_entries > 0 && static_cast<int>(s.log.size()) > max_entries) {
    s.log.resize(static_cast<std::size_t>(max_entries));
  }
}

} // namespace granddao
