#include "granddao/core/simulation.h"

#include <algorithm>
#include <utility>

#include "granddao/core/character.h"
#include "granddao/core/inventory.h"
#include "granddao/util/strings.h"

namespace granddao {

void Simulation::rebirth() {
  if (!playing()) return;
  tribulation_.reset();

  const GameState& old = state_;
  const int rebirth_count = old.character.rebirth_count + 1;
  const int total_deaths = old.total_deaths + 1;
  const int highest = std::max(old.highest_path_level, 1);
  const double legacy = old.character.legacy_bonus + highest * cfg_.legacy_per_level;

  const bool fate_anchor = has_item(old, "fate_anchor");
  const bool dimensional_ring = has_item(old, "dimensional_ring");

  Character next;
  if (fate_anchor) {
    next = old.character;
    next.karma = 0;
    next.rogue_status = false;
    next.redeemed_devil = false;
  } else {
    next = roll_character(content_, *rng_, old.character.name);
    next.devil_mark = old.character.devil_mark;
  }
  next.rebirth_count = rebirth_count;
  next.legacy_bonus = legacy;

  std::vector<InventoryItem> kept;
  if (dimensional_ring) {
    for (const auto& e : old.inventory) {
      if (e.item_id != "dimensional_ring") kept.push_back(e);
    }
  }

  const std::uint64_t next_seq = old.next_log_seq;
  const int rerolls = old.reroll_count;

  GameState fresh = create_initial_state(content_, next, now_ms(), cfg_.max_log_entries);
  // Sequence numbers keep counting across lives.
  for (auto& e : fresh.log) e.seq += next_seq - 1;
  fresh.next_log_seq += next_seq - 1;

  fresh.inventory = std::move(kept);
  fresh.total_deaths = total_deaths;
  fresh.reroll_count = rerolls;
  state_ = std::move(fresh);

  // The amnesiac's scripture only comes with a fresh inventory.
  if (dimensional_ring) check_path_unlocks();

  push_event(LogKind::Danger, "REBIRTH #" + std::to_string(rebirth_count) + "! Legacy Bonus: +" +
                                  format_fixed(legacy * 100.0, 1) + "% XP");
}

} // namespace granddao
