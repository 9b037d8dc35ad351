#include "granddao/core/simulation.h"

#include <vector>

#include "granddao/core/character.h"
#include "granddao/core/inventory.h"

namespace granddao {

// Exploration draws happen in a fixed order each tick: stone trickle, loot,
// fated encounter, then the periodic region event. Tests script the random
// source against this order.
void Simulation::tick_exploration() {
  const RegionDef* region = content_.find_region(state_.location_id);
  if (!region) return;

  if (rate_chance(*rng_, cfg_.stone_trickle_chance)) {
    const int amount = random_int(*rng_, 1, 3);
    state_.spirit_stones += amount;
    if (rate_chance(*rng_, cfg_.stone_trickle_log_chance)) {
      push_event(LogKind::Info, "Found " + std::to_string(amount) + " Spirit Stone" + (amount > 1 ? "s" : "") +
                                    " while exploring.");
    }
  }

  double loot_chance = cfg_.loot_base_chance + state_.character.luck * cfg_.loot_luck_chance;
  if (const BackgroundDef* bg = character_background(content_, state_.character)) {
    loot_chance += bg->effect.exploration_bonus;
  }
  if (state_.character.rogue_status) loot_chance += cfg_.rogue_loot_bonus;
  if (rate_chance(*rng_, loot_chance)) generate_loot(*region);

  const double fated_chance = cfg_.fated_encounter_base_chance * (1.0 + state_.character.luck * 5.0);
  if (rate_chance(*rng_, fated_chance)) {
    std::vector<const EventDef*> regional;
    std::vector<const EventDef*> all;
    for (const auto& ev : content_.events) {
      if (!ev.fated) continue;
      all.push_back(&ev);
      for (const auto& id : region->event_pool) {
        if (id == ev.id) {
          regional.push_back(&ev);
          break;
        }
      }
    }
    const auto& pool = regional.empty() ? all : regional;
    if (!pool.empty()) assign_event(*pool[random_index(*rng_, pool.size())]);
  }

  if (cfg_.event_check_interval_ticks > 0 && state_.tick_count % cfg_.event_check_interval_ticks == 0 &&
      state_.pending_event_id.empty() && !region->event_pool.empty()) {
    const std::string& id = region->event_pool[random_index(*rng_, region->event_pool.size())];
    const EventDef* ev = content_.find_event(id);
    if (ev && !ev->fated) assign_event(*ev);
  }
}

void Simulation::assign_event(const EventDef& ev) {
  // An unanswered event keeps the slot.
  if (!state_.pending_event_id.empty()) return;
  state_.pending_event_id = ev.id;
  push_event(ev.fated ? LogKind::Legendary : LogKind::Info, ev.title);
}

void Simulation::generate_loot(const RegionDef& region) {
  std::vector<const LootEntry*> valid;
  std::vector<double> weights;
  for (const auto& l : region.loot_table) {
    if (l.min_danger > region.danger_level) continue;
    valid.push_back(&l);
    weights.push_back(l.weight);
  }
  const std::size_t idx = weighted_index(*rng_, weights);
  if (idx >= valid.size()) return;

  const ItemDef* item = content_.find_item(valid[idx]->item_id);
  if (!item) return;

  if (item->id == "spirit_stone_pouch_small") {
    const int amount = random_int(*rng_, 5, 15);
    state_.spirit_stones += amount;
    push_event(LogKind::Success, "Found " + std::to_string(amount) + " Spirit Stones!");
    return;
  }
  if (item->id == "spirit_stone_pouch_large") {
    const int amount = random_int(*rng_, 30, 80);
    state_.spirit_stones += amount;
    push_event(LogKind::Legendary, "Found " + std::to_string(amount) + " Spirit Stones!");
    return;
  }

  add_item(content_, state_, item->id);
  LogKind kind = LogKind::Info;
  if (item->rarity == Rarity::Legendary || item->rarity == Rarity::Mythic) {
    kind = LogKind::Legendary;
  } else if (item->rarity == Rarity::Epic || item->rarity == Rarity::Rare) {
    kind = LogKind::Success;
  }
  push_event(kind, "Found: " + item->name);
  check_path_unlocks();
}

} // namespace granddao
