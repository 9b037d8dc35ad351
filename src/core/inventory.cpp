#include "granddao/core/inventory.h"

#include <algorithm>

namespace granddao {

int item_quantity(const GameState& s, const std::string& item_id) {
  int total = 0;
  for (const auto& e : s.inventory) {
    if (e.item_id == item_id) total += e.quantity;
  }
  return total;
}

bool has_item(const GameState& s, const std::string& item_id) { return item_quantity(s, item_id) > 0; }

bool has_item_in_category(const ContentDB& content, const GameState& s, ItemCategory category) {
  for (const auto& e : s.inventory) {
    if (e.quantity <= 0) continue;
    const ItemDef* def = content.find_item(e.item_id);
    if (def && def->category == category) return true;
  }
  return false;
}

void add_item(const ContentDB& content, GameState& s, const std::string& item_id, int quantity) {
  if (item_id.empty() || quantity <= 0) return;

  const ItemDef* def = content.find_item(item_id);
  const bool stackable = !def || def->stackable;

  if (stackable) {
    for (auto& e : s.inventory) {
      if (e.item_id == item_id) {
        e.quantity += quantity;
        return;
      }
    }
    s.inventory.push_back(InventoryItem{item_id, quantity});
    return;
  }

  for (int i = 0; i < quantity; ++i) s.inventory.push_back(InventoryItem{item_id, 1});
}

bool remove_item(GameState& s, const std::string& item_id, int quantity) {
  if (quantity <= 0) return false;
  if (item_quantity(s, item_id) < quantity) return false;

  int left = quantity;
  for (auto& e : s.inventory) {
    if (left <= 0) break;
    if (e.item_id != item_id) continue;
    const int take = std::min(left, e.quantity);
    e.quantity -= take;
    left -= take;
  }
  s.inventory.erase(std::remove_if(s.inventory.begin(), s.inventory.end(),
                                   [](const InventoryItem& e) { return e.quantity <= 0; }),
                    s.inventory.end());
  return true;
}

} // namespace granddao
