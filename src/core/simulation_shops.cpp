#include "granddao/core/simulation.h"

#include <algorithm>
#include <cmath>

#include "granddao/core/character.h"
#include "granddao/core/inventory.h"

namespace granddao {

bool Simulation::shop_available() const {
  if (!playing() || state_.travel.traveling) return false;
  const RegionDef* region = content_.find_region(state_.location_id);
  return region && (region->has_shop || region->is_city);
}

std::vector<std::string> Simulation::shop_stock() const {
  std::vector<std::string> out;
  if (!shop_available()) return out;
  const RegionDef* region = content_.find_region(state_.location_id);
  const ShopDef* shop = content_.find_shop(region->realm);
  if (!shop) return out;
  for (const auto& id : shop->item_ids) {
    if (content_.find_item(id)) out.push_back(id);
  }
  return out;
}

std::int64_t Simulation::shop_price(const std::string& item_id) const {
  const ItemDef* item = content_.find_item(item_id);
  if (!item) return -1;

  double multiplier = 1.0;
  if (const RegionDef* region = content_.find_region(state_.location_id)) {
    if (const ShopDef* shop = content_.find_shop(region->realm)) multiplier = shop->price_multiplier;
  }
  double discount = 0.0;
  if (const BackgroundDef* bg = character_background(content_, state_.character)) discount = bg->effect.shop_discount;

  return static_cast<std::int64_t>(std::floor(static_cast<double>(item->sell_value) * 3.0 * multiplier * (1.0 - discount)));
}

bool Simulation::buy_item(const std::string& item_id) {
  const auto stock = shop_stock();
  if (std::find(stock.begin(), stock.end(), item_id) == stock.end()) return false;

  const std::int64_t price = shop_price(item_id);
  if (price < 0 || state_.spirit_stones < price) return false;

  state_.spirit_stones -= price;
  add_item(content_, state_, item_id);
  push_event(LogKind::Info, "Bought " + content_.find_item(item_id)->name + " for " + std::to_string(price) + " SS");
  check_path_unlocks();
  return true;
}

bool Simulation::sell_item(const std::string& item_id) {
  if (!shop_available() || !has_item(state_, item_id)) return false;
  const ItemDef* item = content_.find_item(item_id);
  if (!item || item->sell_value <= 0) return false;
  if (!remove_item(state_, item_id)) return false;

  state_.spirit_stones += item->sell_value;
  if (state_.equipped_scripture == item_id && !has_item(state_, item_id)) state_.equipped_scripture.clear();
  push_event(LogKind::Info, "Sold " + item->name + " for " + std::to_string(item->sell_value) + " SS");
  return true;
}

} // namespace granddao
