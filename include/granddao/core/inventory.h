#pragma once

#include <string>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"

namespace granddao {

// Total quantity across all entries for item_id.
int item_quantity(const GameState& s, const std::string& item_id);

bool has_item(const GameState& s, const std::string& item_id);

bool has_item_in_category(const ContentDB& content, const GameState& s, ItemCategory category);

// Stackable items merge into one entry. Non-stackable items get one entry per
// unit. Items missing from the content table are treated as stackable.
void add_item(const ContentDB& content, GameState& s, const std::string& item_id, int quantity = 1);

// Removes quantity units (possibly spanning several entries). Returns false and
// leaves the inventory untouched if fewer than quantity units are held.
bool remove_item(GameState& s, const std::string& item_id, int quantity = 1);

} // namespace granddao
