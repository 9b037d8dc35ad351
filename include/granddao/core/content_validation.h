#pragma once

#include <string>
#include <vector>

#include "granddao/core/content.h"

namespace granddao {

// Validate a ContentDB for internal consistency.
//
// Returns a list of human-readable error strings. An empty list means "valid".
//
// Checks cross references (region connections, loot items, event pools,
// background start locations, shop stock, group locations, event rewards)
// and that every path has 12 levels and a rules entry.
std::vector<std::string> validate_content_db(const ContentDB& db);

} // namespace granddao
