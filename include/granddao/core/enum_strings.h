#pragma once

#include <optional>
#include <string>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"

namespace granddao {

// Shared string <-> enum conversion helpers.
//
// Used by the content loader, save serialization and the CLI so the strings
// stay identical everywhere. The *_from_string parsers for save-state enums
// return nullopt on unknown input so loaders can reject corrupt saves instead
// of guessing.

std::string action_to_string(ActionType a);
std::optional<ActionType> action_from_string(const std::string& s);

std::string phase_to_string(GamePhase p);
std::optional<GamePhase> phase_from_string(const std::string& s);

std::string log_kind_to_string(LogKind k);
std::optional<LogKind> log_kind_from_string(const std::string& s);

std::string realm_to_string(Realm r);
std::optional<Realm> realm_from_string(const std::string& s);

std::string rarity_to_string(Rarity r);
std::optional<Rarity> rarity_from_string(const std::string& s);

std::string item_category_to_string(ItemCategory c);
std::optional<ItemCategory> item_category_from_string(const std::string& s);

} // namespace granddao
