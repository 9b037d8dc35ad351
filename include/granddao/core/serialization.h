#pragma once

#include <optional>
#include <string>

#include "granddao/core/game_state.h"
#include "granddao/util/json.h"

namespace granddao {

// Serialize the game state into an in-memory JSON document.
json::Value serialize_game_to_json_value(const GameState& state);

// Serialize the game state into a JSON text document (pretty-printed).
// indent <= 0 produces the compact form used for text export.
std::string serialize_game_to_json(const GameState& state, int indent = 2);

// Parse a saved game from JSON text.
//
// "character", "path_progress" and "phase" are required; everything else
// falls back to defaults. Throws std::runtime_error on parse errors, missing
// required fields, unknown enum strings or a save_version newer than this
// build understands.
GameState deserialize_game_from_json(const std::string& json_text);

// Portable text form of a save: base64 of the compact JSON.
std::string export_save_text(const GameState& state);

// Inverse of export_save_text(). Returns nullopt (and logs a warning with
// the reason) on a base64, JSON or schema failure.
std::optional<GameState> import_save_text(const std::string& text, std::string* error = nullptr);

} // namespace granddao
