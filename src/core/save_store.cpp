#include "granddao/core/save_store.h"

#include <exception>
#include <utility>

#include "granddao/core/serialization.h"
#include "granddao/core/state_validation.h"
#include "granddao/util/file_io.h"
#include "granddao/util/log.h"

namespace granddao {

SaveStore::SaveStore(std::string path, const ContentDB* content) : path_(std::move(path)), content_(content) {}

bool SaveStore::exists() const { return file_exists(path_); }

std::optional<GameState> SaveStore::validated(GameState state, const std::string& source) const {
  const auto errors = validate_game_state(state, content_);
  if (errors.empty()) return state;

  log::warn(source + " rejected: " + std::to_string(errors.size()) + " validation error(s)");
  for (const auto& e : errors) log::warn("  " + e);
  return std::nullopt;
}

std::optional<GameState> SaveStore::load() const {
  if (!file_exists(path_)) {
    log::debug("No save at " + path_);
    return std::nullopt;
  }

  std::string text;
  try {
    text = read_text_file(path_);
  } catch (const std::exception& e) {
    log::warn("Save load failed: " + std::string(e.what()));
    return std::nullopt;
  }

  GameState state;
  try {
    state = deserialize_game_from_json(text);
  } catch (const std::exception& e) {
    log::warn("Save " + path_ + " rejected: " + e.what());
    return std::nullopt;
  }
  return validated(std::move(state), "Save " + path_);
}

bool SaveStore::save(const GameState& state, std::string* error) const {
  try {
    write_text_file(path_, serialize_game_to_json(state));
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    log::warn("Save failed: " + std::string(e.what()));
    return false;
  }
  return true;
}

bool SaveStore::remove(std::string* error) const { return remove_file(path_, error); }

std::string SaveStore::export_text(const GameState& state) const { return export_save_text(state); }

std::optional<GameState> SaveStore::import_text(const std::string& text) const {
  auto imported = import_save_text(text);
  if (!imported) return std::nullopt;
  return validated(std::move(*imported), "Save import");
}

} // namespace granddao
