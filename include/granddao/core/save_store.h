#pragma once

#include <optional>
#include <string>

#include "granddao/core/content.h"
#include "granddao/core/game_state.h"

namespace granddao {

// File-backed persistence for a single save slot.
//
// Saves are pretty-printed JSON written atomically (temp file + rename).
// Loading and importing validate the state (against `content` when given)
// and reject anything broken with a log warning; there is no partial repair.
class SaveStore {
 public:
  explicit SaveStore(std::string path, const ContentDB* content = nullptr);

  const std::string& path() const { return path_; }

  // nullopt when there is no save file or it is unreadable/corrupt.
  std::optional<GameState> load() const;

  bool save(const GameState& state, std::string* error = nullptr) const;

  bool remove(std::string* error = nullptr) const;

  bool exists() const;

  std::string export_text(const GameState& state) const;
  std::optional<GameState> import_text(const std::string& text) const;

 private:
  std::optional<GameState> validated(GameState state, const std::string& source) const;

  std::string path_;
  const ContentDB* content_{nullptr};
};

} // namespace granddao
