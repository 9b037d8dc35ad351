#pragma once

#include <string>

namespace granddao {

// Reads an entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are retried
// against GRANDDAO_SOURCE_DIR (when compiled in) and the working directory's
// ancestors, so data/ resolves from build trees and test runners.
std::string read_text_file(const std::string& path);

// Writes a file through a temporary sibling + rename, creating parent
// directories. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

// Removes a file. A missing file counts as success.
bool remove_file(const std::string& path, std::string* error = nullptr);

} // namespace granddao
