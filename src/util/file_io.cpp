#include "granddao/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace granddao {

namespace {

namespace fs = std::filesystem;

fs::path temp_sibling(const fs::path& target) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string name = target.filename().string() + ".tmp." + std::to_string(stamp);
  return target.has_parent_path() ? target.parent_path() / name : fs::path(name);
}

// Deletes the temp file unless the write completed and it was renamed away.
struct TempFileGuard {
  fs::path path;
  bool armed{true};
  ~TempFileGuard() {
    if (!armed) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
};

fs::path resolve_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute()) return requested;
  if (fs::exists(requested, ec) && !ec) return requested;

  std::vector<fs::path> roots;
#ifdef GRANDDAO_SOURCE_DIR
  roots.emplace_back(GRANDDAO_SOURCE_DIR);
#endif
  ec.clear();
  fs::path cur = fs::current_path(ec);
  for (int depth = 0; !ec && !cur.empty() && depth < 8; ++depth) {
    roots.push_back(cur);
    const auto parent = cur.parent_path();
    if (parent == cur) break;
    cur = parent;
  }

  for (const auto& root : roots) {
    ec.clear();
    const auto candidate = root / requested;
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = resolve_read_path(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  TempFileGuard guard{temp_sibling(p)};
  {
    std::ofstream out(guard.path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + guard.path.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + guard.path.string());
  }

  std::error_code ec;
  fs::rename(guard.path, p, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(p, rm_ec);
    ec.clear();
    fs::rename(guard.path, p, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  guard.armed = false;
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(fs::path(path), ec) && !ec;
}

bool remove_file(const std::string& path, std::string* error) {
  std::error_code ec;
  fs::remove(fs::path(path), ec);
  if (ec) {
    if (error) *error = "Failed to remove " + path + " (" + ec.message() + ")";
    return false;
  }
  return true;
}

} // namespace granddao
