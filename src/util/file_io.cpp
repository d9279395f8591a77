#include "agirace/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace agirace {
namespace fs = std::filesystem;

namespace {

fs::path resolve_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute() || fs::exists(requested, ec)) return requested;

  std::vector<fs::path> roots;
#ifdef AGIRACE_SOURCE_DIR
  roots.emplace_back(AGIRACE_SOURCE_DIR);
#endif
  ec.clear();
  fs::path cur = fs::current_path(ec);
  for (int depth = 0; !ec && !cur.empty() && depth < 8; ++depth) {
    roots.push_back(cur);
    const fs::path parent = cur.parent_path();
    if (parent == cur) break;
    cur = parent;
  }

  for (const auto& root : roots) {
    ec.clear();
    const fs::path candidate = root / requested;
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
  const fs::path target(path);
  if (target.has_parent_path()) ensure_dir(target.parent_path().string());

  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw std::runtime_error("Failed to write file: " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp, target, ec);
  }
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  }
}

} // namespace agirace
