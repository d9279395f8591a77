#pragma once

#include <string>

namespace agirace {

// Reads an entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also tried
// against AGIRACE_SOURCE_DIR and the working directory's parents, so tests and
// the CLI find data/ when run from a build directory.
std::string read_text_file(const std::string& path);

// Writes a file via a temporary sibling + rename, creating parent directories.
// Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

// Creates a directory (and parents); no-op if it exists.
void ensure_dir(const std::string& path);

} // namespace agirace
