#pragma once

#include "dfy/error.hpp"

#include <optional>
#include <string>

namespace dfy {

// ============================================================================
// File Operations
// ============================================================================

// Replace `path` with `content` through a sibling temp file that is flushed
// to disk and renamed over the target. On failure the target is untouched,
// the temp file is removed and the error is IO_ERROR naming `path`.
Result<void> atomic_write_file(const std::string& path, const std::string& content);

// Read an entire file, nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

} // namespace dfy
