#pragma once

#include <string>

namespace dfy {

// Lexically clean a slash-separated path (no filesystem access).
// - Collapses "." segments and repeated slashes
// - Resolves ".." against the preceding segment
// - ".." above a rooted path is dropped, above a relative path it is kept
// - Trailing slashes are removed; an empty result becomes "."
std::string clean_path(const std::string& path);

// Join two path segments and clean the result. Empty segments are skipped.
std::string join_path(const std::string& base, const std::string& relative);

} // namespace dfy
