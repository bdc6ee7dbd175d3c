#pragma once

#include <string>
#include <vector>

namespace modsrc {

// Lexically clean a slash-separated path: collapse repeated '/', drop "."
// segments, resolve ".." against the preceding segment (never above the
// root of a rooted path) and drop any trailing '/'. "" cleans to ".".
std::string clean_path(const std::string& path);

// Join the non-empty parts with '/' and clean the result.
// Returns "" when every part is empty.
std::string join_path(const std::vector<std::string>& parts);

} // namespace modsrc
