#pragma once

#include <string>

namespace kapla {

// Match a workspace member pattern against a relative directory path.
// Supports: * and ? within one segment, ** across zero or more segments.
// Backslashes in either argument are treated as '/'.
bool glob_match(const std::string& pattern, const std::string& path);

} // namespace kapla
