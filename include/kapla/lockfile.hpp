#pragma once

#include <kapla/result.hpp>
#include <string>
#include <map>

namespace kapla {

// Opaque name -> pinned version mapping read from the workspace lock file.
// Entries are keyed by normalized package name.
struct LockFile {
    std::map<std::string, std::string> packages;

    // Reads [[package]] tables with name and version fields. A missing file
    // is an empty lock, an unreadable or malformed one is an error.
    static Result<LockFile> load(const std::string& path);

    static Result<LockFile> parse(const std::string& toml_str,
                                  const std::string& origin = "");

    // Pinned version for a dependency name, nullptr if not locked
    const std::string* find(const std::string& name) const;

    bool empty() const { return packages.empty(); }
};

} // namespace kapla
