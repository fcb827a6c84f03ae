#pragma once

#include <kapla/result.hpp>
#include <string>

namespace kapla {

// Package version: major.minor.micro[-label][+build]
// Build metadata is kept for display but ignored by comparisons.
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string label;  // e.g., "alpha", "rc1", empty for release
    std::string build;  // e.g., "20240101"

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
};

} // namespace kapla
