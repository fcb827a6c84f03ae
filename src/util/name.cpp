#include <kapla/name.hpp>
#include <algorithm>
#include <cctype>

namespace kapla {

Status validate_package_name(const std::string& raw) {
    if (raw.empty()) {
        return KaplaError{KaplaError::InvalidArg, "empty package name"};
    }

    if (!std::isalpha(static_cast<unsigned char>(raw[0]))) {
        return KaplaError{KaplaError::InvalidArg,
            "invalid package name '" + raw + "'",
            "package names must start with a letter"};
    }

    for (char c : raw) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            return KaplaError{KaplaError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in package name '" + raw + "'",
                "allowed: [a-zA-Z0-9_.-]"};
        }
    }

    return ok_status();
}

std::string normalize_package_name(const std::string& raw) {
    std::string out = raw;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](char c) -> char {
                       if (c == '-' || c == '.') return '_';
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });
    return out;
}

} // namespace kapla
