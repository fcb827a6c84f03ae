#include <kapla/version.hpp>
#include <cctype>
#include <limits>

namespace kapla {

// Parse a non-empty run of digits starting at pos; advances pos.
static bool parse_component(const std::string& s, size_t& pos, int& out) {
    size_t start = pos;
    long long value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        value = value * 10 + (s[pos] - '0');
        if (value > std::numeric_limits<int>::max()) return false;
        ++pos;
    }
    if (pos == start) return false;
    // Leading zeros are not allowed except for a bare "0"
    if (pos - start > 1 && s[start] == '0') return false;
    out = static_cast<int>(value);
    return true;
}

static bool valid_identifier(const std::string& ident) {
    if (ident.empty()) return false;
    for (char c : ident) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return KaplaError{KaplaError::Version, "empty version string"};
    }

    Version v;
    size_t pos = 0;
    int* parts[] = {&v.major, &v.minor, &v.micro};
    for (size_t i = 0; i < 3; ++i) {
        if (i > 0) {
            if (pos >= s.size() || s[pos] != '.') {
                return KaplaError{KaplaError::Version,
                    "invalid version '" + s + "'",
                    "expected format: major.minor.micro[-label]"};
            }
            ++pos;
        }
        if (!parse_component(s, pos, *parts[i])) {
            return KaplaError{KaplaError::Version,
                "invalid version component in '" + s + "'",
                "expected format: major.minor.micro[-label]"};
        }
    }

    if (pos < s.size() && s[pos] == '-') {
        size_t end = s.find('+', pos + 1);
        v.label = s.substr(pos + 1, end == std::string::npos ? std::string::npos
                                                             : end - pos - 1);
        if (!valid_identifier(v.label)) {
            return KaplaError{KaplaError::Version,
                "invalid label in version '" + s + "'"};
        }
        pos = end == std::string::npos ? s.size() : end;
    }

    if (pos < s.size() && s[pos] == '+') {
        v.build = s.substr(pos + 1);
        if (!valid_identifier(v.build)) {
            return KaplaError{KaplaError::Version,
                "invalid build metadata in version '" + s + "'"};
        }
        pos = s.size();
    }

    if (pos != s.size()) {
        return KaplaError{KaplaError::Version,
            "unexpected trailing characters in version '" + s + "'"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(micro);
    if (!label.empty()) s += "-" + label;
    if (!build.empty()) s += "+" + build;
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           micro == o.micro && label == o.label;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    // Pre-release sorts before the release it precedes
    if (label.empty() != o.label.empty()) return !label.empty();
    return label < o.label;
}

} // namespace kapla
