#include <kapla/glob.hpp>
#include <vector>

namespace kapla {

static std::vector<std::string> split_path(const std::string& p) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : p) {
        if (c == '/' || c == '\\') {
            if (!cur.empty()) segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) segs.push_back(cur);
    // "./libs/*" and "libs/*" are the same pattern
    if (!segs.empty() && segs.front() == ".") segs.erase(segs.begin());
    return segs;
}

// Wildcard match of one segment, backtracking to the last '*'.
static bool match_segment(const std::string& pat, const std::string& str) {
    size_t pi = 0, si = 0;
    size_t star = std::string::npos, mark = 0;
    while (si < str.size()) {
        if (pi < pat.size() && (pat[pi] == '?' || pat[pi] == str[si])) {
            ++pi;
            ++si;
        } else if (pi < pat.size() && pat[pi] == '*') {
            star = pi++;
            mark = si;
        } else if (star != std::string::npos) {
            pi = star + 1;
            si = ++mark;
        } else {
            return false;
        }
    }
    while (pi < pat.size() && pat[pi] == '*') ++pi;
    return pi == pat.size();
}

static bool match_from(const std::vector<std::string>& pat, size_t pi,
                       const std::vector<std::string>& path, size_t si) {
    if (pi == pat.size()) return si == path.size();
    if (pat[pi] == "**") {
        for (size_t k = si; k <= path.size(); ++k) {
            if (match_from(pat, pi + 1, path, k)) return true;
        }
        return false;
    }
    if (si == path.size()) return false;
    return match_segment(pat[pi], path[si]) && match_from(pat, pi + 1, path, si + 1);
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_from(split_path(pattern), 0, split_path(path), 0);
}

} // namespace kapla
