#include "internal.h"

#include <string>
#include <vector>

namespace vista {
namespace glob {

namespace {

enum class ClassMatch { Hit, Miss, Unterminated };

/// Match `ch` against the bracket expression whose '[' is at `pattern[i]`.
/// On a Hit or Miss, `i` is moved past the closing ']'.
ClassMatch match_class(const std::string& pattern, size_t& i, char ch) {
    size_t j = i + 1;
    bool negate = j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^');
    if (negate) ++j;

    bool hit = false;
    size_t first = j;
    while (j < pattern.size() && (j == first || pattern[j] != ']')) {
        if (j + 2 < pattern.size() && pattern[j + 1] == '-' && pattern[j + 2] != ']') {
            if (ch >= pattern[j] && ch <= pattern[j + 2]) hit = true;
            j += 3;
        } else {
            if (ch == pattern[j]) hit = true;
            ++j;
        }
    }
    if (j >= pattern.size()) return ClassMatch::Unterminated;
    i = j + 1;
    return hit != negate ? ClassMatch::Hit : ClassMatch::Miss;
}

} // anonymous namespace

/// Single-segment match with `*`, `?` and `[...]`. Backtracks to the most
/// recent star only, so the cost is O(pattern * name).
bool fnmatch(const std::string& pattern, const std::string& name) {
    size_t p = 0, n = 0;
    size_t star_p = std::string::npos, star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size()) {
            char pc = pattern[p];
            if (pc == '*') {
                star_p = ++p;
                star_n = n;
                continue;
            }
            if (pc == '?') {
                ++p; ++n;
                continue;
            }
            if (pc == '[') {
                size_t q = p;
                auto m = match_class(pattern, q, name[n]);
                if (m == ClassMatch::Hit) {
                    p = q; ++n;
                    continue;
                }
                // An unterminated '[' is an ordinary character.
                if (m == ClassMatch::Unterminated && name[n] == '[') {
                    ++p; ++n;
                    continue;
                }
            } else if (pc == name[n]) {
                ++p; ++n;
                continue;
            }
        }
        if (star_p == std::string::npos) return false;
        p = star_p;
        n = ++star_n;
    }

    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

/// Hidden names (leading '.') only match a pattern that spells the dot.
bool glob_match(const std::string& pattern, const std::string& name) {
    if (!name.empty() && name[0] == '.' && (pattern.empty() || pattern[0] != '.')) {
        return false;
    }
    return fnmatch(pattern, name);
}

bool path_match(const std::string& pattern, const std::string& path) {
    auto pat  = paths::split(pattern);
    auto segs = paths::split(path);

    // Same backtracking scheme as fnmatch, one level up: `**` plays the
    // role of `*` over whole segments and never crosses a hidden directory.
    size_t p = 0, s = 0;
    size_t star_p = std::string::npos, star_s = 0;

    while (s < segs.size()) {
        if (p < pat.size() && pat[p] == "**") {
            star_p = ++p;
            star_s = s;
            continue;
        }
        if (p < pat.size() && glob_match(pat[p], segs[s])) {
            ++p; ++s;
            continue;
        }
        if (star_p == std::string::npos) return false;
        if (segs[star_s][0] == '.') return false;
        p = star_p;
        s = ++star_s;
    }

    while (p < pat.size() && pat[p] == "**") ++p;
    return p == pat.size();
}

bool has_magic(const std::string& segment) {
    return segment.find_first_of("*?[") != std::string::npos;
}

} // namespace glob
} // namespace vista
