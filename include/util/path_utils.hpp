#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace migfetch {

// Normalize tar path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - strip one trailing "/"
inline std::string NormalizeTarPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    if (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

// Slash-join of distribution path segments. Empty segments are skipped and
// the separator between two segments is never doubled.
inline std::string JoinDistPath(std::initializer_list<std::string_view> parts) {
    std::string out;
    for (std::string_view part : parts) {
        if (part.empty()) continue;
        if (!out.empty()) {
            const bool lhs_slash = out.back() == '/';
            const bool rhs_slash = part.front() == '/';
            if (lhs_slash && rhs_slash) {
                part.remove_prefix(1);
            } else if (!lhs_slash && !rhs_slash) {
                out.push_back('/');
            }
        }
        out.append(part);
    }
    return out;
}

} // namespace migfetch
