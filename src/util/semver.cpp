#include "util/semver.hpp"

#include <charconv>
#include <ranges>

namespace migfetch {

namespace {

bool IsDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool ParseNumeric(std::string_view s, std::uint64_t& out) {
    if (!IsDigits(s)) return false;
    if (s.size() > 1 && s.front() == '0') return false;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

bool IsIdentChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

// Dot-separated, non-empty identifiers of [0-9A-Za-z-]. Numeric pre-release
// identifiers must not carry leading zeros.
bool ValidIdentifiers(std::string_view s, bool numeric_no_leading_zero) {
    if (s.empty()) return false;
    for (auto part : s | std::views::split('.')) {
        const std::string_view id(part.begin(), part.end());
        if (id.empty()) return false;
        for (char c : id) {
            if (!IsIdentChar(c)) return false;
        }
        if (numeric_no_leading_zero && IsDigits(id) && id.size() > 1 && id.front() == '0') {
            return false;
        }
    }
    return true;
}

int CompareIdentifier(std::string_view lhs, std::string_view rhs) {
    const bool lhs_num = IsDigits(lhs);
    const bool rhs_num = IsDigits(rhs);

    if (lhs_num && rhs_num) {
        // Numeric identifiers have no leading zeros, so length orders them.
        if (lhs.size() != rhs.size()) return lhs.size() < rhs.size() ? -1 : 1;
        const int c = lhs.compare(rhs);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (lhs_num) return -1;
    if (rhs_num) return 1;

    const int c = lhs.compare(rhs);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int ComparePreRelease(const std::string& lhs, const std::string& rhs) {
    if (lhs == rhs) return 0;
    // A version without pre-release ranks above any pre-release of it.
    if (lhs.empty()) return 1;
    if (rhs.empty()) return -1;

    auto lhs_parts = lhs | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng.begin(), rng.end()); });
    auto rhs_parts = rhs | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng.begin(), rng.end()); });

    auto it_lhs = lhs_parts.begin();
    auto it_rhs = rhs_parts.begin();

    while (it_lhs != lhs_parts.end() && it_rhs != rhs_parts.end()) {
        const int c = CompareIdentifier(*it_lhs, *it_rhs);
        if (c != 0) return c;
        ++it_lhs;
        ++it_rhs;
    }

    if (it_lhs == lhs_parts.end() && it_rhs == rhs_parts.end()) return 0;
    return it_lhs == lhs_parts.end() ? -1 : 1;
}

} // namespace

std::optional<Version> Version::Parse(std::string_view text) {
    Version v;

    if (const auto plus = text.find('+'); plus != std::string_view::npos) {
        const std::string_view meta = text.substr(plus + 1);
        if (!ValidIdentifiers(meta, false)) return std::nullopt;
        v.metadata_ = std::string(meta);
        text = text.substr(0, plus);
    }

    if (const auto dash = text.find('-'); dash != std::string_view::npos) {
        const std::string_view pre = text.substr(dash + 1);
        if (!ValidIdentifiers(pre, true)) return std::nullopt;
        v.pre_release_ = std::string(pre);
        text = text.substr(0, dash);
    }

    const auto dot1 = text.find('.');
    if (dot1 == std::string_view::npos) return std::nullopt;
    const auto dot2 = text.find('.', dot1 + 1);
    if (dot2 == std::string_view::npos) return std::nullopt;

    if (!ParseNumeric(text.substr(0, dot1), v.major_)) return std::nullopt;
    if (!ParseNumeric(text.substr(dot1 + 1, dot2 - dot1 - 1), v.minor_)) return std::nullopt;
    if (!ParseNumeric(text.substr(dot2 + 1), v.patch_)) return std::nullopt;

    return v;
}

std::string Version::ToString() const {
    std::string out = std::to_string(major_) + "." + std::to_string(minor_) + "." + std::to_string(patch_);
    if (!pre_release_.empty()) out += "-" + pre_release_;
    if (!metadata_.empty()) out += "+" + metadata_;
    return out;
}

int Version::Compare(const Version& lhs, const Version& rhs) {
    if (lhs.major_ != rhs.major_) return lhs.major_ < rhs.major_ ? -1 : 1;
    if (lhs.minor_ != rhs.minor_) return lhs.minor_ < rhs.minor_ ? -1 : 1;
    if (lhs.patch_ != rhs.patch_) return lhs.patch_ < rhs.patch_ ? -1 : 1;
    return ComparePreRelease(lhs.pre_release_, rhs.pre_release_);
}

} // namespace migfetch
