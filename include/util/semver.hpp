#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace migfetch {

// Semantic version: MAJOR.MINOR.PATCH[-prerelease][+metadata].
class Version {
public:
    // Returns nullopt for anything outside the semver grammar. No prefix
    // handling here; callers strip "v" themselves.
    static std::optional<Version> Parse(std::string_view text);

    std::uint64_t Major() const { return major_; }
    std::uint64_t Minor() const { return minor_; }
    std::uint64_t Patch() const { return patch_; }
    const std::string& PreRelease() const { return pre_release_; }
    const std::string& Metadata() const { return metadata_; }

    std::string ToString() const;

    // Precedence order: <0, 0, >0. Metadata does not take part.
    static int Compare(const Version& lhs, const Version& rhs);

    friend bool operator<(const Version& lhs, const Version& rhs) { return Compare(lhs, rhs) < 0; }

private:
    std::uint64_t major_ = 0;
    std::uint64_t minor_ = 0;
    std::uint64_t patch_ = 0;
    std::string pre_release_;
    std::string metadata_;
};

} // namespace migfetch
