#pragma once

#include <chrono>
#include <cstdint>

namespace migfetch {

// Public gateway the HTTP transport falls back to.
inline constexpr const char kDefaultGatewayUrl[] = "https://ipfs.io";
// Root of the distribution tree, as a logical path.
inline constexpr const char kDefaultDistPath[] = "/ipns/dist.ipfs.io";
// Listing of a distribution's versions, one per line.
inline constexpr const char kDistVersionsFile[] = "versions";

inline constexpr const char kDefaultUserAgent[] = "migfetch";

inline constexpr std::chrono::minutes kDaemonRequestTimeout{5};
inline constexpr std::uint64_t kFetchSizeLimit = 512ULL * 1024 * 1024;

} // namespace migfetch
