#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace migfetch::config {

constexpr const char* kDefaultConfigPath = "/etc/migfetch/migfetch.conf";
// One day.
constexpr std::uint64_t kMaxRequestTimeoutSeconds = 24 * 60 * 60;

// Every key is optional; absent keys leave the built-in default in place.
class MigfetchConfigFromFile {
public:
    std::optional<std::string> gateway_url;
    std::optional<std::string> dist_path;
    std::optional<std::string> ipfs_path;
    std::optional<std::string> user_agent;
    std::optional<std::uint64_t> request_timeout_seconds;
    std::optional<std::uint64_t> fetch_size_limit;
    std::optional<std::string> log_level;

    Result LoadFile(const std::string& path);

    void Reset();
};

} // namespace migfetch::config
