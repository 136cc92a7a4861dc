#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace migfetch::config::detail {

namespace {

// Absent keys are fine; present keys of the wrong type are errors.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    if (!it->is_number_unsigned() && it->get<long long>() < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, MigfetchConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "GatewayUrl", cfg.gateway_url, err) ||
        !GetStringIfPresent(j, "DistPath", cfg.dist_path, err) ||
        !GetStringIfPresent(j, "IpfsPath", cfg.ipfs_path, err) ||
        !GetStringIfPresent(j, "UserAgent", cfg.user_agent, err) ||
        !GetU64IfPresent(j, "RequestTimeoutSeconds", cfg.request_timeout_seconds, err) ||
        !GetU64IfPresent(j, "FetchSizeLimit", cfg.fetch_size_limit, err) ||
        !GetStringIfPresent(j, "LogLevel", cfg.log_level, err)) {
        return false;
    }

    if (cfg.gateway_url && cfg.gateway_url->empty()) {
        err = "GatewayUrl must not be empty";
        return false;
    }
    if (cfg.request_timeout_seconds && *cfg.request_timeout_seconds > kMaxRequestTimeoutSeconds) {
        err = "RequestTimeoutSeconds must not exceed " + std::to_string(kMaxRequestTimeoutSeconds);
        return false;
    }
    if (cfg.fetch_size_limit && *cfg.fetch_size_limit == 0) {
        err = "FetchSizeLimit must be positive";
        return false;
    }
    if (cfg.log_level) {
        LogLevel lvl{};
        if (!ParseLogLevel(*cfg.log_level, lvl)) {
            err = "unknown LogLevel " + *cfg.log_level;
            return false;
        }
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        static constexpr const char* kKnown[] = {"GatewayUrl", "DistPath", "IpfsPath", "UserAgent",
                                                 "RequestTimeoutSeconds", "FetchSizeLimit", "LogLevel"};
        bool known = false;
        for (const char* k : kKnown) {
            if (it.key() == k) known = true;
        }
        if (!known) LogWarn("config: ignoring unknown key %s", it.key().c_str());
    }

    return true;
}

} // namespace migfetch::config::detail
