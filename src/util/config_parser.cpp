#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace migfetch::config {

void MigfetchConfigFromFile::Reset() {
    gateway_url.reset();
    dist_path.reset();
    ipfs_path.reset();
    user_agent.reset();
    request_timeout_seconds.reset();
    fetch_size_limit.reset();
    log_level.reset();
}

Result MigfetchConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace migfetch::config
