#pragma once

#include "io/limited_reader.hpp"
#include "migfetch/constants.hpp"
#include "migfetch/daemon_client.hpp"
#include "migfetch/http_client.hpp"
#include "system/cancel_context.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace migfetch {

// Size-bounded stream handed to the caller by a successful fetch.
using FetchStream = LimitedReader;

struct FetcherConfig {
    std::string gateway_url = kDefaultGatewayUrl;
    std::chrono::milliseconds request_timeout = kDaemonRequestTimeout;
    std::uint64_t size_limit = kFetchSizeLimit;
    std::string user_agent = kDefaultUserAgent;
};

class IFetcher {
  public:
    virtual ~IFetcher() = default;

    // Opens the content at a logical distribution path. Reads on the
    // returned stream keep checking ctx, so ctx must outlive it.
    virtual Result Fetch(const CancelContext& ctx,
                         const std::string& logical_path,
                         std::unique_ptr<FetchStream>& out) = 0;
    Result Fetch(const CancelContext&& ctx,
                 const std::string& logical_path,
                 std::unique_ptr<FetchStream>& out) = delete;
};

// Local daemon first, public gateway over HTTP second.
class Fetcher final : public IFetcher {
  public:
    // Daemon reached through its HTTP API, gateway through libcurl.
    explicit Fetcher(FetcherConfig config);
    // A null daemon connector disables the daemon attempt.
    Fetcher(FetcherConfig config,
            std::shared_ptr<const IDaemonConnector> daemon,
            std::shared_ptr<IHttpClient> http);

    using IFetcher::Fetch;
    Result Fetch(const CancelContext& ctx,
                 const std::string& logical_path,
                 std::unique_ptr<FetchStream>& out) override;

    Result FetchFromDaemon(const CancelContext& ctx,
                           const std::string& logical_path,
                           std::unique_ptr<FetchStream>& out) const;
    Result FetchFromGateway(const CancelContext& ctx,
                            const std::string& logical_path,
                            std::unique_ptr<FetchStream>& out) const;
    Result FetchFromDaemon(const CancelContext&&, const std::string&, std::unique_ptr<FetchStream>&) const = delete;
    Result FetchFromGateway(const CancelContext&&, const std::string&, std::unique_ptr<FetchStream>&) const = delete;

    const FetcherConfig& Config() const { return config_; }

  private:
    FetcherConfig config_;
    std::shared_ptr<const IDaemonConnector> daemon_;
    std::shared_ptr<IHttpClient> http_;
};

} // namespace migfetch
