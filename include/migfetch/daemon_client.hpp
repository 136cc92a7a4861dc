#pragma once

#include "io/io.hpp"
#include "migfetch/http_client.hpp"
#include "system/cancel_context.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace migfetch {

// One connection to the local daemon's RPC API.
class IDaemonShell {
  public:
    struct ContentResponse {
        std::unique_ptr<IReader> output;
        // RPC-level error reported by the daemon; empty on success.
        std::string error;
    };

    virtual ~IDaemonShell() = default;

    virtual bool IsReachable(const CancelContext& ctx) = 0;

    // A failed Result means the request itself could not be carried out;
    // a daemon-side refusal comes back in out.error. ctx must outlive
    // out.output.
    virtual Result RequestContent(std::string_view path,
                                  const CancelContext& ctx,
                                  ContentResponse& out) = 0;
    Result RequestContent(std::string_view path, const CancelContext&& ctx, ContentResponse& out) = delete;
};

class IDaemonConnector {
  public:
    virtual ~IDaemonConnector() = default;

    // Fails when no daemon is configured for this user.
    virtual Result ResolveEndpoint(std::string& out_address) const = 0;

    virtual std::unique_ptr<IDaemonShell> Connect(const std::string& address,
                                                  std::chrono::milliseconds request_timeout) const = 0;
};

// Repository path of the local daemon: $IPFS_PATH, else ~/.ipfs.
std::string DefaultRepoPath();

// Reads <repo_path>/api and returns its address as an http:// base URL.
Result ApiEndpoint(const std::string& repo_path, std::string& out_url);

// "/ip4/127.0.0.1/tcp/5001" or "host:port" -> "http://127.0.0.1:5001".
Result MultiaddrToUrl(std::string_view addr, std::string& out_url);

std::string PercentEncode(std::string_view s);

// Daemon reached over its HTTP RPC API (/api/v0/...).
std::shared_ptr<const IDaemonConnector> MakeHttpApiDaemonConnector(std::shared_ptr<IHttpClient> http,
                                                                   std::string repo_path);

} // namespace migfetch
