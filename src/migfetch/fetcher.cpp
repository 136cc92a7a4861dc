#include "migfetch/fetcher.hpp"

#include "util/logger.hpp"

namespace migfetch {

namespace {
constexpr std::size_t kMaxErrorBody = 64 * 1024;
} // namespace

Fetcher::Fetcher(FetcherConfig config)
    : config_(std::move(config)), http_(MakeCurlHttpClient()) {
    daemon_ = MakeHttpApiDaemonConnector(http_, DefaultRepoPath());
}

Fetcher::Fetcher(FetcherConfig config,
                 std::shared_ptr<const IDaemonConnector> daemon,
                 std::shared_ptr<IHttpClient> http)
    : config_(std::move(config)), daemon_(std::move(daemon)), http_(std::move(http)) {}

Result Fetcher::Fetch(const CancelContext& ctx,
                      const std::string& logical_path,
                      std::unique_ptr<FetchStream>& out) {
    if (daemon_) {
        auto dr = FetchFromDaemon(ctx, logical_path, out);
        if (dr.is_ok()) {
            LogInfo("using local daemon for transfer of %s", logical_path.c_str());
            return dr;
        }
        LogDebug("daemon fetch of %s failed: %s", logical_path.c_str(), dr.msg.c_str());
    }

    // Cancellation ends the operation here; the fallback is not started.
    auto cr = ctx.Check("fetch " + logical_path);
    if (!cr.is_ok()) return cr;

    auto hr = FetchFromGateway(ctx, logical_path, out);
    if (hr.is_ok()) {
        LogInfo("using gateway %s for transfer of %s", config_.gateway_url.c_str(), logical_path.c_str());
    }
    return hr;
}

Result Fetcher::FetchFromDaemon(const CancelContext& ctx,
                                const std::string& logical_path,
                                std::unique_ptr<FetchStream>& out) const {
    if (!daemon_) return Result::Fail(ErrorKind::Transport, "no daemon configured");

    std::string address;
    auto er = daemon_->ResolveEndpoint(address);
    if (!er.is_ok()) return er;

    auto shell = daemon_->Connect(address, config_.request_timeout);
    if (!shell) return Result::Fail(ErrorKind::Transport, "cannot create daemon client for " + address);

    if (!shell->IsReachable(ctx)) {
        return Result::Fail(ErrorKind::Transport, "daemon api at " + address + " not up");
    }

    IDaemonShell::ContentResponse resp;
    auto rr = shell->RequestContent(logical_path, ctx, resp);
    if (!rr.is_ok()) return rr;
    if (!resp.error.empty()) {
        return Result::Fail(ErrorKind::Transport, "daemon cat " + logical_path + ": " + resp.error);
    }
    if (!resp.output) {
        return Result::Fail(ErrorKind::Transport, "daemon cat " + logical_path + ": no output stream");
    }

    out = std::make_unique<FetchStream>(std::move(resp.output), config_.size_limit);
    return Result::Ok();
}

Result Fetcher::FetchFromGateway(const CancelContext& ctx,
                                 const std::string& logical_path,
                                 std::unique_ptr<FetchStream>& out) const {
    if (!http_) return Result::Fail(ErrorKind::Transport, "no http client configured");

    HttpRequest req;
    req.method = "GET";
    req.url = config_.gateway_url + logical_path;
    req.headers.emplace_back("User-Agent", config_.user_agent);

    HttpResponse resp;
    auto sr = http_->Send(req, ctx, resp);
    if (!sr.is_ok()) {
        if (sr.kind == ErrorKind::Cancelled) return sr;
        return Result::Fail(ErrorKind::Transport, sr.err, "GET " + req.url + " error: " + sr.msg);
    }

    if (resp.status >= 400) {
        std::string body;
        if (resp.body) {
            auto br = ReadBodyText(*resp.body, kMaxErrorBody, body);
            if (!br.is_ok()) {
                return Result::Fail(ErrorKind::Transport, "GET " + req.url + " error reading error body: " + br.msg);
            }
        }
        return Result::Fail(ErrorKind::Transport, "GET " + req.url + " error: " + resp.status_line + ": " + body);
    }
    if (!resp.body) {
        return Result::Fail(ErrorKind::Transport, "GET " + req.url + " error: no response body");
    }

    out = std::make_unique<FetchStream>(std::move(resp.body), config_.size_limit);
    return Result::Ok();
}

} // namespace migfetch
