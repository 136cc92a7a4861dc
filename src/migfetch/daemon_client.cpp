#include "migfetch/daemon_client.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace migfetch {

namespace {

constexpr const char kApiFile[] = "api";
constexpr std::size_t kMaxErrorBody = 64 * 1024;
constexpr std::chrono::seconds kReachabilityTimeout{30};

std::string Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return std::string(s);
}

std::vector<std::string_view> SplitSegments(std::string_view s) {
    std::vector<std::string_view> out;
    while (!s.empty()) {
        while (!s.empty() && s.front() == '/') s.remove_prefix(1);
        if (s.empty()) break;
        const auto pos = s.find('/');
        out.push_back(s.substr(0, pos));
        if (pos == std::string_view::npos) break;
        s.remove_prefix(pos);
    }
    return out;
}

// Pulls the "Message" field out of an RPC error body, falling back to the
// raw text when it is not the expected JSON shape.
std::string RpcErrorMessage(const std::string& body, const std::string& status_line) {
    try {
        const auto j = nlohmann::json::parse(body);
        if (j.is_object()) {
            auto it = j.find("Message");
            if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
                return it->get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON
    }
    const std::string text = Trim(body);
    return text.empty() ? status_line : text;
}

class HttpApiDaemonShell final : public IDaemonShell {
  public:
    HttpApiDaemonShell(std::shared_ptr<IHttpClient> http,
                       std::string base_url,
                       std::chrono::milliseconds request_timeout)
        : http_(std::move(http)), base_url_(std::move(base_url)), request_timeout_(request_timeout) {}

    bool IsReachable(const CancelContext& ctx) override {
        HttpRequest req;
        req.method = "POST";
        req.url = base_url_ + "/api/v0/version";
        req.timeout = std::min<std::chrono::milliseconds>(request_timeout_, kReachabilityTimeout);

        HttpResponse resp;
        auto r = http_->Send(req, ctx, resp);
        if (!r.is_ok()) {
            LogDebug("daemon at %s not reachable: %s", base_url_.c_str(), r.msg.c_str());
            return false;
        }
        return resp.status == 200;
    }

    Result RequestContent(std::string_view path,
                          const CancelContext& ctx,
                          ContentResponse& out) override {
        HttpRequest req;
        req.method = "POST";
        req.url = base_url_ + "/api/v0/cat?arg=" + PercentEncode(path);
        req.timeout = request_timeout_;

        HttpResponse resp;
        auto r = http_->Send(req, ctx, resp);
        if (!r.is_ok()) return r;

        if (resp.status != 200) {
            std::string body;
            if (resp.body) {
                auto br = ReadBodyText(*resp.body, kMaxErrorBody, body);
                if (!br.is_ok()) return br;
            }
            out.output.reset();
            out.error = RpcErrorMessage(body, resp.status_line);
            return Result::Ok();
        }

        out.output = std::move(resp.body);
        out.error.clear();
        return Result::Ok();
    }

  private:
    std::shared_ptr<IHttpClient> http_;
    std::string base_url_;
    std::chrono::milliseconds request_timeout_;
};

class HttpApiDaemonConnector final : public IDaemonConnector {
  public:
    HttpApiDaemonConnector(std::shared_ptr<IHttpClient> http, std::string repo_path)
        : http_(std::move(http)), repo_path_(std::move(repo_path)) {}

    Result ResolveEndpoint(std::string& out_address) const override {
        return ApiEndpoint(repo_path_.empty() ? DefaultRepoPath() : repo_path_, out_address);
    }

    std::unique_ptr<IDaemonShell> Connect(const std::string& address,
                                          std::chrono::milliseconds request_timeout) const override {
        return std::make_unique<HttpApiDaemonShell>(http_, address, request_timeout);
    }

  private:
    std::shared_ptr<IHttpClient> http_;
    std::string repo_path_;
};

} // namespace

std::string DefaultRepoPath() {
    if (const char* env = std::getenv("IPFS_PATH"); env && *env) {
        return env;
    }
    const char* home = std::getenv("HOME");
    return (fs::path(home && *home ? home : ".") / ".ipfs").string();
}

Result ApiEndpoint(const std::string& repo_path, std::string& out_url) {
    const fs::path api_file = fs::path(repo_path) / kApiFile;

    std::ifstream is(api_file);
    if (!is.good()) {
        const int e = errno;
        return Result::Fail(ErrorKind::IO, e, "cannot read daemon api file " + api_file.string() + ": " +
                                                  std::strerror(e));
    }

    std::string content((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    const std::string addr = Trim(content);
    if (addr.empty()) {
        return Result::Fail(ErrorKind::Config, "daemon api file is empty: " + api_file.string());
    }

    auto r = MultiaddrToUrl(addr, out_url);
    if (!r.is_ok()) return r.Wrap(api_file.string());
    return Result::Ok();
}

Result MultiaddrToUrl(std::string_view addr, std::string& out_url) {
    if (addr.rfind("http://", 0) == 0 || addr.rfind("https://", 0) == 0) {
        out_url = std::string(addr);
        while (!out_url.empty() && out_url.back() == '/') out_url.pop_back();
        return Result::Ok();
    }

    if (addr.empty() || addr.front() != '/') {
        // plain host:port
        if (addr.find(':') == std::string_view::npos) {
            return Result::Fail(ErrorKind::Config, "invalid daemon address: " + std::string(addr));
        }
        out_url = "http://" + std::string(addr);
        return Result::Ok();
    }

    const auto seg = SplitSegments(addr);
    if (seg.size() < 4 || seg[2] != "tcp") {
        return Result::Fail(ErrorKind::Config, "unsupported daemon multiaddr: " + std::string(addr));
    }

    std::string host(seg[1]);
    if (seg[0] == "ip6") {
        host = "[" + host + "]";
    } else if (seg[0] != "ip4" && seg[0] != "dns" && seg[0] != "dns4" && seg[0] != "dns6") {
        return Result::Fail(ErrorKind::Config, "unsupported daemon multiaddr: " + std::string(addr));
    }

    const std::string_view port = seg[3];
    if (port.empty() || port.find_first_not_of("0123456789") != std::string_view::npos) {
        return Result::Fail(ErrorKind::Config, "invalid port in daemon multiaddr: " + std::string(addr));
    }

    out_url = "http://" + host + ":" + std::string(port);
    return Result::Ok();
}

std::string PercentEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::shared_ptr<const IDaemonConnector> MakeHttpApiDaemonConnector(std::shared_ptr<IHttpClient> http,
                                                                   std::string repo_path) {
    return std::make_shared<HttpApiDaemonConnector>(std::move(http), std::move(repo_path));
}

} // namespace migfetch
