#pragma once

#include "io/io.hpp"
#include "system/cancel_context.hpp"
#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace migfetch {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    // Whole-transfer limit, zero for none. The context deadline applies too.
    std::chrono::milliseconds timeout{0};
};

struct HttpResponse {
    long status = 0;
    std::string status_line; // e.g. "404 Not Found"
    std::unique_ptr<IReader> body;
};

class IHttpClient {
  public:
    virtual ~IHttpClient() = default;

    // Returns once the status is known; the body is streamed through
    // out.body. Any status is a successful Send; transport failures and
    // cancellation are not. out.body keeps checking ctx while it is read,
    // so ctx must outlive it.
    virtual Result Send(const HttpRequest& req, const CancelContext& ctx, HttpResponse& out) = 0;
    Result Send(const HttpRequest& req, const CancelContext&& ctx, HttpResponse& out) = delete;
};

std::shared_ptr<IHttpClient> MakeCurlHttpClient();

// Reads at most max_bytes of a body into out, used for error diagnostics.
Result ReadBodyText(IReader& body, std::size_t max_bytes, std::string& out);

} // namespace migfetch
