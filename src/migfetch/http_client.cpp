#include "migfetch/http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <string_view>
#include <vector>

namespace migfetch {

namespace {

bool EnsureCurlGlobal() {
    static const bool ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    return ready;
}

struct CurlEasyDeleter {
    void operator()(CURL* h) const {
        if (h) curl_easy_cleanup(h);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

// Pull-style body over the curl multi interface. The transfer only makes
// progress while Read() asks for more bytes, so nothing is buffered beyond
// what one curl_multi_perform() delivers.
class CurlBodyReader final : public IReader {
  public:
    explicit CurlBodyReader(const CancelContext& ctx) : ctx_(&ctx) {}

    ~CurlBodyReader() override {
        if (multi_) {
            if (easy_) curl_multi_remove_handle(multi_, easy_.get());
            curl_multi_cleanup(multi_);
        }
    }

    CurlBodyReader(const CurlBodyReader&) = delete;
    CurlBodyReader& operator=(const CurlBodyReader&) = delete;

    Result Start(const HttpRequest& req) {
        easy_.reset(curl_easy_init());
        if (!easy_) return Result::Fail(ErrorKind::Transport, "curl_easy_init failed");

        multi_ = curl_multi_init();
        if (!multi_) return Result::Fail(ErrorKind::Transport, "curl_multi_init failed");

        for (const auto& [name, value] : req.headers) {
            const std::string line = name + ": " + value;
            curl_slist* next = curl_slist_append(headers_.get(), line.c_str());
            if (!next) return Result::Fail(ErrorKind::Transport, "curl_slist_append failed");
            headers_.release();
            headers_.reset(next);
        }

        CURL* h = easy_.get();
        curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 30L);
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf_);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &CurlBodyReader::OnBody);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &CurlBodyReader::OnHeader);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, this);
        if (headers_) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers_.get());

        if (req.method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
        } else if (req.method != "GET") {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        }

        auto timeout = req.timeout;
        if (auto left = ctx_->Remaining()) {
            timeout = (timeout.count() > 0) ? std::min(timeout, *left) : *left;
            // A zero timeout means "none" to curl.
            if (timeout.count() == 0) timeout = std::chrono::milliseconds(1);
        }
        if (timeout.count() > 0) {
            curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        }

        if (curl_multi_add_handle(multi_, h) != CURLM_OK) {
            return Result::Fail(ErrorKind::Transport, "curl_multi_add_handle failed");
        }

        // Drive the transfer until the final status is known.
        while (pending_.empty() && !done_) {
            auto pr = Pump();
            if (!pr.is_ok()) return pr;
        }
        if (done_ && result_ != CURLE_OK) {
            return Result::Fail(ErrorKind::Transport, req.method + " " + req.url + ": " + ErrorText());
        }
        return Result::Ok();
    }

    long Status() const {
        long status = 0;
        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status);
        return status;
    }

    const std::string& StatusLine() const { return status_line_; }

    ssize_t Read(std::span<std::uint8_t> out) override {
        while (pos_ >= pending_.size() && !done_) {
            pending_.clear();
            pos_ = 0;
            auto pr = Pump();
            if (!pr.is_ok()) {
                LogDebug("http body read aborted: %s", pr.msg.c_str());
                return -1;
            }
        }

        if (pos_ >= pending_.size()) {
            if (result_ != CURLE_OK) {
                LogDebug("http body read failed: %s", ErrorText().c_str());
                return -1;
            }
            return 0;
        }

        const size_t n = std::min(out.size(), pending_.size() - pos_);
        std::memcpy(out.data(), pending_.data() + pos_, n);
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

  private:
    static size_t OnBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlBodyReader*>(userdata);
        const size_t n = size * nmemb;
        self->pending_.insert(self->pending_.end(),
                              reinterpret_cast<const std::uint8_t*>(ptr),
                              reinterpret_cast<const std::uint8_t*>(ptr) + n);
        return n;
    }

    static size_t OnHeader(char* ptr, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlBodyReader*>(userdata);
        const size_t n = size * nitems;
        std::string_view line(ptr, n);
        if (line.rfind("HTTP/", 0) == 0) {
            // "HTTP/1.1 404 Not Found\r\n" -> "404 Not Found". With redirects
            // the last status line wins.
            const auto sp = line.find(' ');
            line = (sp == std::string_view::npos) ? std::string_view{} : line.substr(sp + 1);
            // HTTP/2 has no reason phrase: "HTTP/2 404 \r\n" -> "404".
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) {
                line.remove_suffix(1);
            }
            self->status_line_ = std::string(line);
        }
        return n;
    }

    Result Pump() {
        auto cr = ctx_->Check("http transfer");
        if (!cr.is_ok()) return cr;

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            return Result::Fail(ErrorKind::Transport, std::string("curl_multi_perform: ") + curl_multi_strerror(mc));
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                done_ = true;
                result_ = msg->data.result;
            }
        }

        if (!done_ && pending_.size() <= pos_) {
            mc = curl_multi_poll(multi_, nullptr, 0, 100, nullptr);
            if (mc != CURLM_OK) {
                return Result::Fail(ErrorKind::Transport, std::string("curl_multi_poll: ") + curl_multi_strerror(mc));
            }
        }
        return Result::Ok();
    }

    std::string ErrorText() const {
        if (errbuf_[0] != '\0') return errbuf_;
        return curl_easy_strerror(result_);
    }

    const CancelContext* ctx_ = nullptr;
    std::unique_ptr<CURL, CurlEasyDeleter> easy_;
    std::unique_ptr<curl_slist, CurlSlistDeleter> headers_;
    CURLM* multi_ = nullptr;
    char errbuf_[CURL_ERROR_SIZE]{};

    std::vector<std::uint8_t> pending_;
    size_t pos_ = 0;
    bool done_ = false;
    CURLcode result_ = CURLE_OK;
    std::string status_line_;
};

class CurlHttpClient final : public IHttpClient {
  public:
    Result Send(const HttpRequest& req, const CancelContext& ctx, HttpResponse& out) override {
        if (!EnsureCurlGlobal()) return Result::Fail(ErrorKind::Transport, "Unable to initialize libcurl");

        auto reader = std::make_unique<CurlBodyReader>(ctx);
        auto sr = reader->Start(req);
        if (!sr.is_ok()) return sr;

        out.status = reader->Status();
        out.status_line = reader->StatusLine();
        if (out.status_line.empty()) out.status_line = std::to_string(out.status);
        out.body = std::move(reader);
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<IHttpClient> MakeCurlHttpClient() {
    return std::make_shared<CurlHttpClient>();
}

Result ReadBodyText(IReader& body, std::size_t max_bytes, std::string& out) {
    out.clear();
    std::vector<std::uint8_t> buf(16 * 1024);
    while (out.size() < max_bytes) {
        const size_t want = std::min(buf.size(), max_bytes - out.size());
        const ssize_t n = body.Read(std::span<std::uint8_t>(buf.data(), want));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Transport, "error reading response body");
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace migfetch
