#include "migfetch/version_catalog.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <string_view>

namespace migfetch {

namespace {

// Longest line accepted before the listing counts as unscannable.
constexpr std::size_t kMaxLineLength = 64 * 1024;

std::optional<ListedVersion> ParseLine(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || std::isspace(static_cast<unsigned char>(line.back())))) {
        line.remove_suffix(1);
    }
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    if (line.empty()) return std::nullopt;

    ListedVersion lv;
    if (std::isalpha(static_cast<unsigned char>(line.front()))) {
        lv.prefix = line.front();
        line.remove_prefix(1);
    }

    auto v = Version::Parse(line);
    if (!v) return std::nullopt;
    lv.version = std::move(*v);
    return lv;
}

} // namespace

std::string ListedVersion::ToString() const {
    std::string out;
    if (prefix != '\0') out.push_back(prefix);
    out += version.ToString();
    return out;
}

VersionCatalog::VersionCatalog(IFetcher& fetcher, std::string dist_root)
    : fetcher_(fetcher), dist_root_(std::move(dist_root)) {}

Result VersionCatalog::ParseVersionList(IReader& reader, std::vector<ListedVersion>& out) {
    out.clear();

    std::vector<std::uint8_t> buf(16 * 1024);
    std::string line;
    std::size_t dropped = 0;

    auto take_line = [&]() {
        if (auto lv = ParseLine(line)) {
            out.push_back(std::move(*lv));
        } else if (!line.empty()) {
            ++dropped;
        }
        line.clear();
    };

    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Read, "could not read versions: stream read failed");

        for (ssize_t i = 0; i < n; ++i) {
            const char c = static_cast<char>(buf[static_cast<size_t>(i)]);
            if (c == '\n') {
                take_line();
                continue;
            }
            line.push_back(c);
            if (line.size() > kMaxLineLength) {
                return Result::Fail(ErrorKind::Read, "could not read versions: line too long");
            }
        }
    }
    if (!line.empty()) take_line();

    if (dropped > 0) {
        LogDebug("ignored %zu unparseable version lines", dropped);
    }

    std::stable_sort(out.begin(), out.end(), [](const ListedVersion& a, const ListedVersion& b) {
        return a.version < b.version;
    });
    return Result::Ok();
}

Result VersionCatalog::ListVersions(const CancelContext& ctx,
                                    const std::string& dist,
                                    bool descending,
                                    std::vector<std::string>& out) const {
    const std::string path = JoinDistPath({dist_root_, dist, kDistVersionsFile});

    std::unique_ptr<FetchStream> stream;
    auto fr = fetcher_.Fetch(ctx, path, stream);
    if (!fr.is_ok()) {
        if (fr.kind == ErrorKind::Cancelled) return fr;
        return Result::Fail(ErrorKind::Read, fr.err, "could not fetch versions of " + dist + ": " + fr.msg);
    }

    std::vector<ListedVersion> versions;
    auto pr = ParseVersionList(*stream, versions);
    stream->Close();
    if (!pr.is_ok()) return pr.Wrap(path);

    if (descending) std::reverse(versions.begin(), versions.end());

    out.clear();
    out.reserve(versions.size());
    for (const auto& v : versions) {
        out.push_back(v.ToString());
    }
    return Result::Ok();
}

Result VersionCatalog::LatestStable(const CancelContext& ctx, const std::string& dist, std::string& out) const {
    std::vector<std::string> versions;
    auto lr = ListVersions(ctx, dist, false, versions);
    if (!lr.is_ok()) return lr;

    for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
        if (it->find("-dev") == std::string::npos) {
            out = *it;
            return Result::Ok();
        }
    }
    return Result::Fail(ErrorKind::NotFound, "could not find a non dev version of " + dist);
}

} // namespace migfetch
