#pragma once

#include "io/io.hpp"
#include "migfetch/constants.hpp"
#include "migfetch/fetcher.hpp"
#include "system/cancel_context.hpp"
#include "util/result.hpp"
#include "util/semver.hpp"

#include <string>
#include <vector>

namespace migfetch {

// A listed version and the one-letter prefix ("v") it was written with.
struct ListedVersion {
    char prefix = '\0';
    Version version;

    std::string ToString() const;
};

class VersionCatalog {
  public:
    explicit VersionCatalog(IFetcher& fetcher, std::string dist_root = kDefaultDistPath);

    // All parseable versions of dist, ascending, or the exact reverse.
    Result ListVersions(const CancelContext& ctx,
                        const std::string& dist,
                        bool descending,
                        std::vector<std::string>& out) const;

    // Newest version whose text has no "-dev".
    Result LatestStable(const CancelContext& ctx, const std::string& dist, std::string& out) const;

    // Line-by-line parse of a versions listing. Unparseable lines are
    // dropped; the result is stably sorted ascending.
    static Result ParseVersionList(IReader& reader, std::vector<ListedVersion>& out);

  private:
    IFetcher& fetcher_;
    std::string dist_root_;
};

} // namespace migfetch
