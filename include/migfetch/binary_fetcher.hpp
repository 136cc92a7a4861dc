#pragma once

#include "migfetch/archive_installer.hpp"
#include "migfetch/constants.hpp"
#include "migfetch/fetcher.hpp"
#include "migfetch/platform.hpp"
#include "system/cancel_context.hpp"
#include "util/result.hpp"

#include <string>

namespace migfetch {

// Downloads a distribution archive and unpacks its binary.
//
// The archive base name inside the distribution directory may differ from
// the distribution name, and the binary inside the archive may differ from
// the archive base name; e.g. "go-ipfs_v0.7.0_linux-amd64.tar.gz" holds a
// binary named "ipfs":
//
//     fetcher.FetchBinary(ctx, "go-ipfs", "v0.7.0", "go-ipfs", "ipfs", tmp_dir, result);
//
// An output that is a directory receives the binary under its archive name;
// otherwise the binary is written to the output path itself.
class BinaryFetcher {
  public:
    struct Options {
        std::string dist_root = kDefaultDistPath;
        std::string staging_base_dir;
    };

    BinaryFetcher(IFetcher& fetcher, PlatformId platform);
    BinaryFetcher(IFetcher& fetcher, PlatformId platform, Options opt);

    Result FetchBinary(const CancelContext& ctx,
                       const std::string& dist,
                       const std::string& version,
                       const std::string& archive_name,
                       const std::string& binary_name,
                       const std::string& output,
                       InstallResult& out) const;

  private:
    IFetcher& fetcher_;
    PlatformId platform_;
    Options opt_;
};

} // namespace migfetch
