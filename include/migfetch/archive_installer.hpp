#pragma once

#include "io/io.hpp"
#include "migfetch/platform.hpp"
#include "system/cancel_context.hpp"
#include "util/result.hpp"

#include <string>

namespace migfetch {

// One fetch+install operation.
struct DistributionTarget {
    std::string dist;
    std::string version;
    std::string archive_name; // archive base name
    std::string binary_name;  // entry name inside the archive, platform-suffixed
    std::string output;       // file path or existing directory

    // archive_name defaults to dist, binary_name to archive_name; the
    // binary name then gets the platform's executable suffix.
    static DistributionTarget Make(std::string dist,
                                   std::string version,
                                   std::string archive_name,
                                   std::string binary_name,
                                   std::string output,
                                   const PlatformId& platform);
};

struct InstallResult {
    std::string path;
};

class ArchiveInstaller {
public:
    struct Options {
        ArchiveType archive_type = HostArchiveType();
        // Where the downloaded archive is staged; empty -> $TMPDIR or /tmp.
        std::string staging_base_dir;
        const CancelContext* cancel = nullptr;
    };

    ArchiveInstaller();
    explicit ArchiveInstaller(Options opt);

    // Output disposition: existing directory -> output/binary_name,
    // missing -> output, anything else existing -> AlreadyExists.
    static Result ResolveOutputPath(const std::string& output,
                                    const std::string& binary_name,
                                    std::string& out_path);

    // Stages archive_stream, extracts target.binary_name (top level or
    // under target.dist/) to the resolved output and makes it executable.
    Result Install(IReader& archive_stream, const DistributionTarget& target, InstallResult& out) const;

private:
    Result ExtractEntry(const std::string& archive_path,
                        const DistributionTarget& target,
                        const std::string& final_path) const;

    Options opt_{};
};

} // namespace migfetch
