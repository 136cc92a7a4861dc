#pragma once

#include "system/cancel_context.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace migfetch {

struct PlatformId {
    std::string os;      // "linux", "darwin", "windows", ...
    std::string arch;    // "amd64", "arm64", ...
    std::string variant; // "musl" on musl-based Linux, otherwise == os

    // Name used in archive file names: "linux-musl" or plain os.
    std::string OsWithVariant() const;
    bool IsWindows() const { return os == "windows"; }
};

enum class ArchiveType {
    TarGz,
    Zip,
};

const char* Extension(ArchiveType type);

// Distribution-site names of the platform this binary was built for.
std::string HostOs();
std::string HostArch();

class PlatformProbe {
  public:
    class IProcessRunner {
      public:
        struct Output {
            std::string combined; // stdout and stderr interleaved
            bool exit_ignored = false; // set when a non-zero status was dropped
        };

        virtual ~IProcessRunner() = default;

        // Runs `sh -c command`. The exit status is deliberately not an
        // error; only failing to launch (or cancellation) is.
        virtual Result RunShellIgnoringExit(const std::string& command,
                                            const CancelContext& ctx,
                                            Output& out) const = 0;
    };

    PlatformProbe();
    explicit PlatformProbe(std::shared_ptr<const IProcessRunner> runner,
                           std::string os = HostOs(),
                           std::string arch = HostArch());

    // Re-probes on every call.
    Result Probe(const CancelContext& ctx, PlatformId& out) const;

    static std::shared_ptr<const IProcessRunner> DefaultProcessRunner();

  private:
    std::shared_ptr<const IProcessRunner> runner_;
    std::string os_;
    std::string arch_;
};

// zip on Windows, tar.gz everywhere else.
ArchiveType ArchiveTypeFor(const PlatformId& platform);
ArchiveType HostArchiveType();

// Appends ".exe" on Windows.
std::string ExeName(std::string name, const PlatformId& platform);

// base_version_OS-ARCH.ext, e.g. ipfs-10-to-11_v1.8.0_linux-amd64.tar.gz
std::string ArchiveName(const std::string& base,
                        const std::string& version,
                        ArchiveType type,
                        const PlatformId& platform);

// root/dist/version/archive
std::string DistPath(const std::string& root,
                     const std::string& dist,
                     const std::string& version,
                     const std::string& archive_name);

} // namespace migfetch
