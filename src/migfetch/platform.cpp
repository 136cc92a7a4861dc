#include "migfetch/platform.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>

namespace migfetch {

namespace {
// ldd prints the libc flavour; glibc on stdout, musl on stderr (and with a
// non-zero status, since it does not know --version).
constexpr const char kLibcProbeCommand[] = "ldd --version";
} // namespace

std::string PlatformId::OsWithVariant() const {
    if (!variant.empty() && variant != os) return os + "-" + variant;
    return os;
}

const char* Extension(ArchiveType type) {
    switch (type) {
        case ArchiveType::TarGz: return "tar.gz";
        case ArchiveType::Zip:   return "zip";
    }
    return "tar.gz";
}

std::string HostOs() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__OpenBSD__)
    return "openbsd";
#elif defined(__NetBSD__)
    return "netbsd";
#else
    return "unknown";
#endif
}

std::string HostArch() {
#if defined(__x86_64__) || defined(_M_X64)
    return "amd64";
#elif defined(__i386__) || defined(_M_IX86)
    return "386";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__arm__) || defined(_M_ARM)
    return "arm";
#elif defined(__powerpc64__) && defined(__LITTLE_ENDIAN__)
    return "ppc64le";
#elif defined(__riscv) && (__riscv_xlen == 64)
    return "riscv64";
#elif defined(__s390x__)
    return "s390x";
#else
    return "unknown";
#endif
}

PlatformProbe::PlatformProbe() : PlatformProbe(DefaultProcessRunner()) {}

PlatformProbe::PlatformProbe(std::shared_ptr<const IProcessRunner> runner, std::string os, std::string arch)
    : runner_(runner ? std::move(runner) : DefaultProcessRunner()), os_(std::move(os)), arch_(std::move(arch)) {}

Result PlatformProbe::Probe(const CancelContext& ctx, PlatformId& out) const {
    out = PlatformId{os_, arch_, os_};
    if (os_ != "linux") return Result::Ok();

    IProcessRunner::Output output;
    auto rr = runner_->RunShellIgnoringExit(kLibcProbeCommand, ctx, output);
    if (!rr.is_ok()) return rr;
    if (output.exit_ignored) {
        LogDebug("libc probe exited non-zero, status ignored");
    }

    std::istringstream lines(output.combined);
    for (std::string line; std::getline(lines, line);) {
        if (line.find("musl") != std::string::npos) {
            out.variant = "musl";
            break;
        }
    }

    LogDebug("platform: %s-%s", out.OsWithVariant().c_str(), out.arch.c_str());
    return Result::Ok();
}

ArchiveType ArchiveTypeFor(const PlatformId& platform) {
    return platform.IsWindows() ? ArchiveType::Zip : ArchiveType::TarGz;
}

ArchiveType HostArchiveType() {
    return ArchiveTypeFor(PlatformId{HostOs(), HostArch(), HostOs()});
}

std::string ExeName(std::string name, const PlatformId& platform) {
    if (platform.IsWindows()) name += ".exe";
    return name;
}

std::string ArchiveName(const std::string& base,
                        const std::string& version,
                        ArchiveType type,
                        const PlatformId& platform) {
    return base + "_" + version + "_" + platform.OsWithVariant() + "-" + platform.arch + "." + Extension(type);
}

std::string DistPath(const std::string& root,
                     const std::string& dist,
                     const std::string& version,
                     const std::string& archive_name) {
    return JoinDistPath({root, dist, version, archive_name});
}

} // namespace migfetch
