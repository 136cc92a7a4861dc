#include "migfetch/binary_fetcher.hpp"

#include "util/logger.hpp"

#include <memory>

namespace migfetch {

BinaryFetcher::BinaryFetcher(IFetcher& fetcher, PlatformId platform)
    : BinaryFetcher(fetcher, std::move(platform), Options{}) {}

BinaryFetcher::BinaryFetcher(IFetcher& fetcher, PlatformId platform, Options opt)
    : fetcher_(fetcher), platform_(std::move(platform)), opt_(std::move(opt)) {}

Result BinaryFetcher::FetchBinary(const CancelContext& ctx,
                                  const std::string& dist,
                                  const std::string& version,
                                  const std::string& archive_name,
                                  const std::string& binary_name,
                                  const std::string& output,
                                  InstallResult& out) const {
    const DistributionTarget target =
        DistributionTarget::Make(dist, version, archive_name, binary_name, output, platform_);

    // Occupied output fails before anything is downloaded.
    std::string final_path;
    auto dr = ArchiveInstaller::ResolveOutputPath(target.output, target.binary_name, final_path);
    if (!dr.is_ok()) return dr;

    const ArchiveType type = ArchiveTypeFor(platform_);
    const std::string arc_file = ArchiveName(target.archive_name, target.version, type, platform_);
    const std::string arc_path = DistPath(opt_.dist_root, target.dist, target.version, arc_file);

    LogInfo("fetching %s", arc_path.c_str());

    std::unique_ptr<FetchStream> stream;
    auto fr = fetcher_.Fetch(ctx, arc_path, stream);
    if (!fr.is_ok()) return fr;

    ArchiveInstaller::Options iopt;
    iopt.archive_type = type;
    iopt.staging_base_dir = opt_.staging_base_dir;
    iopt.cancel = &ctx;
    ArchiveInstaller installer(iopt);

    auto ir = installer.Install(*stream, target, out);
    stream->Close();
    return ir;
}

} // namespace migfetch
