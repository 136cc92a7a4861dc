#include "migfetch/archive_installer.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "migfetch/archive_reader_adapter.hpp"
#include "migfetch/staging.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace migfetch {

namespace {

constexpr mode_t kExecutableMode = 0755;

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchivePtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// Streams the current entry's data into w.
Result CopyEntryData(archive* ar, IWriter& w, const CancelContext* cancel) {
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        if (cancel) {
            auto cr = cancel->Check("extract");
            if (!cr.is_ok()) return cr;
        }
        const la_ssize_t n = archive_read_data(ar, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Extract, "archive_read_data: " + ArchiveErr(ar));

        auto wr = w.WriteAll({buf.data(), static_cast<size_t>(n)});
        if (!wr.is_ok()) return wr;
    }
    return Result::Ok();
}

} // namespace

DistributionTarget DistributionTarget::Make(std::string dist,
                                            std::string version,
                                            std::string archive_name,
                                            std::string binary_name,
                                            std::string output,
                                            const PlatformId& platform) {
    if (archive_name.empty()) archive_name = dist;
    if (binary_name.empty()) binary_name = archive_name;

    DistributionTarget t;
    t.dist = std::move(dist);
    t.version = std::move(version);
    t.archive_name = std::move(archive_name);
    t.binary_name = ExeName(std::move(binary_name), platform);
    t.output = std::move(output);
    return t;
}

ArchiveInstaller::ArchiveInstaller() = default;

ArchiveInstaller::ArchiveInstaller(Options opt) : opt_(std::move(opt)) {}

Result ArchiveInstaller::ResolveOutputPath(const std::string& output,
                                           const std::string& binary_name,
                                           std::string& out_path) {
    if (output.empty()) return Result::Fail(ErrorKind::IO, "output path is empty");

    struct stat st{};
    if (::stat(output.c_str(), &st) != 0) {
        const int e = errno;
        if (e == ENOENT) {
            out_path = output;
            return Result::Ok();
        }
        return Result::Fail(ErrorKind::IO, e, "stat " + output + ": " + std::strerror(e));
    }

    if (!S_ISDIR(st.st_mode)) {
        return Result::Fail(ErrorKind::AlreadyExists, EEXIST, "output " + output + ": file already exists");
    }

    out_path = (fs::path(output) / binary_name).string();
    return Result::Ok();
}

Result ArchiveInstaller::Install(IReader& archive_stream,
                                 const DistributionTarget& target,
                                 InstallResult& out) const {
    std::string final_path;
    auto dr = ResolveOutputPath(target.output, target.binary_name, final_path);
    if (!dr.is_ok()) return dr;

    TempDirectory staging;
    auto sr = TempDirectory::Create(opt_.staging_base_dir, target.archive_name + "-", staging);
    if (!sr.is_ok()) return sr;

    const std::string arc_path =
        (fs::path(staging.Path()) / ("archive." + std::string(Extension(opt_.archive_type)))).string();
    {
        FileWriter writer;
        auto wo = FileWriter::Open(arc_path, writer);
        if (!wo.is_ok()) return wo;

        std::uint64_t copied = 0;
        auto cr = CopyAll(archive_stream, writer, opt_.cancel, &copied);
        if (!cr.is_ok()) {
            if (cr.kind == ErrorKind::Cancelled) return cr;
            return Result::Fail(ErrorKind::IO, cr.err, "staging archive " + arc_path + ": " + cr.msg);
        }
        auto cl = writer.Close();
        if (!cl.is_ok()) return cl;

        LogInfo("staged %llu archive bytes for %s %s",
                (unsigned long long)copied, target.dist.c_str(), target.version.c_str());
    }

    auto xr = ExtractEntry(arc_path, target, final_path);
    if (!xr.is_ok()) return xr;

    LogInfo("installed %s", final_path.c_str());
    out.path = final_path;
    return Result::Ok();
}

Result ArchiveInstaller::ExtractEntry(const std::string& archive_path,
                                      const DistributionTarget& target,
                                      const std::string& final_path) const {
    // Source chain for tar.gz; libarchive reads zip straight from the file
    // since it needs the central directory. Declared first so it outlives
    // the archive handle reading from it.
    std::unique_ptr<IReader> source;

    ArchivePtr ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::Extract, "archive_read_new failed");
    if (opt_.archive_type == ArchiveType::Zip) {
        archive_read_support_format_zip(ar.get());
        if (archive_read_open_filename(ar.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::Extract, "cannot open zip archive: " + ArchiveErr(ar.get()));
        }
    } else {
        auto file = std::make_unique<FileReader>();
        auto fr = FileReader::Open(archive_path, *file);
        if (!fr.is_ok()) return fr;
        try {
            source = std::make_unique<GzipReader>(std::move(file));
        } catch (const std::exception& e) {
            return Result::Fail(ErrorKind::Extract, std::string("Gzip init failed: ") + e.what());
        }

        archive_read_support_format_tar(ar.get());
        if (OpenArchiveFromReader(ar.get(), *source, opt_.cancel) != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::Extract, "cannot open tar.gz archive: " + ArchiveErr(ar.get()));
        }
    }

    const std::string nested_name = target.dist + "/" + target.binary_name;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            if (opt_.cancel && opt_.cancel->IsCancelled()) {
                return Result::Fail(ErrorKind::Cancelled, "extract: operation cancelled");
            }
            return Result::Fail(ErrorKind::Extract, "archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        const char* raw = archive_entry_pathname(entry);
        const std::string name = NormalizeTarPath(raw ? std::string(raw) : std::string());
        if (archive_entry_filetype(entry) != AE_IFREG || (name != target.binary_name && name != nested_name)) {
            LogDebug("skip archive entry: %s", name.c_str());
            continue;
        }

        LogDebug("extract %s -> %s", name.c_str(), final_path.c_str());

        // Written beside the destination and renamed into place, so the
        // final path never holds a partial binary.
        const fs::path dest(final_path);
        const std::string dest_dir = dest.has_parent_path() ? dest.parent_path().string() : ".";
        TempFile tmp;
        auto tr = TempFile::Create(dest_dir, "." + dest.filename().string() + ".", tmp);
        if (!tr.is_ok()) return tr;

        FileWriter writer;
        auto ar_res = FileWriter::Adopt(tmp.ReleaseFd(), tmp.Path(), writer);
        if (!ar_res.is_ok()) return ar_res;

        auto cr = CopyEntryData(ar.get(), writer, opt_.cancel);
        if (!cr.is_ok()) return cr.Wrap("extract " + name);

        auto fs_res = writer.FsyncNow();
        if (!fs_res.is_ok()) return fs_res;
        auto cl_res = writer.Close();
        if (!cl_res.is_ok()) return cl_res;

        if (::chmod(tmp.Path().c_str(), kExecutableMode) != 0) {
            const int e = errno;
            return Result::Fail(ErrorKind::IO, e, "chmod " + tmp.Path() + ": " + std::strerror(e));
        }

        return tmp.Commit(final_path);
    }

    return Result::Fail(ErrorKind::Extract,
                        "no binary named " + target.binary_name + " found in archive for " + target.dist);
}

} // namespace migfetch
