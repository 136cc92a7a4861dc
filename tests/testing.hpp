#pragma once

#include "io/io.hpp"
#include "migfetch/fetcher.hpp"
#include "migfetch/platform.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/migfetch_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

    std::string Sub(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

class MemoryReader final : public migfetch::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

// `size` zero bytes without allocating them. Counts its live instances so
// tests can observe release.
class ZeroReader final : public migfetch::IReader {
  public:
    explicit ZeroReader(std::uint64_t size, int* live = nullptr) : left_(size), live_(live) {
        if (live_) ++*live_;
    }
    ~ZeroReader() override {
        if (live_) --*live_;
    }

    ssize_t Read(std::span<std::uint8_t> out) override {
        const auto n = static_cast<size_t>(std::min<std::uint64_t>(out.size(), left_));
        std::fill_n(out.begin(), n, std::uint8_t{0});
        left_ -= n;
        return static_cast<ssize_t>(n);
    }

  private:
    std::uint64_t left_;
    int* live_;
};

// Fails every read.
class BrokenReader final : public migfetch::IReader {
  public:
    ssize_t Read(std::span<std::uint8_t>) override { return -1; }
};

struct ArchiveFileEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

enum class ArchiveFormat {
    TarGz,
    Zip,
};

inline std::vector<std::uint8_t> BuildArchive(ArchiveFormat format, const std::vector<ArchiveFileEntry>& entries) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    int rc = ARCHIVE_OK;
    if (format == ArchiveFormat::TarGz) {
        rc = archive_write_set_format_pax_restricted(a);
        if (rc == ARCHIVE_OK)
            rc = archive_write_add_filter_gzip(a);
    } else {
        rc = archive_write_set_format_zip(a);
    }
    if (rc != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive format setup failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline std::string ReadAll(migfetch::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::string& path, const std::string& data) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    os << data;
}

inline migfetch::PlatformId LinuxAmd64() {
    return {.os = "linux", .arch = "amd64", .variant = "linux"};
}

inline migfetch::PlatformId WindowsAmd64() {
    return {.os = "windows", .arch = "amd64", .variant = "windows"};
}

// Serves fixed content per logical path and records every request.
class FakeFetcher final : public migfetch::IFetcher {
  public:
    void Serve(const std::string& path, std::string content) { content_[path] = std::move(content); }
    void Serve(const std::string& path, const std::vector<std::uint8_t>& content) {
        content_[path] = std::string(content.begin(), content.end());
    }

    migfetch::Result Fetch(const migfetch::CancelContext& ctx,
                           const std::string& logical_path,
                           std::unique_ptr<migfetch::FetchStream>& out) override {
        requests.push_back(logical_path);
        auto cr = ctx.Check("fetch " + logical_path);
        if (!cr.is_ok()) return cr;

        auto it = content_.find(logical_path);
        if (it == content_.end()) {
            return migfetch::Result::Fail(migfetch::ErrorKind::Transport,
                                          "GET " + logical_path + " error: 404 Not Found: no link named");
        }
        out = std::make_unique<migfetch::FetchStream>(std::make_unique<MemoryReader>(it->second),
                                                      migfetch::kFetchSizeLimit);
        return migfetch::Result::Ok();
    }

    std::vector<std::string> requests;

  private:
    std::map<std::string, std::string> content_;
};

} // namespace testutil
