#include "migfetch/staging.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace migfetch {

namespace {

std::string DefaultTempBase() {
    if (const char* env = std::getenv("TMPDIR"); env && *env) return env;
    return "/tmp";
}

std::vector<char> Template(const std::string& dir, const std::string& prefix) {
    const std::string tmpl = (fs::path(dir) / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    return buf;
}

} // namespace

Result TempDirectory::Create(const std::string& base_dir, const std::string& prefix, TempDirectory& out) {
    const std::string base = base_dir.empty() ? DefaultTempBase() : base_dir;
    auto buf = Template(base, prefix);
    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int e = errno;
        return Result::Fail(ErrorKind::IO, e, "mkdtemp failed in " + base + ": " + std::strerror(e));
    }
    out = TempDirectory();
    out.path_ = created;
    return Result::Ok();
}

TempDirectory::TempDirectory() = default;
TempDirectory::TempDirectory(TempDirectory&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}
TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempDirectory::~TempDirectory() { Cleanup(); }

const std::string& TempDirectory::Path() const { return path_; }

void TempDirectory::Cleanup() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LogWarn("cannot remove staging directory %s: %s", path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

Result TempFile::Create(const std::string& dir, const std::string& prefix, TempFile& out) {
    auto buf = Template(dir, prefix);
    const int fd = ::mkostemp(buf.data(), O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::IO, e, "mkstemp failed in " + dir + ": " + std::strerror(e));
    }
    out = TempFile();
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::ReleaseFd() { return fd_.Release(); }
const std::string& TempFile::Path() const { return path_; }

Result TempFile::Commit(const std::string& final_path) {
    fd_.Close();
    if (::rename(path_.c_str(), final_path.c_str()) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::IO, e,
                            "rename " + path_ + " -> " + final_path + " failed: " + std::strerror(e));
    }
    path_.clear();
    return Result::Ok();
}

void TempFile::Cleanup() {
    fd_.Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace migfetch
