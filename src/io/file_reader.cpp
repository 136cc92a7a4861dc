#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace migfetch {

Result FileReader::Open(const std::string& path, FileReader& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(ErrorKind::IO, e, "Failed to open input: " + path + " (" + std::strerror(e) + ")");
    }

    // Pipes and other special files report no size.
    struct stat st{};
    out.size_ = std::nullopt;
    if (::fstat(fd.Get(), &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }
    out.fd_ = std::move(fd);
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace migfetch
