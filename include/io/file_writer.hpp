#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace migfetch {

class FileWriter final : public IWriter {
  public:
    // Creates or truncates path.
    static Result Open(std::string path, FileWriter& out, mode_t mode = 0644);
    // Takes ownership of an already open descriptor (e.g. from mkstemp).
    static Result Adopt(int fd, std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace migfetch
