#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace migfetch {

// Private directory, removed recursively when the owner goes away.
class TempDirectory {
public:
    // base_dir empty -> $TMPDIR or /tmp.
    static Result Create(const std::string& base_dir, const std::string& prefix, TempDirectory& out);

    TempDirectory();
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    ~TempDirectory();

    const std::string& Path() const;

private:
    void Cleanup();

    std::string path_;
};

// mkstemp file that is unlinked on destruction unless Commit() renamed it.
class TempFile {
public:
    // Creates dir/<prefix>XXXXXX.
    static Result Create(const std::string& dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    // Hands the descriptor to a writer; the file itself stays owned here.
    int ReleaseFd();
    const std::string& Path() const;

    // Atomically moves the file to final_path and gives up ownership.
    Result Commit(const std::string& final_path);

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace migfetch
