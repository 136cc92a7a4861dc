#pragma once
#include <string>
#include <utility>

namespace migfetch {

enum class ErrorKind : int {
    None = 0,
    Read,          // version list unreadable or unscannable
    NotFound,      // no qualifying version
    Transport,     // daemon and HTTP attempts both failed
    AlreadyExists, // output path occupied by a non-directory
    IO,            // filesystem or staging failure
    Extract,       // expected entry missing from archive, or codec failure
    Exec,          // probe command could not be launched
    Cancelled,
    Config,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .err = -1, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }

    // Same failure with extra context in front of the message.
    Result Wrap(const std::string& context) const {
        if (ok) return *this;
        return {.ok = false, .kind = kind, .err = err, .msg = context + ": " + msg};
    }
};

} // namespace migfetch
