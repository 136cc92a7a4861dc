#include "util/result.hpp"

namespace migfetch {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "ok";
        case ErrorKind::Read:          return "read error";
        case ErrorKind::NotFound:      return "not found";
        case ErrorKind::Transport:     return "transport error";
        case ErrorKind::AlreadyExists: return "already exists";
        case ErrorKind::IO:            return "io error";
        case ErrorKind::Extract:       return "extract error";
        case ErrorKind::Exec:          return "exec error";
        case ErrorKind::Cancelled:     return "cancelled";
        case ErrorKind::Config:        return "config error";
    }
    return "error";
}

} // namespace migfetch
