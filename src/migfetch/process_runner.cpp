// process_runner.cpp - fork/exec runner behind PlatformProbe.

#include "migfetch/platform.hpp"

#include "io/fd.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace migfetch {

namespace {

constexpr int kPollIntervalMs = 100;

Result MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::Exec, e, std::string("pipe failed: ") + std::strerror(e));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

int WaitChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

class PosixProcessRunner final : public PlatformProbe::IProcessRunner {
  public:
    Result RunShellIgnoringExit(const std::string& command,
                                const CancelContext& ctx,
                                Output& out) const override {
        out = Output{};

        auto cr = ctx.Check("run '" + command + "'");
        if (!cr.is_ok()) return cr;

        Fd out_r, out_w;
        auto pr = MakePipe(out_r, out_w);
        if (!pr.is_ok()) return pr;

        // Closed by a successful exec; carries errno back when exec fails.
        Fd exec_r, exec_w;
        pr = MakePipe(exec_r, exec_w);
        if (!pr.is_ok()) return pr;

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int e = errno;
            return Result::Fail(ErrorKind::Exec, e, "fork failed for '" + command + "': " + std::strerror(e));
        }

        if (pid == 0) {
            // child: only async-signal-safe calls from here on
            ::dup2(out_w.Get(), STDOUT_FILENO);
            ::dup2(out_w.Get(), STDERR_FILENO);
            ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            const int e = errno;
            (void)!::write(exec_w.Get(), &e, sizeof(e));
            ::_exit(127);
        }

        out_w.Close();
        exec_w.Close();

        int exec_errno = 0;
        ssize_t en;
        do {
            en = ::read(exec_r.Get(), &exec_errno, sizeof(exec_errno));
        } while (en < 0 && errno == EINTR);
        if (en == static_cast<ssize_t>(sizeof(exec_errno))) {
            (void)WaitChild(pid);
            return Result::Fail(ErrorKind::Exec, exec_errno,
                                "cannot launch /bin/sh for '" + command + "': " + std::strerror(exec_errno));
        }

        char buf[4096];
        while (true) {
            if (ctx.IsCancelled()) {
                ::kill(pid, SIGKILL);
                (void)WaitChild(pid);
                return Result::Fail(ErrorKind::Cancelled, "run '" + command + "': operation cancelled");
            }

            pollfd pfd{out_r.Get(), POLLIN, 0};
            const int pn = ::poll(&pfd, 1, kPollIntervalMs);
            if (pn < 0) {
                if (errno == EINTR) continue;
                const int e = errno;
                ::kill(pid, SIGKILL);
                (void)WaitChild(pid);
                return Result::Fail(ErrorKind::Exec, e, std::string("poll failed: ") + std::strerror(e));
            }
            if (pn == 0) continue;

            const ssize_t n = ::read(out_r.Get(), buf, sizeof(buf));
            if (n > 0) {
                out.combined.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) break;
            if (errno == EINTR) continue;
            break;
        }

        const int status = WaitChild(pid);
        if (status < 0) {
            const int e = errno;
            return Result::Fail(ErrorKind::Exec, e, std::string("waitpid failed: ") + std::strerror(e));
        }
        out.exit_ignored = !(WIFEXITED(status) && WEXITSTATUS(status) == 0);
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const PlatformProbe::IProcessRunner> PlatformProbe::DefaultProcessRunner() {
    static const std::shared_ptr<const IProcessRunner> kDefault = std::make_shared<PosixProcessRunner>();
    return kDefault;
}

} // namespace migfetch
