/// @file process_runner.cpp
/// @brief fork/exec runner for external_command actions.

#include "edext/action/process_runner.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using edext::foundation::EngineError;
using edext::foundation::EngineResult;
using edext::foundation::ErrorCode;

namespace edext::action {

namespace {

/// Owns a file descriptor; closes it on destruction.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.release()) {}
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    Fd read;
    Fd write;
};

bool makePipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return true;
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

EngineResult<CommandOutput> spawnError(const std::string& what) {
    return EngineResult<CommandOutput>::err(
        EngineError(ErrorCode::CommandSpawnFailed, what + ": " + std::strerror(errno)));
}

/// Child side: wire the pipes to fds 0-2 and exec the shell. Never returns.
[[noreturn]] void execChild(const CommandRequest& request, Pipe& in, Pipe& out, Pipe& err) {
    (void)::dup2(in.read.get(), STDIN_FILENO);
    (void)::dup2(out.write.get(), STDOUT_FILENO);
    (void)::dup2(err.write.get(), STDERR_FILENO);

    if (!request.workingDirectory.empty() && ::chdir(request.workingDirectory.c_str()) != 0) {
        std::string msg = "cannot change directory to " + request.workingDirectory.string() +
                          ": " + std::strerror(errno) + "\n";
        (void)!::write(STDERR_FILENO, msg.data(), msg.size());
        ::_exit(126);
    }

    ::execl(request.shell.c_str(), request.shell.c_str(), "-c", request.command.c_str(),
            static_cast<char*>(nullptr));

    std::string msg = "cannot execute " + request.shell + ": " + std::strerror(errno) + "\n";
    (void)!::write(STDERR_FILENO, msg.data(), msg.size());
    ::_exit(127);
}

/// Append up to the remaining budget; sets @p truncated when bytes are dropped.
void appendLimited(std::string& dst, const char* data, std::size_t n, std::size_t limit,
                   bool& truncated) {
    std::size_t room = limit > dst.size() ? limit - dst.size() : 0;
    if (n > room) {
        truncated = true;
        n = room;
    }
    dst.append(data, n);
}

} // namespace

EngineResult<CommandOutput> runCommand(const CommandRequest& request) {
    ignoreSigpipe();

    Pipe in;
    Pipe out;
    Pipe err;
    if (!makePipe(in) || !makePipe(out) || !makePipe(err)) {
        return spawnError("pipe failed");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return spawnError("fork failed");
    }
    if (pid == 0) {
        execChild(request, in, out, err);
    }

    // Parent keeps the write end of stdin and the read ends of stdout/stderr.
    in.read.reset();
    out.write.reset();
    err.write.reset();

    Fd stdinFd = std::move(in.write);
    Fd stdoutFd = std::move(out.read);
    Fd stderrFd = std::move(err.read);

    std::string_view pending;
    if (request.input && !request.input->empty()) {
        pending = *request.input;
        setNonBlocking(stdinFd.get());
    } else {
        stdinFd.reset();
    }
    setNonBlocking(stdoutFd.get());
    setNonBlocking(stderrFd.get());

    CommandOutput result;
    std::array<char, 4096> buf{};

    while (stdoutFd.valid() || stderrFd.valid()) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int stdinIdx = -1;
        int stdoutIdx = -1;
        int stderrIdx = -1;
        if (stdinFd.valid()) {
            stdinIdx = static_cast<int>(count);
            fds[count++] = {stdinFd.get(), POLLOUT, 0};
        }
        if (stdoutFd.valid()) {
            stdoutIdx = static_cast<int>(count);
            fds[count++] = {stdoutFd.get(), POLLIN, 0};
        }
        if (stderrFd.valid()) {
            stderrIdx = static_cast<int>(count);
            fds[count++] = {stderrFd.get(), POLLIN, 0};
        }

        if (::poll(fds.data(), count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        if (stdinIdx >= 0 && fds[stdinIdx].revents != 0) {
            ssize_t n = ::write(stdinFd.get(), pending.data(), pending.size());
            if (n > 0) {
                pending.remove_prefix(static_cast<std::size_t>(n));
            }
            // EPIPE: the child stopped reading; the rest of the input is dropped.
            if (pending.empty() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
                stdinFd.reset();
            }
        }

        auto drain = [&](int idx, Fd& fd, std::string& dst) {
            if (idx < 0 || fds[idx].revents == 0) {
                return;
            }
            ssize_t n = ::read(fd.get(), buf.data(), buf.size());
            if (n > 0) {
                appendLimited(dst, buf.data(), static_cast<std::size_t>(n),
                              request.outputLimitBytes, result.truncated);
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                fd.reset();
            }
        };
        drain(stdoutIdx, stdoutFd, result.stdoutText);
        drain(stderrIdx, stderrFd, result.stderrText);
    }
    stdinFd.reset();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return spawnError("waitpid failed");
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exitCode = 128 + WTERMSIG(status);
    }
    return EngineResult<CommandOutput>::ok(std::move(result));
}

} // namespace edext::action
