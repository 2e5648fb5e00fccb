/**
 * @file process_runner.cpp
 * @brief fork/execvp process runner with stderr relay and signal forwarding.
 *
 * Exec failures are reported through a close-on-exec status pipe: if execvp succeeds the
 * pipe closes with no data, otherwise the child writes its errno before exiting.
 */

#include "process_runner.hpp"
#include <array>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <format>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t gChildPid = 0;

constexpr std::array<int, 3> kForwardedSignals = {SIGINT, SIGTERM, SIGHUP};
constexpr size_t kDiagnosticTail = 4096;

void forwardSignal(int sig) {
    pid_t child = static_cast<pid_t>(gChildPid);
    if (child > 0) {
        ::kill(child, sig);
    }
}

/**
 * @brief Installs the forwarding handlers for the lifetime of one child.
 */
class SignalForwarder {
public:
    explicit SignalForwarder(pid_t child) {
        gChildPid = child;
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = forwardSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        for (size_t i = 0; i < kForwardedSignals.size(); ++i) {
            sigaction(kForwardedSignals[i], &sa, &previous[i]);
        }
    }

    ~SignalForwarder() {
        for (size_t i = 0; i < kForwardedSignals.size(); ++i) {
            sigaction(kForwardedSignals[i], &previous[i], nullptr);
        }
        gChildPid = 0;
    }

    SignalForwarder(const SignalForwarder&) = delete;
    SignalForwarder& operator=(const SignalForwarder&) = delete;

private:
    std::array<struct sigaction, kForwardedSignals.size()> previous{};
};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::optional<std::string> lastLine(const std::string& text) {
    size_t end = text.size();
    while (end > 0) {
        // Progress meters redraw with '\r', so both separators end a line.
        size_t start = text.find_last_of("\r\n", end - 1);
        size_t begin = (start == std::string::npos) ? 0 : start + 1;
        if (begin < end) {
            return text.substr(begin, end - begin);
        }
        if (start == std::string::npos) {
            break;
        }
        end = start;
    }
    return std::nullopt;
}

// Blocks the forwarded signals until the parent has installed its handlers.
class SignalBlock {
public:
    SignalBlock() {
        sigset_t blocked;
        sigemptyset(&blocked);
        for (int sig : kForwardedSignals) {
            sigaddset(&blocked, sig);
        }
        ::sigprocmask(SIG_BLOCK, &blocked, &saved);
    }

    ~SignalBlock() { release(); }

    void release() {
        if (active) {
            ::sigprocmask(SIG_SETMASK, &saved, nullptr);
            active = false;
        }
    }

    const sigset_t& savedMask() const { return saved; }

    SignalBlock(const SignalBlock&) = delete;
    SignalBlock& operator=(const SignalBlock&) = delete;

private:
    sigset_t saved{};
    bool active = true;
};

[[noreturn]] void childExec(const std::vector<std::string>& argv,
                            const std::optional<std::filesystem::path>& workingDirectory,
                            const sigset_t& mask, int statusFd, int stderrFd) {
    ::sigprocmask(SIG_SETMASK, &mask, nullptr);
    if (::dup2(stderrFd, STDERR_FILENO) < 0) {
        int err = errno;
        ssize_t ignored = ::write(statusFd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }
    if (workingDirectory && ::chdir(workingDirectory->c_str()) != 0) {
        int err = errno;
        ssize_t ignored = ::write(statusFd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    ::execvp(cargv[0], cargv.data());
    int err = errno;
    ssize_t ignored = ::write(statusFd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // namespace

std::expected<ProcessResult, TransferError> PosixProcessRunner::run(
    const std::vector<std::string>& argv,
    const std::optional<std::filesystem::path>& workingDirectory) {
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(TransferError(ErrorKind::SpawnFailed, "empty command"));
    }
    const std::string& program = argv.front();

    int statusPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
        return std::unexpected(TransferError(ErrorKind::SpawnFailed,
            std::format("cannot start {}: {}", program, std::strerror(errno))));
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeFd(statusPipe[0]);
        closeFd(statusPipe[1]);
        return std::unexpected(TransferError(ErrorKind::SpawnFailed,
            std::format("cannot start {}: {}", program, std::strerror(err))));
    }

    SignalBlock block;
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeFd(statusPipe[0]);
        closeFd(statusPipe[1]);
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        return std::unexpected(TransferError(ErrorKind::SpawnFailed,
            std::format("cannot start {}: {}", program, std::strerror(err))));
    }
    if (pid == 0) {
        childExec(argv, workingDirectory, block.savedMask(), statusPipe[1], stderrPipe[1]);
    }

    SignalForwarder forwarder(pid);
    block.release();
    closeFd(statusPipe[1]);
    closeFd(stderrPipe[1]);

    int execErrno = 0;
    ssize_t got = 0;
    do {
        got = ::read(statusPipe[0], &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    closeFd(statusPipe[0]);
    bool execFailed = got == static_cast<ssize_t>(sizeof(execErrno));

    std::string tail;
    std::array<char, 4096> buf;
    while (true) {
        ssize_t n = ::read(stderrPipe[0], buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) {
            break;
        }
        ssize_t written = 0;
        while (written < n) {
            ssize_t w = ::write(STDERR_FILENO, buf.data() + written, static_cast<size_t>(n - written));
            if (w < 0) {
                if (errno == EINTR) continue;
                break;
            }
            written += w;
        }
        tail.append(buf.data(), static_cast<size_t>(n));
        if (tail.size() > kDiagnosticTail) {
            tail.erase(0, tail.size() - kDiagnosticTail);
        }
    }
    closeFd(stderrPipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(TransferError(ErrorKind::SpawnFailed,
                std::format("lost track of {}: {}", program, std::strerror(errno))));
        }
    }

    if (execFailed) {
        std::string reason = execErrno == ENOENT ? "executable not found in PATH" : std::strerror(execErrno);
        return std::unexpected(TransferError(ErrorKind::SpawnFailed, std::format("cannot start {}: {}", program, reason)));
    }

    ProcessResult result;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.terminatingSignal = WTERMSIG(status);
        result.exitCode = 128 + WTERMSIG(status);
    }
    result.diagnostic = lastLine(tail);
    return result;
}
