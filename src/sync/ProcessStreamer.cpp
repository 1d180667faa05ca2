#include "sync/ProcessStreamer.hpp"
#include "types/SyncError.hpp"
#include "logging/LogRegistry.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <fmt/core.h>

using namespace ds::sync;
using namespace ds::types;
using namespace ds::logging;

namespace {

// Close-on-exec pipe, so concurrent spawns from other tasks never inherit our ends
class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) == -1)
            throw SyncException(SyncError::ToolInvocationFailed,
                                fmt::format("Failed to create pipe: {}", std::strerror(errno)));
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int readEnd() const { return fds_[0]; }
    [[nodiscard]] int writeEnd() const { return fds_[1]; }

    void closeRead() { closeFd(fds_[0]); }
    void closeWrite() { closeFd(fds_[1]); }

private:
    int fds_[2]{-1, -1};

    static void closeFd(int& fd) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

int waitForExit(const pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1)
        if (errno != EINTR) return -1;

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

ProcessStreamer::ProcessStreamer(std::vector<std::string> argv, LineHandler onStdout, LineHandler onStderr)
    : argv_(std::move(argv)), onStdout_(std::move(onStdout)), onStderr_(std::move(onStderr)) {}

ProcessStreamer::Result ProcessStreamer::run(std::stop_token stop) const {
    if (argv_.empty()) throw SyncException(SyncError::ToolInvocationFailed, "No program given to run");
    if (stop.stop_requested()) return {.exitStatus = 0, .cancelled = true};

    // argv is built before fork(); the child must not allocate
    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (const auto& a : argv_) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    Pipe out, err, execErr;

    const pid_t pid = ::fork();
    if (pid < 0)
        throw SyncException(SyncError::ToolInvocationFailed,
                            fmt::format("Failed to fork {}: {}", argv_.front(), std::strerror(errno)));

    if (pid == 0) {
        ::setpgid(0, 0);
        if (const int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC); devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(out.writeEnd(), STDOUT_FILENO);
        ::dup2(err.writeEnd(), STDERR_FILENO);

        ::execvp(args[0], args.data());

        const int execErrno = errno;
        (void)!::write(execErr.writeEnd(), &execErrno, sizeof execErrno);
        ::_exit(127);
    }

    ::setpgid(pid, pid); // also from the parent, whichever side runs first wins
    out.closeWrite();
    err.closeWrite();
    execErr.closeWrite();

    // Reads EOF once exec succeeded and the close-on-exec end went away
    int execErrno = 0;
    ssize_t n = 0;
    do n = ::read(execErr.readEnd(), &execErrno, sizeof execErrno);
    while (n == -1 && errno == EINTR);

    if (n > 0) {
        waitForExit(pid);
        throw SyncException(SyncError::ToolInvocationFailed,
                            fmt::format("Failed to start {}: {}", argv_.front(), std::strerror(execErrno)));
    }

    LogRegistry::sync()->debug("[ProcessStreamer] Started {} (pid {})", argv_.front(), pid);

    std::mutex reapMutex;
    bool reaped = false;
    std::atomic<bool> cancelled{false};
    Result result;

    {
        std::stop_callback onStop(stop, [&] {
            std::scoped_lock lock(reapMutex);
            if (reaped) return;
            cancelled.store(true);
            ::kill(-pid, SIGKILL);
        });

        // stderr gets its own reader thread, stdout is drained on this one
        std::thread stderrReader;
        try {
            stderrReader = std::thread([&] { drain(err.readEnd(), onStderr_); });
        } catch (const std::system_error& e) {
            ::kill(-pid, SIGKILL);
            waitForExit(pid);
            std::scoped_lock lock(reapMutex);
            reaped = true;
            throw SyncException(SyncError::ToolInvocationFailed,
                                fmt::format("Failed to stream output of {}: {}", argv_.front(), e.what()));
        }

        drain(out.readEnd(), onStdout_);
        stderrReader.join();

        result.exitStatus = waitForExit(pid);
        std::scoped_lock lock(reapMutex);
        reaped = true;
    }

    // a stop that only reached an already exited child does not undo a clean run
    result.cancelled = cancelled.load() && result.exitStatus != 0;
    LogRegistry::sync()->debug("[ProcessStreamer] {} (pid {}) finished with status {}{}",
                               argv_.front(), pid, result.exitStatus, result.cancelled ? " after stop request" : "");
    return result;
}

void ProcessStreamer::drain(const int fd, const LineHandler& handler) {
    std::array<char, 4096> buf{};
    std::string pending;

    const auto emit = [&handler](std::string_view line) {
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        try {
            handler(line);
        } catch (const std::exception& e) {
            LogRegistry::sync()->error("[ProcessStreamer] Line handler failed: {}", e.what());
        }
    };

    while (true) {
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            LogRegistry::sync()->warn("[ProcessStreamer] Read from pipe failed: {}", std::strerror(errno));
            break;
        }

        pending.append(buf.data(), static_cast<size_t>(n));

        size_t start = 0;
        for (size_t nl; (nl = pending.find('\n', start)) != std::string::npos; start = nl + 1)
            emit(std::string_view(pending).substr(start, nl - start));
        pending.erase(0, start);
    }

    if (!pending.empty()) emit(pending);
}
