#pragma once

#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace ds::sync {

/**
 * Runs an external program and streams its stdout and stderr line by line.
 *
 * stdout and stderr are drained concurrently; handlers may be invoked
 * concurrently and must synchronize whatever they share. The child runs in its
 * own process group, so a stop request kills the program together with any
 * helpers it forked.
 *
 * Spawn failures (pipe, fork, exec) throw SyncException with
 * SyncError::ToolInvocationFailed. A nonzero exit is reported in the result.
 */
class ProcessStreamer {
public:
    using LineHandler = std::function<void(std::string_view line)>;

    struct Result {
        int exitStatus = 0;      // exit code, or 128 + signal when killed by a signal
        bool cancelled = false;  // stop was requested and the process did not exit cleanly
    };

    ProcessStreamer(std::vector<std::string> argv, LineHandler onStdout, LineHandler onStderr);

    Result run(std::stop_token stop) const;

private:
    std::vector<std::string> argv_;
    LineHandler onStdout_;
    LineHandler onStderr_;

    static void drain(int fd, const LineHandler& handler);
};

}
