#pragma once

#include "config/Config.hpp"

#include <stop_token>
#include <string>

namespace ds::sync {

class SyncTask;

/**
 * Performs a single sync attempt for a task and records the outcome on it.
 *
 * Order of checks: pause state, source existence, source emptiness,
 * destination creation, then either the configured mirroring tool or the
 * in-process fallback copier when the tool is not on PATH. Failures never
 * escape run(); they land in the task's last_error and output.
 */
class TaskExecutor {
public:
    TaskExecutor(SyncTask& task, const config::MirrorConfig& mirror);

    // Returns false when the attempt ended in an error
    bool run(std::stop_token stop);

private:
    SyncTask& task_;
    const config::MirrorConfig& mirror_;

    bool sourceIsEmpty() const;
    void ensureDestination() const;
    void runTool(const std::string& program, std::stop_token stop) const;
    void runFallback() const;
};

}
