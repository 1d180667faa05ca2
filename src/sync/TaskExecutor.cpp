#include "sync/TaskExecutor.hpp"
#include "sync/SyncTask.hpp"
#include "sync/ProcessStreamer.hpp"
#include "sync/FallbackCopier.hpp"
#include "types/SyncError.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <vector>

using namespace ds::sync;
using namespace ds::types;
using namespace ds::logging;
namespace fs = std::filesystem;

TaskExecutor::TaskExecutor(SyncTask& task, const config::MirrorConfig& mirror)
    : task_(task), mirror_(mirror) {}

bool TaskExecutor::run(const std::stop_token stop) {
    if (task_.isPaused()) {
        LogRegistry::sync()->debug("[TaskExecutor] [{}] Paused, skipping attempt", task_.id());
        return true;
    }

    task_.beginAttempt();
    LogRegistry::sync()->info("[TaskExecutor] Starting sync from {} to {}", task_.sourcePath(), task_.destPath());

    try {
        std::error_code ec;
        if (!fs::exists(task_.sourcePath(), ec) || ec)
            throw SyncException(SyncError::SourceMissing, "Source path does not exist: " + task_.sourcePath());

        if (sourceIsEmpty()) {
            task_.markSynced(fmt::format("Source directory {} is empty, nothing to sync", task_.sourcePath()));
            LogRegistry::sync()->info("[TaskExecutor] [{}] Source is empty, nothing to sync", task_.id());
            return true;
        }

        ensureDestination();

        if (const auto program = util::findExecutable(mirror_.tool)) {
            runTool(program->string(), stop);
        } else {
            task_.appendOutput(fmt::format("{} command not found, falling back to file copy method", mirror_.tool));
            LogRegistry::sync()->warn("[TaskExecutor] [{}] {} not found on PATH, using fallback copier",
                                      task_.id(), mirror_.tool);
            runFallback();
        }
        return true;
    } catch (const SyncException& e) {
        LogRegistry::sync()->error("[TaskExecutor] [{}] {} failure: {}", task_.id(), to_string(e.code()), e.what());
        task_.setError(e.what());
    } catch (const fs::filesystem_error& e) {
        LogRegistry::sync()->error("[TaskExecutor] [{}] Filesystem error: {}", task_.id(), e.what());
        task_.setError(e.what());
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[TaskExecutor] [{}] Unexpected error: {}", task_.id(), e.what());
        task_.setError(e.what());
    }
    return false;
}

bool TaskExecutor::sourceIsEmpty() const {
    std::error_code ec;
    const auto st = fs::status(task_.sourcePath(), ec);
    if (ec)
        throw SyncException(SyncError::EmptyCheckFailed,
                            fmt::format("Error checking if source directory is empty: {}", ec.message()));

    // a lone file is never "empty"; the tool or copier decides what to do with it
    if (!fs::is_directory(st)) return false;

    const fs::directory_iterator it(task_.sourcePath(), ec);
    if (ec)
        throw SyncException(SyncError::EmptyCheckFailed,
                            fmt::format("Error checking if source directory is empty: {}", ec.message()));
    return it == fs::directory_iterator();
}

void TaskExecutor::ensureDestination() const {
    std::error_code ec;
    if (fs::exists(task_.destPath(), ec)) return;

    fs::create_directories(task_.destPath(), ec);
    if (ec)
        throw SyncException(SyncError::DestinationCreateFailed,
                            fmt::format("Failed to create destination directory: {}", ec.message()));

    task_.appendOutput("Created destination directory: " + task_.destPath());
    LogRegistry::sync()->info("[TaskExecutor] Created destination directory {}", task_.destPath());
}

void TaskExecutor::runTool(const std::string& program, const std::stop_token stop) const {
    std::vector<std::string> argv{program};
    for (const auto& arg : mirror_.args) {
        if (config::isDestructiveMirrorArg(arg)) {
            LogRegistry::sync()->warn("[TaskExecutor] [{}] Dropping mirror argument {}", task_.id(), arg);
            task_.appendOutput("Ignoring destructive mirror argument: " + arg);
            continue;
        }
        argv.push_back(arg);
    }

    // trailing slash: mirror the contents, not the directory itself
    auto source = task_.sourcePath();
    if (fs::is_directory(source) && source.back() != '/') source += '/';
    argv.push_back(source);
    argv.push_back(task_.destPath());

    LogRegistry::sync()->debug("[TaskExecutor] [{}] Running {}", task_.id(), fmt::join(argv, " "));

    const ProcessStreamer streamer(
        std::move(argv),
        [this](const std::string_view line) { task_.appendOutput(line); },
        [this](const std::string_view line) { task_.appendOutput(fmt::format("ERROR: {}", line)); });

    const auto result = streamer.run(stop);

    if (result.cancelled) {
        task_.markCancelled("Sync cancelled");
        LogRegistry::sync()->info("[TaskExecutor] [{}] {} cancelled", task_.id(), mirror_.tool);
        return;
    }

    if (result.exitStatus != 0)
        throw SyncException(SyncError::ExecutionFailed,
                            fmt::format("{} error: exit status {}", mirror_.tool, result.exitStatus));

    task_.markSynced("Sync completed successfully");
    LogRegistry::sync()->info("[TaskExecutor] [{}] Sync completed successfully", task_.id());
}

void TaskExecutor::runFallback() const {
    const FallbackCopier copier(task_.sourcePath(), task_.destPath());
    const auto files = copier.copy([this](const std::string& line) { task_.appendOutput(line); });

    task_.markSynced(fmt::format("Completed: {} files copied", files));
    LogRegistry::sync()->info("[TaskExecutor] [{}] Fallback copy completed, {} files", task_.id(), files);
}
