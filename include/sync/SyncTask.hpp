#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "types/SyncStatus.hpp"

#include <chrono>
#include <condition_variable>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace ds::sync {

class TaskExecutor;

/**
 * One configured source/destination pair and the loop that keeps it mirrored.
 *
 * The loop thread is the only place an attempt runs, so attempts for one task
 * never overlap. Trigger, pause and resume wake the loop immediately; pausing
 * also cancels an in-flight mirroring tool run.
 */
class SyncTask final : public concurrency::AsyncService {
public:
    using clock = std::chrono::system_clock;

    SyncTask(std::string sourcePath, std::string destPath,
             std::chrono::seconds interval, config::MirrorConfig mirror = {});

    ~SyncTask() override;

    void stop() override;

    void triggerSync();
    void pauseSync();
    void resumeSync();

    [[nodiscard]] types::SyncStatus getStatus() const;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& sourcePath() const { return sourcePath_; }
    [[nodiscard]] const std::string& destPath() const { return destPath_; }
    [[nodiscard]] std::chrono::seconds interval() const { return interval_; }

    // Runs one attempt on the calling thread. Refused while the loop is running.
    bool syncNow();

    static std::string makeId(const std::string& sourcePath, const std::string& destPath);

protected:
    void runLoop() override;

private:
    friend class TaskExecutor;

    const std::string id_;
    const std::string sourcePath_;
    const std::string destPath_;
    const std::chrono::seconds interval_;
    const config::MirrorConfig mirror_;

    mutable std::shared_mutex mutex_;
    std::condition_variable_any wake_;

    bool isSyncing_{false};
    bool paused_{false};
    std::optional<clock::time_point> lastSync_;
    clock::time_point nextSyncTime_;
    std::string output_;
    std::string lastError_;

    bool wakeRequested_{false};
    bool triggeredDuringAttempt_{false};
    std::optional<std::stop_source> attempt_;

    // State transitions used by TaskExecutor; each takes the lock itself
    [[nodiscard]] bool isPaused() const;
    void beginAttempt();
    void appendOutput(std::string_view line);
    void markSynced(std::string_view line);
    void markCancelled(std::string_view line);
    void setError(const std::string& message);

    bool runAttempt();
};

}
