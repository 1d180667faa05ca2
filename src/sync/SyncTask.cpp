#include "sync/SyncTask.hpp"
#include "sync/TaskExecutor.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <mutex>
#include <stdexcept>

using namespace ds::sync;
using namespace ds::types;
using namespace ds::logging;

SyncTask::SyncTask(std::string sourcePath, std::string destPath,
                   const std::chrono::seconds interval, config::MirrorConfig mirror)
    : AsyncService("SyncTask " + makeId(sourcePath, destPath)),
      id_(makeId(sourcePath, destPath)),
      sourcePath_(std::move(sourcePath)),
      destPath_(std::move(destPath)),
      interval_(interval),
      mirror_(std::move(mirror)),
      nextSyncTime_(clock::now()) {
    if (interval_ <= std::chrono::seconds::zero())
        throw std::invalid_argument("Sync interval must be positive for " + id_);
}

SyncTask::~SyncTask() { stop(); }

std::string SyncTask::makeId(const std::string& sourcePath, const std::string& destPath) {
    return sourcePath + ":" + destPath;
}

void SyncTask::stop() {
    {
        std::unique_lock lock(mutex_);
        // set under the lock so a waiting loop cannot miss it between predicate and wait
        interruptFlag_.store(true, std::memory_order_release);
        if (attempt_) attempt_->request_stop();
    }
    wake_.notify_all();
    AsyncService::stop();
}

void SyncTask::runLoop() {
    LogRegistry::sync()->info("[SyncTask] [{}] Scheduling loop started, interval {}s", id_, interval_.count());

    while (!shouldStop()) {
        {
            std::unique_lock lock(mutex_);
            wakeRequested_ = false;

            if (paused_) {
                wake_.wait(lock, [this] { return wakeRequested_ || shouldStop(); });
                continue;
            }

            if (const auto deadline = nextSyncTime_; clock::now() < deadline) {
                LogRegistry::sync()->debug("[SyncTask] [{}] Next sync at {}", id_, util::timePointToString(deadline));
                wake_.wait_until(lock, deadline, [this] { return wakeRequested_ || shouldStop(); });
                continue; // re-read schedule and pause state
            }
        }

        runAttempt();

        std::unique_lock lock(mutex_);
        if (triggeredDuringAttempt_) triggeredDuringAttempt_ = false; // keep the trigger's "now"
        else nextSyncTime_ = clock::now() + interval_;
    }

    LogRegistry::sync()->info("[SyncTask] [{}] Scheduling loop stopped", id_);
}

bool SyncTask::syncNow() {
    if (isRunning()) throw std::logic_error("syncNow() called while the scheduling loop is running for " + id_);
    return runAttempt();
}

bool SyncTask::runAttempt() {
    std::stop_token token;
    {
        std::unique_lock lock(mutex_);
        if (attempt_) return false;
        attempt_.emplace();
        token = attempt_->get_token();
        triggeredDuringAttempt_ = false;
    }

    const bool ok = TaskExecutor(*this, mirror_).run(token);

    std::unique_lock lock(mutex_);
    attempt_.reset();
    return ok;
}

void SyncTask::triggerSync() {
    {
        std::unique_lock lock(mutex_);
        nextSyncTime_ = clock::now();
        paused_ = false;
        if (attempt_) triggeredDuringAttempt_ = true;
        wakeRequested_ = true;
    }
    wake_.notify_all();
    LogRegistry::sync()->info("[SyncTask] [{}] Sync triggered", id_);
}

void SyncTask::pauseSync() {
    {
        std::unique_lock lock(mutex_);
        paused_ = true;
        output_ += "Sync paused\n";
        if (attempt_) attempt_->request_stop();
        wakeRequested_ = true;
    }
    wake_.notify_all();
    LogRegistry::sync()->info("[SyncTask] [{}] Sync paused", id_);
}

void SyncTask::resumeSync() {
    {
        std::unique_lock lock(mutex_);
        paused_ = false;
        output_ += "Sync resumed\n";
        wakeRequested_ = true;
    }
    wake_.notify_all();
    LogRegistry::sync()->info("[SyncTask] [{}] Sync resumed", id_);
}

SyncStatus SyncTask::getStatus() const {
    std::shared_lock lock(mutex_);
    return SyncStatus{
        .id = id_,
        .source_path = sourcePath_,
        .destination_path = destPath_,
        .is_syncing = isSyncing_,
        .paused = paused_,
        .last_sync = lastSync_,
        .next_sync_time = nextSyncTime_,
        .output = output_,
        .last_error = lastError_
    };
}

bool SyncTask::isPaused() const {
    std::shared_lock lock(mutex_);
    return paused_;
}

void SyncTask::beginAttempt() {
    std::unique_lock lock(mutex_);
    isSyncing_ = true;
    lastError_.clear();
    output_ = "Starting sync from " + sourcePath_ + " to " + destPath_ + "\n";
}

void SyncTask::appendOutput(const std::string_view line) {
    std::unique_lock lock(mutex_);
    output_.append(line);
    output_ += '\n';
}

void SyncTask::markSynced(const std::string_view line) {
    std::unique_lock lock(mutex_);
    isSyncing_ = false;
    lastSync_ = clock::now();
    output_.append(line);
    output_ += '\n';
}

void SyncTask::markCancelled(const std::string_view line) {
    std::unique_lock lock(mutex_);
    isSyncing_ = false;
    output_.append(line);
    output_ += '\n';
}

void SyncTask::setError(const std::string& message) {
    std::unique_lock lock(mutex_);
    isSyncing_ = false;
    lastError_ = message;
    output_ += "Error: " + message + "\n";
}
