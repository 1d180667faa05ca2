#include "sync/TaskRegistry.hpp"
#include "sync/SyncTask.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

using namespace ds::sync;
using namespace ds::types;
using namespace ds::logging;

TaskRegistry::TaskRegistry(config::MirrorConfig mirror) : mirror_(std::move(mirror)) {}

TaskRegistry::~TaskRegistry() { stopAll(); }

std::shared_ptr<SyncTask> TaskRegistry::addTask(const std::string& sourcePath, const std::string& destPath,
                                                const std::chrono::seconds interval) {
    const auto id = SyncTask::makeId(sourcePath, destPath);

    std::unique_lock lock(mutex_);
    if (std::ranges::any_of(tasks_, [&id](const auto& t) { return t->id() == id; }))
        throw std::invalid_argument("Sync task already registered: " + id);

    auto task = std::make_shared<SyncTask>(sourcePath, destPath, interval, mirror_);
    tasks_.push_back(task);
    LogRegistry::sync()->info("[TaskRegistry] Registered sync task {} (every {}s)", id, interval.count());
    return task;
}

void TaskRegistry::startAll() {
    for (const auto& task : snapshot()) task->start();
    LogRegistry::sync()->info("[TaskRegistry] Started {} sync tasks", size());
}

void TaskRegistry::stopAll() {
    for (const auto& task : snapshot()) task->stop();
}

std::vector<SyncStatus> TaskRegistry::getAllStatus() const {
    std::vector<SyncStatus> out;
    for (const auto& task : snapshot()) out.push_back(task->getStatus());
    return out;
}

std::optional<SyncStatus> TaskRegistry::getById(const std::string& id) const {
    if (const auto task = find(id)) return task->getStatus();
    return std::nullopt;
}

void TaskRegistry::triggerAll() {
    for (const auto& task : snapshot()) task->triggerSync();
}

bool TaskRegistry::triggerById(const std::string& id) {
    const auto task = find(id);
    if (!task) return false;
    task->triggerSync();
    return true;
}

bool TaskRegistry::pauseById(const std::string& id) {
    const auto task = find(id);
    if (!task) return false;
    task->pauseSync();
    return true;
}

bool TaskRegistry::resumeById(const std::string& id) {
    const auto task = find(id);
    if (!task) return false;
    task->resumeSync();
    return true;
}

size_t TaskRegistry::size() const {
    std::shared_lock lock(mutex_);
    return tasks_.size();
}

// Registry lock is released before the caller touches the task
std::shared_ptr<SyncTask> TaskRegistry::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = std::ranges::find_if(tasks_, [&id](const auto& t) { return t->id() == id; });
    return it == tasks_.end() ? nullptr : *it;
}

std::vector<std::shared_ptr<SyncTask>> TaskRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return tasks_;
}
