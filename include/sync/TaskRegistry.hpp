#pragma once

#include "config/Config.hpp"
#include "types/SyncStatus.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ds::sync {

class SyncTask;

/**
 * Owns every configured SyncTask. Ids are unique; insertion order is kept
 * and is the order getAllStatus() reports in.
 */
class TaskRegistry {
public:
    explicit TaskRegistry(config::MirrorConfig mirror = {});
    ~TaskRegistry();

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // Throws std::invalid_argument if a task with the same id already exists
    std::shared_ptr<SyncTask> addTask(const std::string& sourcePath, const std::string& destPath,
                                      std::chrono::seconds interval);

    void startAll();
    void stopAll();

    [[nodiscard]] std::vector<types::SyncStatus> getAllStatus() const;
    [[nodiscard]] std::optional<types::SyncStatus> getById(const std::string& id) const;

    void triggerAll();
    bool triggerById(const std::string& id);
    bool pauseById(const std::string& id);
    bool resumeById(const std::string& id);

    [[nodiscard]] size_t size() const;

private:
    const config::MirrorConfig mirror_;

    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<SyncTask>> tasks_;

    [[nodiscard]] std::shared_ptr<SyncTask> find(const std::string& id) const;
    [[nodiscard]] std::vector<std::shared_ptr<SyncTask>> snapshot() const;
};

}
