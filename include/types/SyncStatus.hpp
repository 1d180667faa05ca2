#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::types {

// Point-in-time copy of a sync task, as served by the status API
struct SyncStatus {
    std::string id;
    std::string source_path;
    std::string destination_path;
    bool is_syncing{false};
    bool paused{false};
    std::optional<std::chrono::system_clock::time_point> last_sync;
    std::chrono::system_clock::time_point next_sync_time{};
    std::string output;
    std::string last_error;
};

void to_json(nlohmann::json& j, const SyncStatus& s);
void from_json(const nlohmann::json& j, SyncStatus& s);

}
