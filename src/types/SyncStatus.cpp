#include "types/SyncStatus.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace ds::types;

void ds::types::to_json(nlohmann::json& j, const SyncStatus& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"source_path", s.source_path},
        {"destination_path", s.destination_path},
        {"is_syncing", s.is_syncing},
        {"paused", s.paused},
        {"last_sync", util::timePointToString(s.last_sync)},
        {"next_sync_time", util::timePointToString(s.next_sync_time)},
        {"output", s.output},
        {"last_error", s.last_error}
    };
}

void ds::types::from_json(const nlohmann::json& j, SyncStatus& s) {
    s.id = j.at("id").get<std::string>();
    s.source_path = j.at("source_path").get<std::string>();
    s.destination_path = j.at("destination_path").get<std::string>();
    s.is_syncing = j.value("is_syncing", false);
    s.paused = j.value("paused", false);
    s.output = j.value("output", "");
    s.last_error = j.value("last_error", "");

    s.last_sync.reset();
    if (j.contains("last_sync")) {
        const auto lastSync = j.at("last_sync").get<std::string>();
        if (lastSync != util::ZERO_TIMESTAMP) s.last_sync = util::parseTimePoint(lastSync);
    }
    if (j.contains("next_sync_time")) s.next_sync_time = util::parseTimePoint(j.at("next_sync_time").get<std::string>());
}
