#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ds::config {

constexpr static std::chrono::seconds DEFAULT_SYNC_INTERVAL{60};
constexpr static uint16_t DEFAULT_HTTP_PORT = 8080;

struct HttpConfig {
    std::string host = "0.0.0.0";
    uint16_t port = DEFAULT_HTTP_PORT;
    std::filesystem::path static_dir; // empty disables static file serving
};

struct MirrorConfig {
    std::string tool = "rsync";
    std::vector<std::string> args = {"-avzP"}; // delete-family flags are rejected by loadConfig
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum dirsync = spdlog::level::info;   // Startup, shutdown, service lifecycle
    spdlog::level::level_enum sync    = spdlog::level::info;   // Per-task attempts and tool output
    spdlog::level::level_enum http    = spdlog::level::warn;   // Malformed requests, socket errors
    spdlog::level::level_enum config  = spdlog::level::info;   // Skipped pairs, defaulted values
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty keeps logging on the console only
    LogLevelsConfig levels;
};

struct SyncPair {
    std::string source;
    std::string destination;
};

struct Config {
    std::chrono::seconds sync_interval = DEFAULT_SYNC_INTERVAL;
    std::vector<std::string> sync_pairs;
    HttpConfig http;
    MirrorConfig mirror;
    LoggingConfig logging;

    std::filesystem::path base_dir; // directory of the loaded file, anchors relative pair paths

    // Valid pairs in configured order, relative paths resolved against base_dir.
    // Malformed entries are skipped with a warning.
    [[nodiscard]] std::vector<SyncPair> syncPairs() const;
};

Config loadConfig(const std::filesystem::path& path);

// Splits "source:dest" into exactly two non-empty segments
std::optional<SyncPair> parseSyncPair(const std::string& pair);

// Accepts "8080" or ":8080"
uint16_t parsePort(const std::string& port);

// Flags that would remove files from the destination or the source
[[nodiscard]] bool isDestructiveMirrorArg(const std::string& arg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const HttpConfig& c);
void to_json(nlohmann::json& j, const MirrorConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace ds::config
