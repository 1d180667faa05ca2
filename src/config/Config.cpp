#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "logging/LogRegistry.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace ds::logging;

namespace ds::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping: " + path.string());

    cfg.base_dir = std::filesystem::absolute(path).parent_path();

    if (const auto node = root["sync_interval"]) {
        if (const auto secs = node.as<long long>(); secs > 0) cfg.sync_interval = std::chrono::seconds(secs);
        // loggers are not up yet while the config that configures them is parsed
        else spdlog::warn("[Config] sync_interval must be positive, got {}; using {}s",
                          secs, DEFAULT_SYNC_INTERVAL.count());
    }

    if (const auto node = root["sync_pairs"]) {
        if (!node.IsSequence()) throw std::runtime_error("sync_pairs must be a list of \"source:dest\" strings");
        cfg.sync_pairs = node.as<std::vector<std::string>>();
    }

    if (const auto node = root["http"]; node && !YAML::convert<HttpConfig>::decode(node, cfg.http))
        throw std::runtime_error("http section must be a mapping");
    if (const auto node = root["mirror"]; node && !YAML::convert<MirrorConfig>::decode(node, cfg.mirror))
        throw std::runtime_error("mirror section must be a mapping");
    for (const auto& arg : cfg.mirror.args)
        if (isDestructiveMirrorArg(arg))
            throw std::runtime_error("mirror.args must not remove files, rejected: " + arg);
    if (const auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw std::runtime_error("logging section must be a mapping");

    // top-level "port" is the older spelling and wins when present
    if (const auto node = root["port"]) cfg.http.port = parsePort(node.as<std::string>());

    if (!cfg.logging.log_dir.empty() && cfg.logging.log_dir.is_relative())
        cfg.logging.log_dir = cfg.base_dir / cfg.logging.log_dir;
    if (!cfg.http.static_dir.empty() && cfg.http.static_dir.is_relative())
        cfg.http.static_dir = cfg.base_dir / cfg.http.static_dir;

    return cfg;
}

std::optional<SyncPair> parseSyncPair(const std::string& pair) {
    const auto sep = pair.find(':');
    if (sep == std::string::npos || pair.find(':', sep + 1) != std::string::npos) return std::nullopt;

    SyncPair p{pair.substr(0, sep), pair.substr(sep + 1)};
    if (p.source.empty() || p.destination.empty()) return std::nullopt;
    return p;
}

uint16_t parsePort(const std::string& port) {
    std::string digits = port;
    if (!digits.empty() && digits.front() == ':') digits.erase(0, 1);
    if (digits.empty()) return DEFAULT_HTTP_PORT;

    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(digits, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port: " + port);
    }
    if (consumed != digits.size() || value <= 0 || value > 65535)
        throw std::invalid_argument("Invalid port: " + port);
    return static_cast<uint16_t>(value);
}

bool isDestructiveMirrorArg(const std::string& arg) {
    return arg == "--del" || arg == "--delete" || arg.starts_with("--delete-") || arg.starts_with("--delete=")
           || arg == "--remove-source-files" || arg == "--remove-sent-files";
}

std::vector<SyncPair> Config::syncPairs() const {
    std::vector<SyncPair> pairs;
    pairs.reserve(sync_pairs.size());

    for (const auto& raw : sync_pairs) {
        auto pair = parseSyncPair(raw);
        if (!pair) {
            LogRegistry::config()->warn("[Config] Invalid sync pair format, skipping: {}", raw);
            continue;
        }

        if (!base_dir.empty()) {
            if (std::filesystem::path(pair->source).is_relative())
                pair->source = (base_dir / pair->source).lexically_normal().string();
            if (std::filesystem::path(pair->destination).is_relative())
                pair->destination = (base_dir / pair->destination).lexically_normal().string();
        }

        pairs.push_back(std::move(*pair));
    }

    return pairs;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"sync_interval", c.sync_interval.count()},
        {"sync_pairs", c.sync_pairs},
        {"http", c.http},
        {"mirror", c.mirror},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const HttpConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"static_dir", c.static_dir.string()}
    };
}

void to_json(nlohmann::json& j, const MirrorConfig& c) {
    j = {
        {"tool", c.tool},
        {"args", c.args}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", spdlog::level::to_string_view(c.console_log_level).data()},
        {"file_log_level", spdlog::level::to_string_view(c.file_log_level).data()},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"dirsync", spdlog::level::to_string_view(c.dirsync).data()},
        {"sync", spdlog::level::to_string_view(c.sync).data()},
        {"http", spdlog::level::to_string_view(c.http).data()},
        {"config", spdlog::level::to_string_view(c.config).data()}
    };
}

} // namespace ds::config
