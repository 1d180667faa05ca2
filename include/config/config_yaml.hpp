#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ds::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<HttpConfig> {
    static Node encode(const HttpConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["static_dir"] = rhs.static_dir.string();
        return node;
    }

    static bool decode(const Node& node, HttpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.static_dir = node["static_dir"].as<std::string>("");
        if (node["port"]) rhs.port = parsePort(node["port"].as<std::string>());
        return true;
    }
};

template<>
struct convert<MirrorConfig> {
    static Node encode(const MirrorConfig& rhs) {
        Node node;
        node["tool"] = rhs.tool;
        node["args"] = rhs.args;
        return node;
    }

    static bool decode(const Node& node, MirrorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tool = node["tool"].as<std::string>("rsync");
        if (node["args"]) rhs.args = node["args"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["dirsync"] = to_std_string(spdlog::level::to_string_view(rhs.dirsync));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["http"]    = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["config"]  = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dirsync = spdlog::level::from_str(node["dirsync"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
