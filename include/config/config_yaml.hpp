#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sv::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ToolsConfig> {
    static Node encode(const ToolsConfig& rhs) {
        Node node;
        node["btrfs"] = rhs.btrfs;
        node["rsync"] = rhs.rsync;
        node["reflink_diff"] = rhs.reflink_diff;
        return node;
    }

    static bool decode(const Node& node, ToolsConfig& rhs) {
        if (!node.IsMap()) return false;
        const ToolsConfig defaults;
        rhs.btrfs = node["btrfs"].as<std::string>(defaults.btrfs);
        rhs.rsync = node["rsync"].as<std::string>(defaults.rsync);
        rhs.reflink_diff = node["reflink_diff"].as<std::string>(defaults.reflink_diff);
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["rsync_flags"] = rhs.rsync_flags;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["rsync_flags"]) rhs.rsync_flags = node["rsync_flags"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["subvolsync"] = to_std_string(spdlog::level::to_string_view(rhs.subvolsync));
        node["snapshot"]   = to_std_string(spdlog::level::to_string_view(rhs.snapshot));
        node["sync"]       = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["process"]    = to_std_string(spdlog::level::to_string_view(rhs.process));
        node["reflink"]    = to_std_string(spdlog::level::to_string_view(rhs.reflink));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.subvolsync = spdlog::level::from_str(node["subvolsync"].as<std::string>("info"));
        rhs.snapshot = spdlog::level::from_str(node["snapshot"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.process = spdlog::level::from_str(node["process"].as<std::string>("info"));
        rhs.reflink = spdlog::level::from_str(node["reflink"].as<std::string>("info"));
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
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
