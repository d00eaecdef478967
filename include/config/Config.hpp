#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace sv::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/subvolsync/config.yaml";

struct ToolsConfig {
    std::string btrfs = "btrfs";
    std::string rsync = "rsync";
    std::string reflink_diff = "subvolsync-reflink-diff";
};

struct TransferConfig {
    // Tuned to keep blocks shared with the clone: rewrite files in place, use
    // the delta algorithm even locally, match renamed files, delete last.
    std::vector<std::string> rsync_flags = {
        "-a",
        "--delete-delay",
        "--inplace",
        "--preallocate",
        "--no-whole-file",
        "--fuzzy",
        "--info=copy,del,name1,progress2,stats2",
    };
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum subvolsync = spdlog::level::info;  // Run start/stop, pass summaries
    spdlog::level::level_enum snapshot   = spdlog::level::info;  // Volume listings
    spdlog::level::level_enum sync       = spdlog::level::info;  // Target/base decisions, protocol steps
    spdlog::level::level_enum process    = spdlog::level::info;  // External commands
    spdlog::level::level_enum reflink    = spdlog::level::info;  // Reflink copies
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    ToolsConfig tools;
    TransferConfig transfer;
    LoggingConfig logging;
};

// Throws YAML::BadFile if path cannot be read.
Config loadConfig(const std::string& path);

} // namespace sv::config
