#include "config/Config.hpp"
#include "config/config_yaml.hpp"

namespace sv::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["tools"]) YAML::convert<ToolsConfig>::decode(node, cfg.tools);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

} // namespace sv::config
