#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace sv::config {

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    std::call_once(init_flag_, [&]() {
        if (path) config_ = loadConfig(path->string());
        else if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) config_ = loadConfig(DEFAULT_CONFIG_PATH.string());
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace sv::config
