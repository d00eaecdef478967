#pragma once

#include "config/Config.hpp"

#include <mutex>
#include <optional>

namespace sv::config {

class ConfigRegistry {
public:
    // An explicit path must exist. Without one, DEFAULT_CONFIG_PATH is used when
    // present and the built-in defaults otherwise.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace sv::config
