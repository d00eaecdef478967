#pragma once

#include "snapshot/Date.hpp"

#include <chrono>
#include <cstdint>

namespace sv::sync::model {

// One completed run of the per-snapshot protocol.
struct Pass {
    snapshot::Date target;
    snapshot::Date base;
    uint64_t distance{};
    std::chrono::system_clock::time_point timestamp_begin{}, timestamp_end{};

    void start();
    void stop();
    [[nodiscard]] uint64_t duration_ms() const;
};

}
