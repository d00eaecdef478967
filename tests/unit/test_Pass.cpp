#include <gtest/gtest.h>
#include "sync/model/Pass.hpp"

#include <chrono>

using namespace sv::sync::model;
using namespace std::chrono_literals;

TEST(PassTest, DurationKeepsSubSecondResolution) {
    Pass pass;
    pass.timestamp_begin = std::chrono::system_clock::now();
    pass.timestamp_end = pass.timestamp_begin + 1250ms;

    EXPECT_EQ(pass.duration_ms(), 1250u);
}

TEST(PassTest, StopIsNotBeforeStart) {
    Pass pass;
    pass.start();
    pass.stop();

    EXPECT_TRUE(pass.timestamp_end >= pass.timestamp_begin);
    EXPECT_LT(pass.duration_ms(), 60'000u);
}
