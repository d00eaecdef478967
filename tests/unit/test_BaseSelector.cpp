#include <gtest/gtest.h>
#include "snapshot/BaseSelector.hpp"
#include "snapshot/Distance.hpp"
#include "error/Errors.hpp"
#include "FakeVolumes.hpp"

using namespace sv::snapshot;
using sv::test::date;
using sv::test::dates;

TEST(DistanceTest, FutureCandidateCountsDays) {
    EXPECT_EQ(distance(date("2024-01-10"), date("2024-01-15")), 5u);
    EXPECT_EQ(distance(date("2024-01-10"), date("2024-01-10")), 0u);
}

TEST(DistanceTest, PastCandidateCountsTwice) {
    EXPECT_EQ(distance(date("2024-01-10"), date("2024-01-05")), 10u);
    EXPECT_EQ(distance(date("2024-01-05"), date("2024-01-01")), 8u);
}

TEST(DistanceTest, PastIsTwiceTheMirroredFutureDistance) {
    const auto x = date("2024-03-01");
    for (const auto* y : {"2024-02-28", "2023-12-25", "2020-03-01"}) {
        EXPECT_EQ(distance(x, date(y)), 2 * distance(date(y), x)) << y;
    }
}

TEST(DistanceTest, CrossesYearBoundary) {
    EXPECT_EQ(distance(date("2023-12-31"), date("2024-01-01")), 1u);
    EXPECT_EQ(distance(date("2024-01-01"), date("2023-12-31")), 2u);
}

TEST(BaseSelectorTest, PrefersFutureOverEquallyDistantPast) {
    const auto s = BaseSelector::select(date("2024-01-10"), dates({"2024-01-05", "2024-01-15"}));
    EXPECT_EQ(s.base, date("2024-01-15"));
    EXPECT_EQ(s.distance, 5u);
}

TEST(BaseSelectorTest, PicksNearestWhenPastIsCloser) {
    // 2 days back scores 4, 5 days ahead scores 5.
    const auto s = BaseSelector::select(date("2024-01-10"), dates({"2024-01-08", "2024-01-15"}));
    EXPECT_EQ(s.base, date("2024-01-08"));
    EXPECT_EQ(s.distance, 4u);
}

TEST(BaseSelectorTest, TieGoesToEarliestDate) {
    // 2 days back and 4 days ahead both score 4.
    const auto s = BaseSelector::select(date("2024-01-10"), dates({"2024-01-14", "2024-01-08"}));
    EXPECT_EQ(s.base, date("2024-01-08"));
    EXPECT_EQ(s.distance, 4u);
}

TEST(BaseSelectorTest, SingleCandidateIsChosen) {
    const auto s = BaseSelector::select(date("2024-01-10"), dates({"2020-06-01"}));
    EXPECT_EQ(s.base, date("2020-06-01"));
}

TEST(BaseSelectorTest, EmptyCandidatesIsPreconditionFailure) {
    EXPECT_THROW(BaseSelector::select(date("2024-01-10"), {}), sv::error::PreconditionFailure);
}

TEST(BaseSelectorTest, ResultIsMinimalAndEarliestAmongTies) {
    const std::vector<std::string> pool = {
        "2024-01-01", "2024-01-03", "2024-01-04", "2024-01-06", "2024-01-07", "2024-01-09", "2024-01-12",
    };
    const auto target = date("2024-01-05");

    // Every non-empty subset of the pool.
    for (unsigned mask = 1; mask < (1u << pool.size()); ++mask) {
        SnapshotSet candidates;
        for (size_t i = 0; i < pool.size(); ++i)
            if (mask & (1u << i)) candidates.insert(date(pool[i]));

        const auto s = BaseSelector::select(target, candidates);
        ASSERT_TRUE(candidates.contains(s.base));
        EXPECT_EQ(s.distance, distance(target, s.base));
        for (const auto& c : candidates) {
            const auto dc = distance(target, c);
            EXPECT_GE(dc, s.distance);
            if (dc == s.distance) EXPECT_LE(s.base, c);
        }
    }
}
