#include <vector>

#include <gtest/gtest.h>
#include <tempus/epoch.hpp>
#include <tempus/leap_seconds.hpp>

using namespace tempus;

// ==============================================================================
// Built-in table
// ==============================================================================

TEST(LeapSecondsTest, BuiltinTableShape) {
    BuiltinLeapSeconds table;
    ASSERT_EQ(table.size(), 42u);
    EXPECT_FALSE(table.empty());
    EXPECT_FALSE(table[0].announced_by_iers);
    EXPECT_FALSE(table[13].announced_by_iers);
    EXPECT_TRUE(table[14].announced_by_iers);
    EXPECT_DOUBLE_EQ(table[14].delta_at, 10.0);
    EXPECT_DOUBLE_EQ(table[41].delta_at, 37.0);
}

TEST(LeapSecondsTest, BuiltinTableIsSorted) {
    BuiltinLeapSeconds table;
    for (size_t i = 1; i < table.size(); ++i) {
        EXPECT_LT(table[i - 1].timestamp_tai_s, table[i].timestamp_tai_s) << i;
    }
}

TEST(LeapSecondsTest, IersStepsAreWholeSeconds) {
    int count = 0;
    double previous = 9.0;
    for (const LeapSecond& leap : BuiltinLeapSeconds{}) {
        if (!leap.announced_by_iers) {
            continue;
        }
        EXPECT_DOUBLE_EQ(leap.delta_at, previous + 1.0);
        previous = leap.delta_at;
        ++count;
    }
    EXPECT_EQ(count, 28);
}

// ==============================================================================
// Lookup
// ==============================================================================

TEST(LeapSecondsTest, LookupBeforeTableIsEmpty) {
    EXPECT_FALSE(detail::leap_seconds_at(0.0, false, BuiltinLeapSeconds{}).has_value());
    EXPECT_FALSE(detail::leap_seconds_at(1'893'369'599.0, false, BuiltinLeapSeconds{}));
}

TEST(LeapSecondsTest, LookupAtStepBoundary) {
    BuiltinLeapSeconds table;
    EXPECT_DOUBLE_EQ(*detail::leap_seconds_at(3'692'217'600.0, true, table), 37.0);
    EXPECT_DOUBLE_EQ(*detail::leap_seconds_at(3'692'217'599.0, true, table), 36.0);
    EXPECT_DOUBLE_EQ(*detail::leap_seconds_at(2'272'060'800.0, true, table), 10.0);
}

TEST(LeapSecondsTest, IersOnlySkipsSofaSteps) {
    BuiltinLeapSeconds table;
    // 1 Jan 1970
    const double tai = 2'208'988'800.0;
    EXPECT_DOUBLE_EQ(*detail::leap_seconds_at(tai, false, table), 4.21317);
    EXPECT_FALSE(detail::leap_seconds_at(tai, true, table).has_value());
}

TEST(LeapSecondsTest, VectorIsAProvider) {
    static_assert(LeapSecondProvider<std::vector<LeapSecond>>);
    const std::vector<LeapSecond> custom{{100.0, 1.0, true}, {200.0, 2.0, false}};
    EXPECT_DOUBLE_EQ(*detail::leap_seconds_at(250.0, false, custom), 2.0);
    EXPECT_DOUBLE_EQ(*detail::leap_seconds_at(250.0, true, custom), 1.0);
    EXPECT_FALSE(detail::leap_seconds_at(50.0, false, custom).has_value());
}

// ==============================================================================
// Epoch lookups
// ==============================================================================

TEST(LeapSecondsTest, EpochLeapSeconds) {
    auto e = Epoch::from_gregorian_utc_at_midnight(2019, 6, 1);
    EXPECT_DOUBLE_EQ(*e.leap_seconds(true), 37.0);
    EXPECT_EQ(e.leap_seconds_iers(), 37);

    auto before = Epoch::from_gregorian_tai_at_midnight(1965, 6, 1);
    EXPECT_EQ(before.leap_seconds_iers(), 0);
    EXPECT_FALSE(before.leap_seconds(true).has_value());
    EXPECT_DOUBLE_EQ(*before.leap_seconds(false), 3.64013);
}

TEST(LeapSecondsTest, EpochWithCustomProvider) {
    const std::vector<LeapSecond> custom{{0.0, 42.0, true}};
    auto e = Epoch::from_tai_seconds(10.0);
    EXPECT_DOUBLE_EQ(*e.leap_seconds_with(true, custom), 42.0);
}

TEST(LeapSecondsTest, TaiMinusUtc) {
    auto e = Epoch::from_gregorian_utc_hms(2019, 3, 1, 12, 0, 0);
    EXPECT_EQ(e.to_tai_duration() - e.to_utc_duration(), 37 * Unit::Second);

    auto early = Epoch::from_gregorian_utc_hms(1972, 3, 1, 12, 0, 0);
    EXPECT_EQ(early.to_tai_duration() - early.to_utc_duration(), 10 * Unit::Second);
}

TEST(LeapSecondsTest, First1972Boundaries) {
    auto before = Epoch::from_tai_seconds(2'272'060'799.0);
    EXPECT_EQ(before.leap_seconds_iers(), 0);
    EXPECT_FALSE(before.leap_seconds(true).has_value());

    auto at_step = Epoch::from_tai_seconds(2'272'060'800.0);
    EXPECT_EQ(at_step.leap_seconds_iers(), 10);

    EXPECT_EQ(Epoch::from_gregorian_utc_at_midnight(1972, 1, 1).leap_seconds_iers(), 10);
    EXPECT_EQ(Epoch::from_gregorian_utc_at_midnight(1972, 7, 1).leap_seconds_iers(), 11);
    EXPECT_EQ(Epoch::from_gregorian_utc_hms(1972, 6, 30, 23, 59, 59).leap_seconds_iers(), 10);
}
