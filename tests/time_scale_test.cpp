#include <fmt/format.h>
#include <gtest/gtest.h>
#include <tempus/duration_format.hpp>
#include <tempus/time_scale.hpp>

using namespace tempus;

// ==============================================================================
// Encoding and classification
// ==============================================================================

TEST(TimeScaleTest, CodesRoundTrip) {
    for (uint8_t code = 0; code <= 8; ++code) {
        EXPECT_EQ(to_code(time_scale_from_code(code)), code);
    }
    EXPECT_EQ(time_scale_from_code(9), TimeScale::TAI);
    EXPECT_EQ(time_scale_from_code(255), TimeScale::TAI);
    EXPECT_EQ(to_code(TimeScale::UTC), 4);
}

TEST(TimeScaleTest, Classification) {
    EXPECT_TRUE(uses_leap_seconds(TimeScale::UTC));
    EXPECT_FALSE(uses_leap_seconds(TimeScale::GPST));
    EXPECT_FALSE(uses_leap_seconds(TimeScale::TAI));

    EXPECT_TRUE(is_gnss(TimeScale::QZSST));
    EXPECT_TRUE(is_gnss(TimeScale::BDT));
    EXPECT_FALSE(is_gnss(TimeScale::TT));
    EXPECT_FALSE(is_gnss(TimeScale::UTC));
}

// ==============================================================================
// Reference epochs
// ==============================================================================

TEST(TimeScaleTest, PrimeEpochOffsets) {
    EXPECT_EQ(prime_epoch_offset(TimeScale::TAI), Duration::zero());
    EXPECT_EQ(prime_epoch_offset(TimeScale::UTC), Duration::zero());
    EXPECT_EQ(prime_epoch_offset(TimeScale::TT), Duration::zero());
    EXPECT_EQ(prime_epoch_offset(TimeScale::ET), 3'155'716'800 * Unit::Second);
    EXPECT_EQ(prime_epoch_offset(TimeScale::TDB), prime_epoch_offset(TimeScale::ET));
    EXPECT_EQ(prime_epoch_offset(TimeScale::GPST), 2'524'953'619 * Unit::Second);
    EXPECT_EQ(prime_epoch_offset(TimeScale::QZSST), prime_epoch_offset(TimeScale::GPST));
    EXPECT_EQ(prime_epoch_offset(TimeScale::GST), 3'144'268'819 * Unit::Second);
    EXPECT_EQ(prime_epoch_offset(TimeScale::BDT), 3'345'062'433 * Unit::Second);
}

TEST(TimeScaleTest, GregorianOffsetsDropLeapSeconds) {
    // Reference dates at UTC midnight
    EXPECT_EQ(gregorian_epoch_offset(TimeScale::GPST), 29'224 * Unit::Day);
    EXPECT_EQ(gregorian_epoch_offset(TimeScale::GST), 36'392 * Unit::Day);
    EXPECT_EQ(gregorian_epoch_offset(TimeScale::BDT), 38'716 * Unit::Day);
    // J2000 noon keeps its half day
    EXPECT_EQ(gregorian_epoch_offset(TimeScale::ET), 36'524 * Unit::Day + 12 * Unit::Hour);
}

// ==============================================================================
// Names
// ==============================================================================

TEST(TimeScaleTest, Names) {
    EXPECT_STREQ(to_string(TimeScale::QZSST), "QZSST");
    EXPECT_STREQ(to_constellation_string(TimeScale::GST), "GAL");
    EXPECT_STREQ(to_constellation_string(TimeScale::TDB), "TDB");
    EXPECT_EQ(fmt::format("{}", TimeScale::BDT), "BDT");
}

TEST(TimeScaleTest, Parse) {
    EXPECT_EQ(*parse_time_scale("GPST"), TimeScale::GPST);
    EXPECT_EQ(*parse_time_scale("GPS"), TimeScale::GPST);
    EXPECT_EQ(*parse_time_scale(" BDS "), TimeScale::BDT);
    EXPECT_EQ(*parse_time_scale("ET"), TimeScale::ET);

    auto unknown = parse_time_scale("UT1");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ParseError::Kind::time_system);
    EXPECT_FALSE(parse_time_scale("utc").has_value());
}
