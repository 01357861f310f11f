#include <sstream>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <tempus/epoch.hpp>

using namespace tempus;

class EpochOpsTest : public ::testing::Test {
protected:
    // Thursday
    const Epoch thursday_ = Epoch::from_gregorian_utc_hms(2022, 12, 1, 10, 11, 12);
    const Epoch precise_ = Epoch::from_gregorian_tai(2022, 10, 3, 17, 44, 29, 898'032'665);
};

// ==============================================================================
// Arithmetic
// ==============================================================================

TEST_F(EpochOpsTest, AddAndSubtract) {
    EXPECT_EQ(thursday_ + Unit::Hour, Epoch::from_gregorian_utc_hms(2022, 12, 1, 11, 11, 12));
    EXPECT_EQ(thursday_ - Unit::Day, Epoch::from_gregorian_utc_hms(2022, 11, 30, 10, 11, 12));
    EXPECT_EQ(thursday_ + 90 * Unit::Minute, Epoch::from_gregorian_utc_hms(2022, 12, 1, 11, 41, 12));
    EXPECT_EQ(thursday_ + 1.5, Epoch::from_gregorian_utc(2022, 12, 1, 10, 11, 13, 500'000'000));
    EXPECT_EQ(thursday_ - 0.25, Epoch::from_gregorian_utc(2022, 12, 1, 10, 11, 11, 750'000'000));

    Epoch e = thursday_;
    e += Unit::Week;
    EXPECT_EQ(e.time_scale(), TimeScale::UTC);
    e -= 7 * Unit::Day;
    EXPECT_EQ(e, thursday_);
}

TEST_F(EpochOpsTest, DifferenceInLeftScale) {
    auto later = Epoch::from_gregorian_utc_hms(2022, 12, 2, 10, 11, 12);
    EXPECT_EQ(later - thursday_, Unit::Day);
    EXPECT_EQ(thursday_ - later, -to_duration(Unit::Day));

    // Noon UTC and noon TAI on the first day of IERS leap seconds
    auto utc_noon = Epoch::from_gregorian_utc_at_noon(1972, 1, 1);
    auto tai_noon = Epoch::from_gregorian_tai_at_noon(1972, 1, 1);
    EXPECT_EQ(utc_noon - tai_noon, 10 * Unit::Second);
    EXPECT_EQ(tai_noon - utc_noon, -10 * Unit::Second);
}

TEST_F(EpochOpsTest, DifferenceAcrossLeapSecond) {
    auto before = Epoch::from_gregorian_utc_hms(2016, 12, 31, 23, 59, 0);
    auto after = Epoch::from_gregorian_utc_hms(2017, 1, 1, 0, 1, 0);
    EXPECT_EQ(after.to_time_scale(TimeScale::TAI) - before, 121 * Unit::Second);
    EXPECT_EQ(after - before, 120 * Unit::Second);
}

TEST_F(EpochOpsTest, ArithmeticSaturates) {
    auto far = Epoch::from_tai_duration(Duration::max());
    EXPECT_EQ((far + Unit::Century).duration(), Duration::max());
    auto early = Epoch::from_tai_duration(Duration::min());
    EXPECT_EQ((early - Unit::Second).duration(), Duration::min());
}

// ==============================================================================
// Comparison
// ==============================================================================

TEST_F(EpochOpsTest, CompareAcrossScales) {
    auto tai = thursday_.to_time_scale(TimeScale::TAI);
    auto gpst = thursday_.to_time_scale(TimeScale::GPST);
    EXPECT_EQ(thursday_, tai);
    EXPECT_EQ(tai, thursday_);
    EXPECT_EQ(gpst, thursday_);
    EXPECT_EQ(thursday_, gpst);

    EXPECT_LT(thursday_, tai + Unit::Nanosecond);
    EXPECT_GT(gpst + Unit::Nanosecond, thursday_);
    EXPECT_LE(tai, thursday_);
    EXPECT_NE(tai, thursday_ - Unit::Nanosecond);
}

TEST_F(EpochOpsTest, OrderingAgreesWithEqualityAtLeapSecond) {
    // Both TAI seconds around the 2017 step read as the same UTC second
    auto utc = Epoch::from_utc_seconds(3'692'217'563.0);
    auto first = Epoch::from_tai_seconds(3'692'217'599.0);
    auto second = Epoch::from_tai_seconds(3'692'217'600.0);
    ASSERT_EQ(first.to_utc_duration(), second.to_utc_duration());

    EXPECT_EQ(utc, first);
    EXPECT_TRUE((utc <=> first) == 0);
    EXPECT_NE(utc, second);
    EXPECT_TRUE((utc <=> second) != 0);
    EXPECT_LT(utc, second);
    EXPECT_GT(second, utc);
    EXPECT_EQ((second <=> utc) == 0, second == utc);
}

TEST_F(EpochOpsTest, MinMax) {
    auto later = thursday_ + Unit::Second;
    EXPECT_EQ(thursday_.min(later), thursday_);
    EXPECT_EQ(thursday_.max(later), later);
    EXPECT_EQ(later.min(thursday_), thursday_);
}

// ==============================================================================
// Rounding
// ==============================================================================

TEST_F(EpochOpsTest, FloorCeilRound) {
    auto e = Epoch::from_gregorian_tai_hms(2022, 5, 20, 17, 57, 43);
    const Duration hour = to_duration(Unit::Hour);
    EXPECT_EQ(e.floor(hour), Epoch::from_gregorian_tai_hms(2022, 5, 20, 17, 0, 0));
    EXPECT_EQ(e.ceil(hour), Epoch::from_gregorian_tai_hms(2022, 5, 20, 18, 0, 0));
    EXPECT_EQ(e.round(hour), Epoch::from_gregorian_tai_hms(2022, 5, 20, 18, 0, 0));

    EXPECT_EQ(precise_.floor(3 * Unit::Minute), Epoch::from_gregorian_tai_hms(2022, 10, 3, 17, 42, 0));
    EXPECT_EQ(precise_.round(to_duration(Unit::Second)),
              Epoch::from_gregorian_tai_hms(2022, 10, 3, 17, 44, 30));
}

TEST_F(EpochOpsTest, RoundingKeepsScale) {
    auto floored = thursday_.floor(to_duration(Unit::Day));
    EXPECT_EQ(floored.time_scale(), TimeScale::UTC);
    EXPECT_EQ(floored, Epoch::from_gregorian_utc_at_midnight(2022, 12, 1));
}

// ==============================================================================
// Calendar fields
// ==============================================================================

TEST_F(EpochOpsTest, CalendarFields) {
    EXPECT_EQ(precise_.year(), 2022);
    EXPECT_EQ(precise_.month_name(), MonthName::October);
    EXPECT_EQ(precise_.hours(), 17);
    EXPECT_EQ(precise_.minutes(), 44);
    EXPECT_EQ(precise_.seconds(), 29);
    EXPECT_EQ(precise_.milliseconds(), 898u);
    EXPECT_EQ(precise_.microseconds(), 32u);
    EXPECT_EQ(precise_.nanoseconds(), 665u);
}

TEST_F(EpochOpsTest, FieldsFollowOwnScale) {
    // 10:11:12 UTC is 10:11:49 TAI
    EXPECT_EQ(thursday_.seconds(), 12);
    EXPECT_EQ(thursday_.to_time_scale(TimeScale::TAI).seconds(), 49);
    EXPECT_EQ(thursday_.to_gregorian_tai(), (Gregorian{2022, 12, 1, 10, 11, 49, 0}));
    EXPECT_EQ(thursday_.to_gregorian_utc(), (Gregorian{2022, 12, 1, 10, 11, 12, 0}));
}

TEST_F(EpochOpsTest, FieldsBefore1900) {
    auto e = Epoch::from_gregorian_tai(1899, 12, 31, 23, 59, 58, 5);
    EXPECT_EQ(e.year(), 1899);
    EXPECT_EQ(e.month_name(), MonthName::December);
    EXPECT_EQ(e.hours(), 23);
    EXPECT_EQ(e.seconds(), 58);
    EXPECT_EQ(e.nanoseconds(), 5u);
}

// ==============================================================================
// Weekdays
// ==============================================================================

TEST_F(EpochOpsTest, Weekdays) {
    EXPECT_EQ(thursday_.weekday(), Weekday::Thursday);
    EXPECT_EQ(thursday_.weekday_utc(), Weekday::Thursday);
    EXPECT_EQ(Epoch::from_gregorian_utc_at_midnight(2022, 11, 28).weekday_utc(), Weekday::Monday);
    EXPECT_EQ(Epoch::from_gregorian_tai_at_midnight(1988, 1, 2).weekday(), Weekday::Saturday);
    EXPECT_EQ(Epoch::from_gregorian_tai_at_midnight(1900, 1, 1).weekday(), Weekday::Monday);
    EXPECT_EQ(Epoch::from_gregorian_tai_at_noon(1899, 12, 31).weekday(), Weekday::Sunday);
}

TEST_F(EpochOpsTest, GnssReferencesAreSundays) {
    EXPECT_EQ(reference_epoch(TimeScale::GPST).weekday(), Weekday::Sunday);
    EXPECT_EQ(reference_epoch(TimeScale::GST).weekday(), Weekday::Sunday);
    EXPECT_EQ(reference_epoch(TimeScale::BDT).weekday(), Weekday::Sunday);
}

TEST_F(EpochOpsTest, WeekdayDependsOnScale) {
    // 20 seconds before midnight UTC is already the next day in TAI
    auto e = Epoch::from_gregorian_utc_hms(2022, 11, 30, 23, 59, 40);
    EXPECT_EQ(e.weekday_utc(), Weekday::Wednesday);
    EXPECT_EQ(e.weekday_in_time_scale(TimeScale::TAI), Weekday::Thursday);
}

TEST_F(EpochOpsTest, NextAndPrevious) {
    EXPECT_EQ(thursday_.next(Weekday::Monday), Epoch::from_gregorian_utc_hms(2022, 12, 5, 10, 11, 12));
    EXPECT_EQ(thursday_.next(Weekday::Thursday),
              Epoch::from_gregorian_utc_hms(2022, 12, 8, 10, 11, 12));
    EXPECT_EQ(thursday_.previous(Weekday::Thursday),
              Epoch::from_gregorian_utc_hms(2022, 11, 24, 10, 11, 12));
    EXPECT_EQ(thursday_.previous(Weekday::Wednesday),
              Epoch::from_gregorian_utc_hms(2022, 11, 30, 10, 11, 12));
}

TEST_F(EpochOpsTest, NextAndPreviousAtFixedTimes) {
    EXPECT_EQ(thursday_.previous_weekday_at_midnight(Weekday::Sunday),
              Epoch::from_gregorian_utc_at_midnight(2022, 11, 27));
    EXPECT_EQ(thursday_.next_weekday_at_noon(Weekday::Saturday),
              Epoch::from_gregorian_utc_at_noon(2022, 12, 3));
    EXPECT_EQ(thursday_.next_weekday_at_midnight(Weekday::Friday),
              Epoch::from_gregorian_utc_at_midnight(2022, 12, 2));
    EXPECT_EQ(thursday_.previous_weekday_at_noon(Weekday::Monday),
              Epoch::from_gregorian_utc_at_noon(2022, 11, 28));
}

// ==============================================================================
// Time of day replacement
// ==============================================================================

TEST_F(EpochOpsTest, WithHms) {
    auto e = Epoch::from_gregorian_utc(2022, 12, 1, 10, 11, 12, 13'000);
    EXPECT_EQ(e.with_hms(5, 6, 7), Epoch::from_gregorian_utc(2022, 12, 1, 5, 6, 7, 13'000));
    EXPECT_EQ(e.with_hms_strict(5, 6, 7), Epoch::from_gregorian_utc_hms(2022, 12, 1, 5, 6, 7));
    EXPECT_THROW(e.with_hms(25, 0, 0), std::invalid_argument);
    EXPECT_THROW(e.with_hms_strict(1, 60, 0), std::invalid_argument);
}

TEST_F(EpochOpsTest, WithHmsFromOtherScale) {
    auto e = Epoch::from_gregorian_utc(2022, 12, 1, 10, 11, 12, 13'000);
    // 03:04:05 TAI is 03:03:33 UTC in 2000
    auto other = Epoch::from_gregorian_tai(2000, 1, 1, 3, 4, 5, 600);
    EXPECT_EQ(e.with_hms_from(other), Epoch::from_gregorian_utc(2022, 12, 1, 3, 3, 33, 13'000));
    EXPECT_EQ(e.with_hms_strict_from(other), Epoch::from_gregorian_utc_hms(2022, 12, 1, 3, 3, 33));
    EXPECT_EQ(e.with_time_from(other), Epoch::from_gregorian_utc(2022, 12, 1, 3, 3, 33, 600));
}

// ==============================================================================
// Formatting
// ==============================================================================

TEST_F(EpochOpsTest, FormatInOwnScale) {
    EXPECT_EQ(fmt::format("{}", thursday_), "2022-12-01T10:11:12 UTC");
    EXPECT_EQ(fmt::format("{}", precise_), "2022-10-03T17:44:29.898032665 TAI");
    EXPECT_EQ(to_string(thursday_), "2022-12-01T10:11:12 UTC");

    std::ostringstream os;
    os << thursday_;
    EXPECT_EQ(os.str(), "2022-12-01T10:11:12 UTC");
}

TEST_F(EpochOpsTest, FormatInOtherScales) {
    EXPECT_EQ(fmt::format("{:x}", thursday_), "2022-12-01T10:11:49 TAI");
    EXPECT_EQ(fmt::format("{:X}", thursday_), "2022-12-01T10:12:21.184000000 TT");
    EXPECT_EQ(thursday_.to_gregorian_str(TimeScale::GPST), "2022-12-01T10:11:30 GPST");
    EXPECT_EQ(thursday_.to_gregorian_str(TimeScale::UTC), "2022-12-01T10:11:12 UTC");

    // TDB and ET differ from TT by about a millisecond at most
    const std::string tdb = fmt::format("{:e}", thursday_);
    EXPECT_EQ(tdb.substr(0, 17), "2022-12-01T10:12:");
    EXPECT_EQ(tdb.substr(tdb.size() - 4), " TDB");
    const std::string et = fmt::format("{:E}", thursday_);
    EXPECT_EQ(et.substr(et.size() - 3), " ET");
}

TEST_F(EpochOpsTest, FormatRejectsUnknownPresentation) {
    EXPECT_THROW((void)fmt::format(fmt::runtime("{:q}"), thursday_), fmt::format_error);
    EXPECT_THROW((void)fmt::format(fmt::runtime("{:xx}"), thursday_), fmt::format_error);
}

TEST_F(EpochOpsTest, FormatBefore1900) {
    EXPECT_EQ(fmt::format("{}", Epoch::from_gregorian_tai_hms(1700, 4, 17, 2, 10, 9)),
              "1700-04-17T02:10:09 TAI");
}

TEST_F(EpochOpsTest, Rfc3339AndIsoformat) {
    EXPECT_EQ(thursday_.to_rfc3339(), "2022-12-01T10:11:12+00:00");
    EXPECT_EQ(precise_.to_rfc3339(), "2022-10-03T17:43:52.898032665+00:00");
    EXPECT_EQ(precise_.to_isoformat(), "2022-10-03T17:44:29.898032");
    EXPECT_EQ(thursday_.to_isoformat(), "2022-12-01T10:11:12.000000");
}
