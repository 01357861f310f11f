#include <fmt/format.h>
#include <gtest/gtest.h>
#include <tempus/month.hpp>
#include <tempus/weekday.hpp>

using namespace tempus;

// ==============================================================================
// Weekday
// ==============================================================================

TEST(WeekdayTest, NumbersWrapAround) {
    EXPECT_EQ(weekday_from_number(0), Weekday::Monday);
    EXPECT_EQ(weekday_from_number(6), Weekday::Sunday);
    EXPECT_EQ(weekday_from_number(7), Weekday::Monday);
    EXPECT_EQ(weekday_from_number(-1), Weekday::Sunday);
    EXPECT_EQ(weekday_from_number(-15), Weekday::Sunday);
    EXPECT_EQ(to_number(Weekday::Thursday), 3);
}

TEST(WeekdayTest, Arithmetic) {
    EXPECT_EQ(Weekday::Sunday + 1, Weekday::Monday);
    EXPECT_EQ(Weekday::Monday - 1, Weekday::Sunday);
    EXPECT_EQ(Weekday::Wednesday + 15, Weekday::Thursday);
    EXPECT_EQ(Weekday::Wednesday - 15, Weekday::Tuesday);

    Weekday wd = Weekday::Friday;
    wd += 3;
    EXPECT_EQ(wd, Weekday::Monday);
    wd -= 8;
    EXPECT_EQ(wd, Weekday::Sunday);
}

TEST(WeekdayTest, DaysUntil) {
    EXPECT_EQ(days_until(Weekday::Monday, Weekday::Monday), 0);
    EXPECT_EQ(days_until(Weekday::Monday, Weekday::Sunday), 6);
    EXPECT_EQ(days_until(Weekday::Sunday, Weekday::Monday), 1);
    EXPECT_EQ(days_until(Weekday::Thursday, Weekday::Tuesday), 5);
}

TEST(WeekdayTest, NamesAndParsing) {
    EXPECT_STREQ(to_string(Weekday::Saturday), "Saturday");
    EXPECT_EQ(fmt::format("{}", Weekday::Tuesday), "Tuesday");

    auto parsed = parse_weekday("  wednesday ");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, Weekday::Wednesday);
    EXPECT_EQ(*parse_weekday("SUNDAY"), Weekday::Sunday);

    auto unknown = parse_weekday("Caturday");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ParseError::Kind::unknown_weekday);
}

// ==============================================================================
// MonthName
// ==============================================================================

TEST(MonthNameTest, Numbers) {
    EXPECT_EQ(month_from_number(1), MonthName::January);
    EXPECT_EQ(month_from_number(12), MonthName::December);
    EXPECT_EQ(month_from_number(0), MonthName::January);
    EXPECT_EQ(month_from_number(13), MonthName::January);
    EXPECT_EQ(to_number(MonthName::August), 8);
}

TEST(MonthNameTest, Names) {
    EXPECT_STREQ(to_string(MonthName::September), "September");
    EXPECT_STREQ(to_short_string(MonthName::September), "Sep");
    EXPECT_EQ(fmt::format("{}", MonthName::May), "May");
}

TEST(MonthNameTest, ParseSpellings) {
    for (auto name : {"jan", "Jan", "JAN", "january", "January", "JANUARY"}) {
        auto parsed = parse_month_name(name);
        ASSERT_TRUE(parsed.has_value()) << name;
        EXPECT_EQ(*parsed, MonthName::January) << name;
    }
    EXPECT_EQ(*parse_month_name("dec"), MonthName::December);
}

TEST(MonthNameTest, ParseRejectsMixedCase) {
    auto parsed = parse_month_name("jAnUaRy");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().kind, ParseError::Kind::unknown_month_name);
    EXPECT_FALSE(parse_month_name("Janu").has_value());
    EXPECT_FALSE(parse_month_name("").has_value());
}
