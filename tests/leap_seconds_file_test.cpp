#include <filesystem>

#include <cerrno>

#include <gtest/gtest.h>
#include <tempus/epoch.hpp>
#include <tempus/leap_seconds_file.hpp>

using namespace tempus;

const std::filesystem::path test_data_dir = TEMPUS_TEST_DATA_DIR;
const auto leap_seconds_list = test_data_dir / "leap-seconds.list";

// ==============================================================================
// Loading the IERS list
// ==============================================================================

TEST(LeapSecondsFileTest, LoadsIersList) {
    auto table = LeapSecondsFile::from_path(leap_seconds_list.string());
    ASSERT_TRUE(table.has_value()) << table.error().message();
    ASSERT_EQ(table->size(), 28u);

    EXPECT_DOUBLE_EQ((*table)[0].timestamp_tai_s, 2'272'060'800.0);
    EXPECT_DOUBLE_EQ((*table)[0].delta_at, 10.0);
    EXPECT_DOUBLE_EQ((*table)[27].timestamp_tai_s, 3'692'217'600.0);
    EXPECT_DOUBLE_EQ((*table)[27].delta_at, 37.0);
    for (const LeapSecond& leap : *table) {
        EXPECT_TRUE(leap.announced_by_iers);
    }
}

TEST(LeapSecondsFileTest, MatchesBuiltinIersEntries) {
    auto table = LeapSecondsFile::from_path(leap_seconds_list.string());
    ASSERT_TRUE(table.has_value());

    BuiltinLeapSeconds builtin;
    size_t i = 0;
    for (const LeapSecond& leap : builtin) {
        if (!leap.announced_by_iers) {
            continue;
        }
        ASSERT_LT(i, table->size());
        EXPECT_EQ((*table)[i], leap) << i;
        ++i;
    }
    EXPECT_EQ(i, table->size());
}

TEST(LeapSecondsFileTest, EpochLookupWithFile) {
    auto table = LeapSecondsFile::from_path(leap_seconds_list.string());
    ASSERT_TRUE(table.has_value());

    auto e = Epoch::from_gregorian_utc_at_midnight(2010, 1, 1);
    EXPECT_DOUBLE_EQ(*e.leap_seconds_with(true, *table), 34.0);
    EXPECT_EQ(e.leap_seconds_with(true, *table), e.leap_seconds(true));

    auto early = Epoch::from_gregorian_utc_at_midnight(1971, 1, 1);
    EXPECT_FALSE(early.leap_seconds_with(false, *table).has_value());
}

// ==============================================================================
// Parsing edge cases
// ==============================================================================

TEST(LeapSecondsFileTest, SortsOutOfOrderLines) {
    auto table = LeapSecondsFile::from_string("2287785600 11\n# comment\n\n2272060800 10\n");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->size(), 2u);
    EXPECT_DOUBLE_EQ((*table)[0].delta_at, 10.0);
    EXPECT_DOUBLE_EQ((*table)[1].delta_at, 11.0);
}

TEST(LeapSecondsFileTest, EmptyInputGivesEmptyTable) {
    auto table = LeapSecondsFile::from_string("# nothing but comments\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_TRUE(table->empty());
}

TEST(LeapSecondsFileTest, MissingColumn) {
    auto table = LeapSecondsFile::from_string("2272060800\n");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().kind, ParseError::Kind::unknown_format);
}

TEST(LeapSecondsFileTest, InvalidNumber) {
    auto table = LeapSecondsFile::from_string("2272060800 ten # 1 Jan 1972\n");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().kind, ParseError::Kind::value_error);
}

TEST(LeapSecondsFileTest, MissingFile) {
    auto table = LeapSecondsFile::from_path((test_data_dir / "does-not-exist.list").string());
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().kind, ParseError::Kind::io_error);
    EXPECT_EQ(table.error().errno_value, ENOENT);
}
