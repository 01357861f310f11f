#include <filesystem>

#include <cerrno>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <tempus/ut1.hpp>

using namespace tempus;

const std::filesystem::path test_data_dir = TEMPUS_TEST_DATA_DIR;

class Ut1ProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto loaded = Ut1Provider::from_eop_file((test_data_dir / "eop2.short").string());
        ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
        provider_ = std::move(*loaded);
    }

    Ut1Provider provider_;
};

// ==============================================================================
// Loading
// ==============================================================================

TEST_F(Ut1ProviderTest, LoadsRecords) {
    ASSERT_EQ(provider_.size(), 6u);
    EXPECT_FALSE(provider_.empty());
    EXPECT_EQ(provider_[0].epoch, Epoch::from_mjd_tai(59'579.0));
    EXPECT_EQ(provider_[3].delta_tai_minus_ut1,
              37'110 * Unit::Millisecond + 79'400 * Unit::Nanosecond);

    for (size_t i = 1; i < provider_.size(); ++i) {
        EXPECT_LT(provider_[i - 1].epoch, provider_[i].epoch);
    }
}

TEST_F(Ut1ProviderTest, IsARange) {
    size_t count = 0;
    for (const DeltaTaiUt1& record : provider_) {
        EXPECT_EQ(record.epoch.time_scale(), TimeScale::TAI);
        ++count;
    }
    EXPECT_EQ(count, provider_.size());
}

// ==============================================================================
// Lookup
// ==============================================================================

TEST_F(Ut1ProviderTest, LookupTakesPreviousRecord) {
    auto e = Epoch::from_mjd_tai(59'582.5);
    const DeltaTaiUt1* record = provider_.at(e);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->epoch, Epoch::from_mjd_tai(59'582.0));

    // A record only applies strictly after its epoch
    record = provider_.at(Epoch::from_mjd_tai(59'582.0));
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->epoch, Epoch::from_mjd_tai(59'581.0));

    // Past the last record the last one still applies
    record = provider_.at(Epoch::from_mjd_tai(60'000.0));
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->epoch, Epoch::from_mjd_tai(59'584.0));
}

TEST_F(Ut1ProviderTest, LookupBeforeFirstRecord) {
    auto e = Epoch::from_mjd_tai(59'000.0);
    EXPECT_EQ(provider_.at(e), nullptr);
    EXPECT_FALSE(e.ut1_offset(provider_).has_value());
    EXPECT_EQ(e.to_ut1_duration(provider_), e.to_tai_duration());
}

TEST_F(Ut1ProviderTest, ToUt1) {
    auto epoch = Epoch::from_gregorian_utc(2022, 1, 3, 3, 5, 6, 789'100'000);
    EXPECT_EQ(fmt::format("{:x}", epoch.to_ut1(provider_)), "2022-01-03T03:05:06.679020600 TAI");
    EXPECT_EQ(*epoch.ut1_offset(provider_), 37'110 * Unit::Millisecond + 79'400 * Unit::Nanosecond);
}

TEST_F(Ut1ProviderTest, FromUt1Duration) {
    auto epoch = Epoch::from_gregorian_utc(2022, 1, 3, 3, 5, 6, 789'100'000);
    const Duration ut1 = epoch.to_ut1_duration(provider_);
    EXPECT_EQ(Epoch::from_ut1_duration(ut1, provider_), epoch);
}

// ==============================================================================
// Errors
// ==============================================================================

TEST(Ut1ParseTest, EmptyDataSection) {
    auto provider = Ut1Provider::from_eop_data("header\n EOP2=\n $END\n");
    ASSERT_TRUE(provider.has_value());
    EXPECT_TRUE(provider->empty());
}

TEST(Ut1ParseTest, IgnoresLinesAfterEnd) {
    auto provider = Ut1Provider::from_eop_data(" EOP2=\n 59580.00, 1, 2, 37109.6\n $END\n garbage\n");
    ASSERT_TRUE(provider.has_value());
    EXPECT_EQ(provider->size(), 1u);
}

TEST(Ut1ParseTest, TooFewColumns) {
    auto provider = Ut1Provider::from_eop_data(" EOP2=\n 59580.00, 1, 2\n $END\n");
    ASSERT_FALSE(provider.has_value());
    EXPECT_EQ(provider.error().kind, ParseError::Kind::unknown_format);
}

TEST(Ut1ParseTest, InvalidNumbers) {
    auto bad_mjd = Ut1Provider::from_eop_data(" EOP2=\n MJD, 1, 2, 37109.6\n $END\n");
    ASSERT_FALSE(bad_mjd.has_value());
    EXPECT_EQ(bad_mjd.error().kind, ParseError::Kind::value_error);

    auto bad_delta = Ut1Provider::from_eop_data(" EOP2=\n 59580.00, 1, 2, n/a\n $END\n");
    ASSERT_FALSE(bad_delta.has_value());
    EXPECT_EQ(bad_delta.error().kind, ParseError::Kind::value_error);
}

TEST(Ut1ParseTest, MissingFile) {
    auto provider = Ut1Provider::from_eop_file((test_data_dir / "missing.short").string());
    ASSERT_FALSE(provider.has_value());
    EXPECT_EQ(provider.error().kind, ParseError::Kind::io_error);
    EXPECT_EQ(provider.error().errno_value, ENOENT);
}
