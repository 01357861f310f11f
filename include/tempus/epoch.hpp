#pragma once

#include "tempus/detail/duration_math.hpp"
#include "tempus/detail/ephemeris_time.hpp"
#include "tempus/duration.hpp"
#include "tempus/duration_format.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"
#include "tempus/gregorian.hpp"
#include "tempus/leap_seconds.hpp"
#include "tempus/month.hpp"
#include "tempus/time_scale.hpp"
#include "tempus/unit.hpp"
#include "tempus/weekday.hpp"

#include <fmt/format.h>

#include <compare>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <cmath>
#include <cstdint>

namespace tempus {

class Ut1Provider;

namespace detail {

inline void require_finite(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Attempted to initialize Epoch with non finite number");
    }
}

/// TAI - UTC from the built-in table at a TAI duration, zero before 1960
inline Duration builtin_leap_seconds(Duration tai) noexcept {
    const auto delta = leap_seconds_at(tai.to_seconds(), true, BuiltinLeapSeconds{});
    return Duration::from_seconds(delta.value_or(0.0));
}

/// Floor of `total` nanoseconds in days
constexpr int64_t floor_days(int128_t total) noexcept {
    int128_t days = total / NS_PER_DAY;
    if (total % NS_PER_DAY < 0) {
        days -= 1;
    }
    return static_cast<int64_t>(days);
}

} // namespace detail

/**
 * An instant: a Duration past the reference epoch of a TimeScale.
 *
 * | Scale | Duration zero |
 * |-------|---------------|
 * | TAI, TT, UTC | 1900-01-01T00:00:00 in that scale |
 * | ET, TDB | J2000, 2000-01-01T12:00:00 |
 * | GPST, QZSST | 1980-01-06T00:00:00 UTC |
 * | GST | 1999-08-22T00:00:00 UTC |
 * | BDT | 2006-01-01T00:00:00 UTC |
 *
 * ## Conversion
 * to_time_scale() goes through TAI: the source duration is normalized to a
 * TAI duration past 1900, then converted into the target. UTC uses the
 * built-in IERS leap second table, ET the NAIF SPICE model and TDB the
 * Fairhead and Bretagnon leading term. Integer-offset scales convert
 * exactly; ET and TDB round trips agree to within a microsecond.
 *
 * ## Comparison
 * Epochs in different scales compare as instants. Equality converts the
 * epoch in a leap-second scale into the other scale, ordering converts the
 * right-hand side into the scale of the left-hand side.
 *
 * ## Usage
 * ```cpp
 * auto e = Epoch::from_gregorian_utc_hms(2022, 12, 1, 10, 11, 12);
 * auto gps = e.to_time_scale(TimeScale::GPST);
 * auto [week, tow] = gps.to_time_of_week();
 * fmt::print("{} {:x}\n", e, e); // "2022-12-01T10:11:12 UTC 2022-12-01T10:11:49 TAI"
 * ```
 *
 * Epoch is a trivially copyable value type. Constructors taking a double
 * throw std::invalid_argument on NaN or infinity; arithmetic saturates.
 */
class Epoch {
public:
    constexpr Epoch() noexcept = default;

    constexpr Epoch(Duration duration, TimeScale ts) noexcept
        : duration_(duration),
          time_scale_(ts) {}

    /// Duration past the reference epoch of time_scale()
    constexpr Duration duration() const noexcept { return duration_; }
    constexpr TimeScale time_scale() const noexcept { return time_scale_; }

    // ==========================================================================
    // Construction
    // ==========================================================================

    static constexpr Epoch from_duration(Duration d, TimeScale ts) noexcept { return Epoch(d, ts); }

    static constexpr Epoch from_tai_duration(Duration d) noexcept {
        return Epoch(d, TimeScale::TAI);
    }
    static constexpr Epoch from_tai_parts(int16_t centuries, uint64_t nanoseconds) noexcept {
        return from_tai_duration(Duration::from_parts(centuries, nanoseconds));
    }
    static Epoch from_tai_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_tai_duration(Duration::from_seconds(seconds));
    }
    static Epoch from_tai_days(double days) {
        detail::require_finite(days);
        return from_tai_duration(Duration::from_days(days));
    }

    static constexpr Epoch from_utc_duration(Duration d) noexcept {
        return Epoch(d, TimeScale::UTC);
    }
    static Epoch from_utc_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_utc_duration(Duration::from_seconds(seconds));
    }
    static Epoch from_utc_days(double days) {
        detail::require_finite(days);
        return from_utc_duration(Duration::from_days(days));
    }

    static constexpr Epoch from_tt_duration(Duration d) noexcept { return Epoch(d, TimeScale::TT); }
    static Epoch from_tt_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_tt_duration(Duration::from_seconds(seconds));
    }

    /// `d` is past J2000
    static constexpr Epoch from_et_duration(Duration d) noexcept { return Epoch(d, TimeScale::ET); }
    static Epoch from_et_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_et_duration(Duration::from_seconds(seconds));
    }

    /// `d` is past J2000
    static constexpr Epoch from_tdb_duration(Duration d) noexcept {
        return Epoch(d, TimeScale::TDB);
    }
    static Epoch from_tdb_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_tdb_duration(Duration::from_seconds(seconds));
    }

    static constexpr Epoch from_gpst_duration(Duration d) noexcept {
        return Epoch(d, TimeScale::GPST);
    }
    static Epoch from_gpst_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_gpst_duration(Duration::from_seconds(seconds));
    }
    static Epoch from_gpst_days(double days) {
        detail::require_finite(days);
        return from_gpst_duration(Duration::from_days(days));
    }
    static constexpr Epoch from_gpst_nanoseconds(uint64_t ns) noexcept {
        return from_gpst_duration(Duration::from_parts(0, ns));
    }

    static constexpr Epoch from_qzsst_duration(Duration d) noexcept {
        return Epoch(d, TimeScale::QZSST);
    }
    static Epoch from_qzsst_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_qzsst_duration(Duration::from_seconds(seconds));
    }
    static Epoch from_qzsst_days(double days) {
        detail::require_finite(days);
        return from_qzsst_duration(Duration::from_days(days));
    }
    static constexpr Epoch from_qzsst_nanoseconds(uint64_t ns) noexcept {
        return from_qzsst_duration(Duration::from_parts(0, ns));
    }

    static constexpr Epoch from_gst_duration(Duration d) noexcept {
        return Epoch(d, TimeScale::GST);
    }
    static Epoch from_gst_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_gst_duration(Duration::from_seconds(seconds));
    }
    static Epoch from_gst_days(double days) {
        detail::require_finite(days);
        return from_gst_duration(Duration::from_days(days));
    }
    static constexpr Epoch from_gst_nanoseconds(uint64_t ns) noexcept {
        return from_gst_duration(Duration::from_parts(0, ns));
    }

    static constexpr Epoch from_bdt_duration(Duration d) noexcept {
        return Epoch(d, TimeScale::BDT);
    }
    static Epoch from_bdt_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_bdt_duration(Duration::from_seconds(seconds));
    }
    static Epoch from_bdt_days(double days) {
        detail::require_finite(days);
        return from_bdt_duration(Duration::from_days(days));
    }
    static constexpr Epoch from_bdt_nanoseconds(uint64_t ns) noexcept {
        return from_bdt_duration(Duration::from_parts(0, ns));
    }

    /// Modified Julian Date in TAI
    static Epoch from_mjd_tai(double days) {
        detail::require_finite(days);
        return from_tai_duration(Duration::from_days(days - MJD_J1900));
    }

    /**
     * Modified Julian Date read on the calendar of `ts`.
     *
     * MJD 44244.0 GPST is the GPST reference epoch, MJD 51544.5 TDB is J2000.
     */
    static Epoch from_mjd_in_time_scale(double days, TimeScale ts) {
        detail::require_finite(days);
        return Epoch(Duration::from_days(days - MJD_J1900) - gregorian_epoch_offset(ts), ts);
    }
    static Epoch from_mjd_utc(double days) { return from_mjd_in_time_scale(days, TimeScale::UTC); }
    static Epoch from_mjd_gpst(double days) { return from_mjd_in_time_scale(days, TimeScale::GPST); }
    static Epoch from_mjd_qzsst(double days) {
        return from_mjd_in_time_scale(days, TimeScale::QZSST);
    }
    static Epoch from_mjd_gst(double days) { return from_mjd_in_time_scale(days, TimeScale::GST); }
    static Epoch from_mjd_bdt(double days) { return from_mjd_in_time_scale(days, TimeScale::BDT); }

    /// Julian Date in TAI
    static Epoch from_jde_tai(double days) {
        detail::require_finite(days);
        return from_tai_duration(Duration::from_days(days - MJD_J1900 - MJD_OFFSET));
    }
    static Epoch from_jde_in_time_scale(double days, TimeScale ts) {
        detail::require_finite(days);
        return Epoch(Duration::from_days(days - MJD_J1900 - MJD_OFFSET) - gregorian_epoch_offset(ts),
                     ts);
    }
    static Epoch from_jde_utc(double days) { return from_jde_in_time_scale(days, TimeScale::UTC); }
    static Epoch from_jde_gpst(double days) { return from_jde_in_time_scale(days, TimeScale::GPST); }
    static Epoch from_jde_qzsst(double days) {
        return from_jde_in_time_scale(days, TimeScale::QZSST);
    }
    static Epoch from_jde_gst(double days) { return from_jde_in_time_scale(days, TimeScale::GST); }
    static Epoch from_jde_bdt(double days) { return from_jde_in_time_scale(days, TimeScale::BDT); }

    /// Julian Ephemeris Date in ET, the inverse of to_jde_et_days()
    static Epoch from_jde_et(double days) { return from_jde_in_time_scale(days, TimeScale::ET); }
    /// Julian Ephemeris Date in TDB, the inverse of to_jde_tdb_days()
    static Epoch from_jde_tdb(double days) { return from_jde_in_time_scale(days, TimeScale::TDB); }

    /// UTC epoch `d` past 1970-01-01T00:00:00 UTC
    static constexpr Epoch from_unix_duration(Duration d) noexcept {
        return from_utc_duration(UNIX_EPOCH_S * Unit::Second + d);
    }
    static Epoch from_unix_seconds(double seconds) {
        detail::require_finite(seconds);
        return from_unix_duration(Duration::from_seconds(seconds));
    }
    static Epoch from_unix_milliseconds(double milliseconds) {
        detail::require_finite(milliseconds);
        return from_unix_duration(Duration::from_milliseconds(milliseconds));
    }

    /**
     * Epoch from a week counter and the nanoseconds into that week.
     *
     * Weeks count from the reference epoch of `ts`, so GPST week 0 starts on
     * 1980-01-06.
     */
    static constexpr Epoch from_time_of_week(uint32_t week, uint64_t nanoseconds,
                                             TimeScale ts) noexcept {
        const detail::int128_t total =
            static_cast<detail::int128_t>(week) * detail::NS_PER_WEEK + nanoseconds;
        return Epoch(Duration::from_total_nanoseconds(total), ts);
    }
    static constexpr Epoch from_time_of_week_utc(uint32_t week, uint64_t nanoseconds) noexcept {
        return from_time_of_week(week, nanoseconds, TimeScale::UTC);
    }

    /**
     * Epoch `days` into `year`, where 1.0 is January 1 at midnight.
     *
     * @throws std::invalid_argument if `days` is not finite or the year is
     *         out of range
     */
    static Epoch from_day_of_year(int32_t year, double days, TimeScale ts) {
        detail::require_finite(days);
        return from_gregorian(year, 1, 1, 0, 0, 0, 0, ts) + Duration::from_days(days - 1.0);
    }

    static Epoch from_ut1_duration(Duration d, const Ut1Provider& provider);

    // ==========================================================================
    // Gregorian construction
    // ==========================================================================

    /**
     * Epoch from a Gregorian date in `ts`.
     *
     * Out-of-range fields (month 13, day 32, minute 60, a second 60 that is
     * not an announced leap second...) are rejected as a whole and never
     * carry into the next field.
     *
     * @return CalendarError::invalid_gregorian_date if a field is out of
     *         range, CalendarError::carry only if a valid date does not fit
     *         a Duration
     */
    static constexpr expected<Epoch, CalendarError> maybe_from_gregorian(
        int32_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute, uint8_t second,
        uint32_t nanos, TimeScale ts) noexcept {
        auto duration = detail::encode_gregorian(year, month, day, hour, minute, second, nanos, ts);
        if (!duration) {
            return unexpected(duration.error());
        }
        return Epoch(*duration, ts);
    }

    static constexpr expected<Epoch, CalendarError> maybe_from_gregorian_tai(
        int32_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute, uint8_t second,
        uint32_t nanos) noexcept {
        return maybe_from_gregorian(year, month, day, hour, minute, second, nanos, TimeScale::TAI);
    }

    static constexpr expected<Epoch, CalendarError> maybe_from_gregorian_utc(
        int32_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute, uint8_t second,
        uint32_t nanos) noexcept {
        return maybe_from_gregorian(year, month, day, hour, minute, second, nanos, TimeScale::UTC);
    }

    /// @throws std::invalid_argument on an invalid date
    static Epoch from_gregorian(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                                uint8_t minute, uint8_t second, uint32_t nanos, TimeScale ts) {
        return detail::unwrap_or_throw(
            maybe_from_gregorian(year, month, day, hour, minute, second, nanos, ts));
    }
    static Epoch from_gregorian_at_midnight(int32_t year, uint8_t month, uint8_t day,
                                            TimeScale ts) {
        return from_gregorian(year, month, day, 0, 0, 0, 0, ts);
    }
    static Epoch from_gregorian_at_noon(int32_t year, uint8_t month, uint8_t day, TimeScale ts) {
        return from_gregorian(year, month, day, 12, 0, 0, 0, ts);
    }
    static Epoch from_gregorian_hms(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                                    uint8_t minute, uint8_t second, TimeScale ts) {
        return from_gregorian(year, month, day, hour, minute, second, 0, ts);
    }

    static Epoch from_gregorian_tai(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                                    uint8_t minute, uint8_t second, uint32_t nanos) {
        return from_gregorian(year, month, day, hour, minute, second, nanos, TimeScale::TAI);
    }
    static Epoch from_gregorian_tai_at_midnight(int32_t year, uint8_t month, uint8_t day) {
        return from_gregorian_at_midnight(year, month, day, TimeScale::TAI);
    }
    static Epoch from_gregorian_tai_at_noon(int32_t year, uint8_t month, uint8_t day) {
        return from_gregorian_at_noon(year, month, day, TimeScale::TAI);
    }
    static Epoch from_gregorian_tai_hms(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                                        uint8_t minute, uint8_t second) {
        return from_gregorian_hms(year, month, day, hour, minute, second, TimeScale::TAI);
    }

    static Epoch from_gregorian_utc(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                                    uint8_t minute, uint8_t second, uint32_t nanos) {
        return from_gregorian(year, month, day, hour, minute, second, nanos, TimeScale::UTC);
    }
    static Epoch from_gregorian_utc_at_midnight(int32_t year, uint8_t month, uint8_t day) {
        return from_gregorian_at_midnight(year, month, day, TimeScale::UTC);
    }
    static Epoch from_gregorian_utc_at_noon(int32_t year, uint8_t month, uint8_t day) {
        return from_gregorian_at_noon(year, month, day, TimeScale::UTC);
    }
    static Epoch from_gregorian_utc_hms(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                                        uint8_t minute, uint8_t second) {
        return from_gregorian_hms(year, month, day, hour, minute, second, TimeScale::UTC);
    }

    // ==========================================================================
    // Time scale conversion
    // ==========================================================================

    /**
     * The same instant expressed in `ts`.
     *
     * Never fails: values beyond the Duration range saturate.
     */
    Epoch to_time_scale(TimeScale ts) const noexcept {
        if (ts == time_scale_) {
            return *this;
        }
        return Epoch(duration_from_tai(to_tai_duration(), ts), ts);
    }

    Duration to_duration_in_time_scale(TimeScale ts) const noexcept {
        return to_time_scale(ts).duration_;
    }

    /// Nanoseconds past the reference epoch of `ts`
    expected<uint64_t, DurationError> to_nanoseconds_in_time_scale(TimeScale ts) const noexcept {
        const Duration d = to_duration_in_time_scale(ts);
        if (d.centuries() < 0) {
            return unexpected(DurationError{DurationError::Kind::underflow});
        }
        if (d.centuries() > 0) {
            return unexpected(DurationError{DurationError::Kind::overflow});
        }
        return d.nanoseconds();
    }

    /// Duration past 1900-01-01T00:00:00 TAI
    Duration to_tai_duration() const noexcept {
        switch (time_scale_) {
            case TimeScale::TAI:
                return duration_;
            case TimeScale::TT:
                return duration_ - detail::TT_OFFSET_MS * Unit::Millisecond;
            case TimeScale::UTC:
                // The table is indexed by TAI; near a step the UTC value is close enough
                return duration_ + detail::builtin_leap_seconds(duration_);
            case TimeScale::ET:
                return detail::et_to_tai(duration_);
            case TimeScale::TDB:
                return detail::tdb_to_tai(duration_);
            case TimeScale::GPST:
            case TimeScale::GST:
            case TimeScale::BDT:
            case TimeScale::QZSST:
                break;
        }
        return duration_ + prime_epoch_offset(time_scale_);
    }

    Duration to_duration_since_j1900() const noexcept { return to_tai_duration(); }

    std::pair<int16_t, uint64_t> to_tai_parts() const noexcept {
        return to_tai_duration().to_parts();
    }
    double to_tai_seconds() const noexcept { return to_tai_duration().to_seconds(); }
    double to_tai_days() const noexcept { return to_tai_duration().to_unit(Unit::Day); }
    double to_tai(Unit unit) const noexcept { return to_tai_duration().to_unit(unit); }

    Duration to_utc_duration() const noexcept { return to_duration_in_time_scale(TimeScale::UTC); }
    double to_utc_seconds() const noexcept { return to_utc_duration().to_seconds(); }
    double to_utc_days() const noexcept { return to_utc_duration().to_unit(Unit::Day); }
    double to_utc(Unit unit) const noexcept { return to_utc_duration().to_unit(unit); }

    Duration to_tt_duration() const noexcept { return to_duration_in_time_scale(TimeScale::TT); }
    double to_tt_seconds() const noexcept { return to_tt_duration().to_seconds(); }
    double to_tt_days() const noexcept { return to_tt_duration().to_unit(Unit::Day); }
    /// TT past J2000
    Duration to_tt_since_j2k() const noexcept {
        return to_tt_duration() - ET_EPOCH_S * Unit::Second;
    }
    double to_tt_centuries_j2k() const noexcept {
        return to_tt_since_j2k().to_unit(Unit::Century);
    }

    /// ET past J2000
    Duration to_et_duration() const noexcept { return to_duration_in_time_scale(TimeScale::ET); }
    double to_et_seconds() const noexcept { return to_et_duration().to_seconds(); }
    double to_et_days_since_j2000() const noexcept { return to_et_duration().to_unit(Unit::Day); }
    double to_et_centuries_since_j2000() const noexcept {
        return to_et_duration().to_unit(Unit::Century);
    }

    /// TDB past J2000
    Duration to_tdb_duration() const noexcept { return to_duration_in_time_scale(TimeScale::TDB); }
    double to_tdb_seconds() const noexcept { return to_tdb_duration().to_seconds(); }
    double to_tdb_days_since_j2000() const noexcept { return to_tdb_duration().to_unit(Unit::Day); }
    double to_tdb_centuries_since_j2000() const noexcept {
        return to_tdb_duration().to_unit(Unit::Century);
    }

    Duration to_gpst_duration() const noexcept { return to_duration_in_time_scale(TimeScale::GPST); }
    double to_gpst_seconds() const noexcept { return to_gpst_duration().to_seconds(); }
    double to_gpst_days() const noexcept { return to_gpst_duration().to_unit(Unit::Day); }
    expected<uint64_t, DurationError> to_gpst_nanoseconds() const noexcept {
        return to_nanoseconds_in_time_scale(TimeScale::GPST);
    }

    Duration to_qzsst_duration() const noexcept {
        return to_duration_in_time_scale(TimeScale::QZSST);
    }
    double to_qzsst_seconds() const noexcept { return to_qzsst_duration().to_seconds(); }
    double to_qzsst_days() const noexcept { return to_qzsst_duration().to_unit(Unit::Day); }
    expected<uint64_t, DurationError> to_qzsst_nanoseconds() const noexcept {
        return to_nanoseconds_in_time_scale(TimeScale::QZSST);
    }

    Duration to_gst_duration() const noexcept { return to_duration_in_time_scale(TimeScale::GST); }
    double to_gst_seconds() const noexcept { return to_gst_duration().to_seconds(); }
    double to_gst_days() const noexcept { return to_gst_duration().to_unit(Unit::Day); }
    expected<uint64_t, DurationError> to_gst_nanoseconds() const noexcept {
        return to_nanoseconds_in_time_scale(TimeScale::GST);
    }

    Duration to_bdt_duration() const noexcept { return to_duration_in_time_scale(TimeScale::BDT); }
    double to_bdt_seconds() const noexcept { return to_bdt_duration().to_seconds(); }
    double to_bdt_days() const noexcept { return to_bdt_duration().to_unit(Unit::Day); }
    expected<uint64_t, DurationError> to_bdt_nanoseconds() const noexcept {
        return to_nanoseconds_in_time_scale(TimeScale::BDT);
    }

    /// UTC past 1970-01-01T00:00:00 UTC
    Duration to_unix_duration() const noexcept {
        return to_utc_duration() - UNIX_EPOCH_S * Unit::Second;
    }
    double to_unix(Unit unit) const noexcept { return to_unix_duration().to_unit(unit); }
    double to_unix_seconds() const noexcept { return to_unix(Unit::Second); }
    double to_unix_milliseconds() const noexcept { return to_unix(Unit::Millisecond); }
    double to_unix_days() const noexcept { return to_unix(Unit::Day); }

    // Julian dates. MJD counts from 1858-11-17T00:00:00, JD from noon of
    // 4713-01-01 BC (Julian calendar).

    Duration to_mjd_tai_duration() const noexcept {
        return to_tai_duration() + Duration::from_days(MJD_J1900);
    }
    double to_mjd_tai(Unit unit) const noexcept { return to_mjd_tai_duration().to_unit(unit); }
    double to_mjd_tai_days() const noexcept { return to_mjd_tai(Unit::Day); }
    double to_mjd_tai_seconds() const noexcept { return to_mjd_tai(Unit::Second); }

    Duration to_mjd_utc_duration() const noexcept {
        return to_utc_duration() + Duration::from_days(MJD_J1900);
    }
    double to_mjd_utc(Unit unit) const noexcept { return to_mjd_utc_duration().to_unit(unit); }
    double to_mjd_utc_days() const noexcept { return to_mjd_utc(Unit::Day); }
    double to_mjd_utc_seconds() const noexcept { return to_mjd_utc(Unit::Second); }

    Duration to_mjd_tt_duration() const noexcept {
        return to_tt_duration() + Duration::from_days(MJD_J1900);
    }
    double to_mjd_tt_days() const noexcept { return to_mjd_tt_duration().to_unit(Unit::Day); }

    Duration to_jde_tai_duration() const noexcept {
        return to_mjd_tai_duration() + Duration::from_days(MJD_OFFSET);
    }
    double to_jde_tai(Unit unit) const noexcept { return to_jde_tai_duration().to_unit(unit); }
    double to_jde_tai_days() const noexcept { return to_jde_tai(Unit::Day); }
    double to_jde_tai_seconds() const noexcept { return to_jde_tai(Unit::Second); }

    Duration to_jde_utc_duration() const noexcept {
        return to_mjd_utc_duration() + Duration::from_days(MJD_OFFSET);
    }
    double to_jde_utc_days() const noexcept { return to_jde_utc_duration().to_unit(Unit::Day); }
    double to_jde_utc_seconds() const noexcept {
        return to_jde_utc_duration().to_unit(Unit::Second);
    }

    Duration to_jde_tt_duration() const noexcept {
        return to_mjd_tt_duration() + Duration::from_days(MJD_OFFSET);
    }
    double to_jde_tt_days() const noexcept { return to_jde_tt_duration().to_unit(Unit::Day); }

    Duration to_jde_et_duration() const noexcept {
        return to_et_duration() + Duration::from_days(MJD_J1900 + MJD_OFFSET) +
               prime_epoch_offset(TimeScale::ET);
    }
    double to_jde_et(Unit unit) const noexcept { return to_jde_et_duration().to_unit(unit); }
    double to_jde_et_days() const noexcept { return to_jde_et(Unit::Day); }

    Duration to_jde_tdb_duration() const noexcept {
        return to_tdb_duration() + Duration::from_days(MJD_J1900 + MJD_OFFSET) +
               prime_epoch_offset(TimeScale::TDB);
    }
    double to_jde_tdb(Unit unit) const noexcept { return to_jde_tdb_duration().to_unit(unit); }
    double to_jde_tdb_days() const noexcept { return to_jde_tdb(Unit::Day); }

    // ==========================================================================
    // Leap seconds and UT1
    // ==========================================================================

    /// TAI - UTC from `provider`, nullopt before its first entry
    template <LeapSecondProvider P>
    std::optional<double> leap_seconds_with(bool iers_only, const P& provider) const noexcept {
        return detail::leap_seconds_at(to_tai_seconds(), iers_only, provider);
    }

    std::optional<double> leap_seconds(bool iers_only) const noexcept {
        return leap_seconds_with(iers_only, BuiltinLeapSeconds{});
    }

    /// IERS leap seconds in effect, zero before 1972
    int leap_seconds_iers() const noexcept {
        return static_cast<int>(leap_seconds(true).value_or(0.0));
    }

    std::optional<Duration> ut1_offset(const Ut1Provider& provider) const;
    Duration to_ut1_duration(const Ut1Provider& provider) const;
    /// TAI-tagged epoch holding the UT1 duration
    Epoch to_ut1(const Ut1Provider& provider) const;

    // ==========================================================================
    // Calendar
    // ==========================================================================

    Gregorian to_gregorian(TimeScale ts) const noexcept {
        return compute_gregorian(to_duration_in_time_scale(ts), ts);
    }
    Gregorian to_gregorian_utc() const noexcept { return to_gregorian(TimeScale::UTC); }
    Gregorian to_gregorian_tai() const noexcept { return to_gregorian(TimeScale::TAI); }

    // Calendar fields, in the epoch's own time scale
    int32_t year() const noexcept { return own_gregorian().year; }
    MonthName month_name() const noexcept { return month_from_number(own_gregorian().month); }
    uint8_t hours() const noexcept { return own_gregorian().hour; }
    uint8_t minutes() const noexcept { return own_gregorian().minute; }
    uint8_t seconds() const noexcept { return own_gregorian().second; }
    uint32_t milliseconds() const noexcept { return own_gregorian().nanos / 1'000'000; }
    uint32_t microseconds() const noexcept { return own_gregorian().nanos / 1'000 % 1'000; }
    uint32_t nanoseconds() const noexcept { return own_gregorian().nanos % 1'000; }

    /// Time elapsed since January 1 at midnight of year()
    Duration duration_in_year() const {
        return duration_ - from_gregorian_at_midnight(year(), 1, 1, time_scale_).duration_;
    }

    /// 1.0 on January 1 at midnight
    double day_of_year() const { return duration_in_year().to_unit(Unit::Day) + 1.0; }

    std::pair<int32_t, double> year_days_of_year() const { return {year(), day_of_year()}; }

    // ==========================================================================
    // Weeks
    // ==========================================================================

    /**
     * Week counter and nanoseconds into the week, both past the reference
     * epoch of the epoch's own time scale.
     *
     * The week counter is unsigned: epochs before the reference epoch clamp
     * to (0, 0), the reference epoch itself. The whole Duration range fits
     * the counter after the reference.
     */
    constexpr std::pair<uint32_t, uint64_t> to_time_of_week() const noexcept {
        const detail::int128_t total = duration_.total_nanoseconds();
        if (total < 0) {
            return {0, 0};
        }
        const detail::int128_t weeks = total / detail::NS_PER_WEEK;
        const detail::int128_t rest = total % detail::NS_PER_WEEK;
        return {static_cast<uint32_t>(weeks), static_cast<uint64_t>(rest)};
    }

    Weekday weekday_in_time_scale(TimeScale ts) const noexcept {
        const detail::int128_t total = to_duration_in_time_scale(ts).total_nanoseconds() +
                                       gregorian_epoch_offset(ts).total_nanoseconds();
        // 1900-01-01 was a Monday
        return Weekday::Monday + detail::floor_days(total);
    }
    Weekday weekday() const noexcept { return weekday_in_time_scale(TimeScale::TAI); }
    Weekday weekday_utc() const noexcept { return weekday_in_time_scale(TimeScale::UTC); }

    /// Same time of day on the next `wd`, a week later if today is `wd`
    Epoch next(Weekday wd) const noexcept {
        const int64_t days = days_until(weekday(), wd);
        return *this + (days == 0 ? DAYS_PER_WEEK : days) * Unit::Day;
    }

    /// Same time of day on the previous `wd`, a week earlier if today is `wd`
    Epoch previous(Weekday wd) const noexcept {
        const int64_t days = days_until(wd, weekday());
        return *this - (days == 0 ? DAYS_PER_WEEK : days) * Unit::Day;
    }

    Epoch next_weekday_at_midnight(Weekday wd) const { return next(wd).with_hms_strict(0, 0, 0); }
    Epoch next_weekday_at_noon(Weekday wd) const { return next(wd).with_hms_strict(12, 0, 0); }
    Epoch previous_weekday_at_midnight(Weekday wd) const {
        return previous(wd).with_hms_strict(0, 0, 0);
    }
    Epoch previous_weekday_at_noon(Weekday wd) const {
        return previous(wd).with_hms_strict(12, 0, 0);
    }

    // ==========================================================================
    // Time of day replacement
    // ==========================================================================

    /**
     * Same date and subseconds with the time of day set to `hours:minutes:seconds`.
     *
     * @throws std::invalid_argument if the fields are out of range
     */
    Epoch with_hms(uint8_t hours, uint8_t minutes, uint8_t seconds) const {
        const Gregorian g = own_gregorian();
        return from_gregorian(g.year, g.month, g.day, hours, minutes, seconds, g.nanos,
                              time_scale_);
    }

    /// with_hms() with the subseconds cleared
    Epoch with_hms_strict(uint8_t hours, uint8_t minutes, uint8_t seconds) const {
        const Gregorian g = own_gregorian();
        return from_gregorian(g.year, g.month, g.day, hours, minutes, seconds, 0, time_scale_);
    }

    /// Hours, minutes and seconds of `other` read in this epoch's scale
    Epoch with_hms_from(const Epoch& other) const {
        const Gregorian o = other.to_gregorian(time_scale_);
        return with_hms(o.hour, o.minute, o.second);
    }

    Epoch with_hms_strict_from(const Epoch& other) const {
        const Gregorian o = other.to_gregorian(time_scale_);
        return with_hms_strict(o.hour, o.minute, o.second);
    }

    /// This date with the full time of day of `other`, subseconds included
    Epoch with_time_from(const Epoch& other) const {
        const Gregorian g = own_gregorian();
        const Gregorian o = other.to_gregorian(time_scale_);
        return from_gregorian(g.year, g.month, g.day, o.hour, o.minute, o.second, o.nanos,
                              time_scale_);
    }

    // ==========================================================================
    // Rounding
    // ==========================================================================

    constexpr Epoch floor(Duration step) const noexcept {
        return Epoch(duration_.floor(step), time_scale_);
    }
    constexpr Epoch ceil(Duration step) const noexcept {
        return Epoch(duration_.ceil(step), time_scale_);
    }
    constexpr Epoch round(Duration step) const noexcept {
        return Epoch(duration_.round(step), time_scale_);
    }

    Epoch min(const Epoch& other) const noexcept { return other < *this ? other : *this; }
    Epoch max(const Epoch& other) const noexcept { return other > *this ? other : *this; }

    // ==========================================================================
    // Formatting
    // ==========================================================================

    /// `YYYY-MM-DDTHH:MM:SS[.nnnnnnnnn] SCALE` in `ts`
    std::string to_gregorian_str(TimeScale ts) const;

    /// `YYYY-MM-DDTHH:MM:SS[.nnnnnnnnn]+00:00` in UTC
    std::string to_rfc3339() const;

    /// `YYYY-MM-DDTHH:MM:SS.ffffff` in the epoch's own scale, microseconds truncated
    std::string to_isoformat() const;

    // ==========================================================================
    // Arithmetic
    // ==========================================================================

    constexpr Epoch& operator+=(Duration d) noexcept {
        duration_ += d;
        return *this;
    }
    constexpr Epoch& operator-=(Duration d) noexcept {
        duration_ -= d;
        return *this;
    }
    constexpr Epoch& operator+=(Unit unit) noexcept { return *this += to_duration(unit); }
    constexpr Epoch& operator-=(Unit unit) noexcept { return *this -= to_duration(unit); }

    friend constexpr Epoch operator+(Epoch e, Duration d) noexcept { return e += d; }
    friend constexpr Epoch operator-(Epoch e, Duration d) noexcept { return e -= d; }
    friend constexpr Epoch operator+(Epoch e, Unit unit) noexcept { return e += unit; }
    friend constexpr Epoch operator-(Epoch e, Unit unit) noexcept { return e -= unit; }

    /// Adds `seconds`
    friend Epoch operator+(Epoch e, double seconds) noexcept {
        return e += Duration::from_seconds(seconds);
    }
    friend Epoch operator-(Epoch e, double seconds) noexcept {
        return e -= Duration::from_seconds(seconds);
    }

    /// Elapsed time from `rhs` to `lhs`, measured in the scale of `lhs`
    friend Duration operator-(const Epoch& lhs, const Epoch& rhs) noexcept {
        return lhs.duration_ - rhs.to_duration_in_time_scale(lhs.time_scale_);
    }

    // ==========================================================================
    // Comparison
    // ==========================================================================

    friend bool operator==(const Epoch& lhs, const Epoch& rhs) noexcept {
        const auto [left, right] = comparable_durations(lhs, rhs);
        return left == right;
    }

    friend std::strong_ordering operator<=>(const Epoch& lhs, const Epoch& rhs) noexcept {
        const auto [left, right] = comparable_durations(lhs, rhs);
        return left <=> right;
    }

private:
    // Both durations in the scale of `lhs`, or in the scale of `rhs` when only
    // `lhs` counts leap seconds. UTC is never the target of a mixed
    // comparison, so the two TAI seconds of a leap second stay distinct.
    static std::pair<Duration, Duration> comparable_durations(const Epoch& lhs,
                                                              const Epoch& rhs) noexcept {
        if (lhs.time_scale_ == rhs.time_scale_) {
            return {lhs.duration_, rhs.duration_};
        }
        if (uses_leap_seconds(lhs.time_scale_) && !uses_leap_seconds(rhs.time_scale_)) {
            return {lhs.to_duration_in_time_scale(rhs.time_scale_), rhs.duration_};
        }
        return {lhs.duration_, rhs.to_duration_in_time_scale(lhs.time_scale_)};
    }

    static Duration duration_from_tai(Duration tai, TimeScale ts) noexcept {
        switch (ts) {
            case TimeScale::TAI:
                return tai;
            case TimeScale::TT:
                return tai + detail::TT_OFFSET_MS * Unit::Millisecond;
            case TimeScale::UTC:
                return tai - detail::builtin_leap_seconds(tai);
            case TimeScale::ET:
                return detail::tai_to_et(tai);
            case TimeScale::TDB:
                return detail::tai_to_tdb(tai);
            case TimeScale::GPST:
            case TimeScale::GST:
            case TimeScale::BDT:
            case TimeScale::QZSST:
                break;
        }
        return tai - prime_epoch_offset(ts);
    }

    constexpr Gregorian own_gregorian() const noexcept {
        return compute_gregorian(duration_, time_scale_);
    }

    Duration duration_{};
    TimeScale time_scale_{TimeScale::TAI};
};

/// Duration zero of `ts`, as an epoch in that scale
constexpr Epoch reference_epoch(TimeScale ts) noexcept {
    return Epoch(Duration::zero(), ts);
}

/// 1970-01-01T00:00:00 UTC
inline constexpr Epoch UNIX_REF_EPOCH{UNIX_EPOCH_S * Unit::Second, TimeScale::UTC};

/// 2000-01-01T12:00:00 TT
inline constexpr Epoch J2000_REF_EPOCH{ET_EPOCH_S * Unit::Second, TimeScale::TT};

} // namespace tempus

/**
 * Formats an Epoch as `YYYY-MM-DDTHH:MM:SS[.nnnnnnnnn] SCALE`.
 *
 * Without a presentation type the epoch's own scale is used. `x` renders in
 * TAI, `X` in TT, `e` in TDB and `E` in ET.
 */
template <>
struct fmt::formatter<tempus::Epoch> {
    std::optional<tempus::TimeScale> scale;

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') {
            switch (*it) {
                case 'x':
                    scale = tempus::TimeScale::TAI;
                    break;
                case 'X':
                    scale = tempus::TimeScale::TT;
                    break;
                case 'e':
                    scale = tempus::TimeScale::TDB;
                    break;
                case 'E':
                    scale = tempus::TimeScale::ET;
                    break;
                default:
                    throw format_error("invalid format specifier for Epoch");
            }
            ++it;
        }
        if (it != ctx.end() && *it != '}') {
            throw format_error("invalid format specifier for Epoch");
        }
        return it;
    }

    template <typename FormatContext>
    auto format(const tempus::Epoch& e, FormatContext& ctx) const -> decltype(ctx.out()) {
        const tempus::TimeScale ts = scale.value_or(e.time_scale());
        const tempus::Gregorian g = e.to_gregorian(ts);
        auto out = fmt::format_to(ctx.out(), "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", g.year,
                                  g.month, g.day, g.hour, g.minute, g.second);
        if (g.nanos != 0) {
            out = fmt::format_to(out, ".{:09}", g.nanos);
        }
        return fmt::format_to(out, " {}", tempus::to_string(ts));
    }
};

namespace tempus {

inline std::string Epoch::to_gregorian_str(TimeScale ts) const {
    return fmt::format("{}", to_time_scale(ts));
}

inline std::string Epoch::to_rfc3339() const {
    const Gregorian g = to_gregorian_utc();
    std::string out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", g.year, g.month, g.day,
                                  g.hour, g.minute, g.second);
    if (g.nanos != 0) {
        out += fmt::format(".{:09}", g.nanos);
    }
    out += "+00:00";
    return out;
}

inline std::string Epoch::to_isoformat() const {
    const Gregorian g = own_gregorian();
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}", g.year, g.month, g.day,
                       g.hour, g.minute, g.second, g.nanos / 1'000);
}

[[nodiscard]] inline std::string to_string(const Epoch& e) {
    return fmt::format("{}", e);
}

inline std::ostream& operator<<(std::ostream& os, const Epoch& e) {
    return os << to_string(e);
}

} // namespace tempus
