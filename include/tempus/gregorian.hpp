#pragma once

#include "tempus/detail/duration_math.hpp"
#include "tempus/duration.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"
#include "tempus/time_scale.hpp"

#include <array>

#include <cstdint>

namespace tempus {

/**
 * Broken-down Gregorian date and time.
 *
 * `nanos` holds everything below the second, in [0, 1e9).
 */
struct Gregorian {
    int32_t year{1900};
    uint8_t month{1};
    uint8_t day{1};
    uint8_t hour{0};
    uint8_t minute{0};
    uint8_t second{0};
    uint32_t nanos{0};

    friend constexpr bool operator==(const Gregorian&, const Gregorian&) noexcept = default;
};

inline constexpr int32_t REFERENCE_YEAR = 1900;

constexpr bool is_leap_year(int32_t year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/// Days in `month` of a non-leap year
constexpr uint8_t usual_days_per_month(uint8_t month) noexcept {
    switch (month) {
        case 2:
            return 28;
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        default:
            return 31;
    }
}

namespace detail {

inline constexpr std::array<uint16_t, 12> CUMULATIVE_DAYS_FOR_MONTH{
    0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};

/// Years whose June 30 ended with a leap second
constexpr bool july_leap_second_year(int32_t year) noexcept {
    switch (year) {
        case 1972:
        case 1981:
        case 1982:
        case 1983:
        case 1985:
        case 1992:
        case 1993:
        case 1994:
        case 1997:
        case 2012:
        case 2015:
            return true;
        default:
            return false;
    }
}

/// Years whose January 1 followed a leap second
constexpr bool january_leap_second_year(int32_t year) noexcept {
    switch (year) {
        case 1972:
        case 1973:
        case 1974:
        case 1975:
        case 1976:
        case 1977:
        case 1978:
        case 1979:
        case 1980:
        case 1988:
        case 1990:
        case 1991:
        case 1996:
        case 1999:
        case 2006:
        case 2009:
        case 2017:
            return true;
        default:
            return false;
    }
}

/// Leap years in [1, year)
constexpr int64_t leap_years_before(int64_t year) noexcept {
    const int64_t y = year - 1;
    return floor_div(y, 4) - floor_div(y, 100) + floor_div(y, 400);
}

/// Days from 1900-01-01 to January 1 of `year`
constexpr int64_t days_before_year(int64_t year) noexcept {
    return (year - REFERENCE_YEAR) * 365 + leap_years_before(year) -
           leap_years_before(REFERENCE_YEAR);
}

/// Days from January 1 to the first day of `month` (1-12)
constexpr int64_t days_before_month(int32_t year, uint8_t month) noexcept {
    int64_t days = CUMULATIVE_DAYS_FOR_MONTH[month - 1];
    if (month > 2 && is_leap_year(year)) {
        days += 1;
    }
    return days;
}

} // namespace detail

/**
 * Check a Gregorian date and time.
 *
 * Hour 24 is accepted and rolls over to the next day. Second 60 is only
 * accepted at 23:59 on June 30 or December 31 of a year in which the IERS
 * inserted a leap second at that instant.
 */
constexpr bool is_gregorian_valid(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                                  uint8_t minute, uint8_t second, uint32_t nanos) noexcept {
    const bool leap_second_minute =
        (month == 6 || month == 12) && day == usual_days_per_month(month) && hour == 23 &&
        minute == 59 &&
        ((month == 6 && detail::july_leap_second_year(year)) ||
         (month == 12 && detail::january_leap_second_year(year + 1)));
    const uint8_t max_second = leap_second_minute ? 60 : 59;

    if (month == 0 || month > 12 || day == 0 || day > 31 || hour > 24 || minute > 59 ||
        second > max_second || nanos >= detail::NS_PER_SEC) {
        return false;
    }
    if (day > usual_days_per_month(month) && (month != 2 || !is_leap_year(year) || day > 29)) {
        return false;
    }
    return true;
}

namespace detail {

/**
 * Duration since the reference epoch of `ts` for a Gregorian date in `ts`.
 *
 * Second 60 encodes as second 59 of the same minute.
 *
 * @return CalendarError::invalid_gregorian_date if the fields do not form a
 *         valid date, CalendarError::carry if the instant is outside the
 *         Duration range
 */
constexpr expected<Duration, CalendarError> encode_gregorian(int32_t year, uint8_t month,
                                                             uint8_t day, uint8_t hour,
                                                             uint8_t minute, uint8_t second,
                                                             uint32_t nanos, TimeScale ts) noexcept {
    if (!is_gregorian_valid(year, month, day, hour, minute, second, nanos)) {
        return unexpected(CalendarError{CalendarError::Kind::invalid_gregorian_date});
    }

    const int64_t days = days_before_year(year) + days_before_month(year, month) + (day - 1);
    int128_t total = static_cast<int128_t>(days) * NS_PER_DAY +
                     static_cast<int128_t>(hour) * NS_PER_HOUR +
                     static_cast<int128_t>(minute) * NS_PER_MIN +
                     static_cast<int128_t>(second) * NS_PER_SEC + nanos;
    if (second == 60) {
        // The leap second and the one before it share a count
        total -= NS_PER_SEC;
    }
    total -= gregorian_epoch_offset(ts).total_nanoseconds();

    if (total > MAX_TOTAL_NS || total < MIN_TOTAL_NS) {
        return unexpected(CalendarError{CalendarError::Kind::carry});
    }
    return Duration::from_total_nanoseconds(total);
}

} // namespace detail

/**
 * Gregorian date of `duration` past the reference epoch of `ts`.
 *
 * Exact over the whole Duration range: days are floored so that instants
 * before 1900 decode to the correct date and time of day.
 */
constexpr Gregorian compute_gregorian(Duration duration, TimeScale ts) noexcept {
    using detail::int128_t;
    const int128_t total = duration.total_nanoseconds() + gregorian_epoch_offset(ts).total_nanoseconds();

    int128_t days_wide = total / detail::NS_PER_DAY;
    int128_t time_of_day = total % detail::NS_PER_DAY;
    if (time_of_day < 0) {
        time_of_day += detail::NS_PER_DAY;
        days_wide -= 1;
    }
    const auto days = static_cast<int64_t>(days_wide);

    // 146097 days per 400 years; the estimate is off by at most one year
    auto year = static_cast<int64_t>(REFERENCE_YEAR) + detail::floor_div(days * 400, 146'097);
    while (days < detail::days_before_year(year)) {
        --year;
    }
    while (days >= detail::days_before_year(year + 1)) {
        ++year;
    }
    const int64_t day_of_year = days - detail::days_before_year(year);

    uint8_t month = 12;
    while (month > 1 && day_of_year < detail::days_before_month(static_cast<int32_t>(year), month)) {
        --month;
    }
    const int64_t day = day_of_year - detail::days_before_month(static_cast<int32_t>(year), month) + 1;

    auto rest = static_cast<uint64_t>(time_of_day);
    Gregorian g;
    g.year = static_cast<int32_t>(year);
    g.month = month;
    g.day = static_cast<uint8_t>(day);
    g.hour = static_cast<uint8_t>(rest / detail::NS_PER_HOUR);
    rest %= detail::NS_PER_HOUR;
    g.minute = static_cast<uint8_t>(rest / detail::NS_PER_MIN);
    rest %= detail::NS_PER_MIN;
    g.second = static_cast<uint8_t>(rest / detail::NS_PER_SEC);
    g.nanos = static_cast<uint32_t>(rest % detail::NS_PER_SEC);
    return g;
}

} // namespace tempus
