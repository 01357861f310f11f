#pragma once

#include "tempus/detail/ascii.hpp"
#include "tempus/duration.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"

#include <string_view>

#include <cstdint>

#include <fmt/format.h>

namespace tempus {

/**
 * Time scales an Epoch can be expressed in.
 *
 * Every scale counts from its own reference epoch; the "prime epoch" shared
 * by TAI, TT and UTC is 1900-01-01T00:00:00 TAI (the NTP epoch).
 *
 * | Scale | Reference epoch                       | Leap seconds |
 * |-------|---------------------------------------|--------------|
 * | TAI   | 1900-01-01T00:00:00                   | no           |
 * | TT    | 1900-01-01T00:00:00 (TAI + 32.184 s)  | no           |
 * | ET    | J2000 (2000-01-01T12:00:00)           | no           |
 * | TDB   | J2000 (2000-01-01T12:00:00)           | no           |
 * | UTC   | 1900-01-01T00:00:00                   | yes          |
 * | GPST  | 1980-01-06T00:00:00 UTC               | no           |
 * | GST   | 1999-08-22T00:00:00 UTC               | no           |
 * | BDT   | 2006-01-01T00:00:00 UTC               | no           |
 * | QZSST | same as GPST                          | no           |
 *
 * The numeric value is the stable one-byte encoding of the scale.
 */
enum class TimeScale : uint8_t {
    TAI = 0,
    TT = 1,
    ET = 2,
    TDB = 3,
    UTC = 4,
    GPST = 5,
    GST = 6,
    BDT = 7,
    QZSST = 8
};

// Reference constants, all counted from the prime epoch unless noted

inline constexpr double JD_J1900 = 2'415'020.0;
inline constexpr double JD_J2000 = 2'451'545.0;
inline constexpr double MJD_J1900 = 15'020.0;
inline constexpr double MJD_J2000 = 51'544.5;
/// Offset between Julian days and modified Julian days
inline constexpr double MJD_OFFSET = 2'400'000.5;
/// J2000 (2000-01-01T12:00:00) in TAI seconds past the prime epoch
inline constexpr int64_t ET_EPOCH_S = 3'155'716'800;
/// UNIX epoch (1970-01-01T00:00:00) in TAI seconds past the prime epoch
inline constexpr int64_t UNIX_EPOCH_S = 2'208'988'800;

inline constexpr int64_t SECONDS_GPS_TAI_OFFSET = 2'524'953'619;
inline constexpr int64_t SECONDS_GST_TAI_OFFSET = 3'144'268'819;
inline constexpr int64_t SECONDS_BDT_TAI_OFFSET = 3'345'062'433;

inline constexpr double DAYS_PER_YEAR = 365.25;
inline constexpr double DAYS_PER_CENTURY = 36'525.0;
inline constexpr double SECONDS_PER_DAY = 86'400.0;

/// Decodes the one-byte encoding; unknown codes map to TAI
constexpr TimeScale time_scale_from_code(uint8_t code) noexcept {
    return code <= static_cast<uint8_t>(TimeScale::QZSST) ? static_cast<TimeScale>(code)
                                                          : TimeScale::TAI;
}

constexpr uint8_t to_code(TimeScale ts) noexcept {
    return static_cast<uint8_t>(ts);
}

/// Only UTC applies leap seconds
constexpr bool uses_leap_seconds(TimeScale ts) noexcept {
    return ts == TimeScale::UTC;
}

constexpr bool is_gnss(TimeScale ts) noexcept {
    return ts == TimeScale::GPST || ts == TimeScale::GST || ts == TimeScale::BDT ||
           ts == TimeScale::QZSST;
}

/**
 * Offset of the scale's reference epoch from 1900-01-01T00:00:00 TAI.
 *
 * The GNSS offsets include the leap seconds in effect at their reference
 * epoch (19 s for GPST and GST, 33 s for BDT).
 */
constexpr Duration prime_epoch_offset(TimeScale ts) noexcept {
    switch (ts) {
        case TimeScale::ET:
        case TimeScale::TDB:
            // J2000 noon: one century minus a day plus twelve hours, since 1900 was not a leap year
            return ET_EPOCH_S * Unit::Second;
        case TimeScale::GPST:
        case TimeScale::QZSST:
            return SECONDS_GPS_TAI_OFFSET * Unit::Second;
        case TimeScale::GST:
            return SECONDS_GST_TAI_OFFSET * Unit::Second;
        case TimeScale::BDT:
            return SECONDS_BDT_TAI_OFFSET * Unit::Second;
        case TimeScale::TAI:
        case TimeScale::TT:
        case TimeScale::UTC:
            break;
    }
    return Duration::zero();
}

/**
 * Prime epoch offset without its seconds component.
 *
 * Calendar arithmetic in a GNSS scale is relative to the UTC midnight its
 * reference epoch was defined at, not to the TAI instant.
 */
constexpr Duration gregorian_epoch_offset(TimeScale ts) noexcept {
    const Duration prime = prime_epoch_offset(ts);
    return prime - prime.subdivision(Unit::Second).value_or(Duration::zero());
}

[[nodiscard]] constexpr const char* to_string(TimeScale ts) noexcept {
    switch (ts) {
        case TimeScale::TAI:
            return "TAI";
        case TimeScale::TT:
            return "TT";
        case TimeScale::ET:
            return "ET";
        case TimeScale::TDB:
            return "TDB";
        case TimeScale::UTC:
            return "UTC";
        case TimeScale::GPST:
            return "GPST";
        case TimeScale::GST:
            return "GST";
        case TimeScale::BDT:
            return "BDT";
        case TimeScale::QZSST:
            return "QZSST";
    }
    return "TAI";
}

/// Constellation name of a GNSS scale (GPS, GAL, BDS, QZSS), to_string() otherwise
[[nodiscard]] constexpr const char* to_constellation_string(TimeScale ts) noexcept {
    switch (ts) {
        case TimeScale::GPST:
            return "GPS";
        case TimeScale::GST:
            return "GAL";
        case TimeScale::BDT:
            return "BDS";
        case TimeScale::QZSST:
            return "QZSS";
        default:
            return to_string(ts);
    }
}

/**
 * Parse a time scale name.
 *
 * Names are case-sensitive; constellation names (GPS, GAL, BDS, QZSS) are
 * accepted for the GNSS scales.
 */
inline expected<TimeScale, ParseError> parse_time_scale(std::string_view name) noexcept {
    name = detail::trim(name);
    for (uint8_t code = 0; code <= to_code(TimeScale::QZSST); ++code) {
        const auto ts = static_cast<TimeScale>(code);
        if (name == to_string(ts) || name == to_constellation_string(ts)) {
            return ts;
        }
    }
    return unexpected(ParseError{ParseError::Kind::time_system, 0, "unknown time scale name"});
}

} // namespace tempus

template <>
struct fmt::formatter<tempus::TimeScale> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tempus::TimeScale ts, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(tempus::to_string(ts), ctx);
    }
};
