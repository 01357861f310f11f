#pragma once

#include "tempus/detail/duration_math.hpp"

#include <cstdint>

namespace tempus {

/**
 * Time units a Duration can be built from or converted to.
 *
 * Multiplying a number by a Unit yields a Duration (see duration.hpp):
 * ```cpp
 * Duration d = 5 * Unit::Hour + 256 * Unit::Millisecond;
 * Duration half = 0.5 * Unit::Day;
 * ```
 */
enum class Unit : uint8_t {
    Nanosecond,
    Microsecond,
    Millisecond,
    Second,
    Minute,
    Hour,
    Day,
    Week,
    Century
};

/// Frequencies, whose period is a Duration
enum class Freq : uint8_t { GigaHertz, MegaHertz, KiloHertz, Hertz };

namespace detail {

/// Exact number of nanoseconds in one unit (a century fits on 62 bits)
constexpr uint64_t nanoseconds_per(Unit unit) noexcept {
    switch (unit) {
        case Unit::Nanosecond:
            return 1;
        case Unit::Microsecond:
            return NS_PER_US;
        case Unit::Millisecond:
            return NS_PER_MS;
        case Unit::Second:
            return NS_PER_SEC;
        case Unit::Minute:
            return NS_PER_MIN;
        case Unit::Hour:
            return NS_PER_HOUR;
        case Unit::Day:
            return NS_PER_DAY;
        case Unit::Week:
            return NS_PER_WEEK;
        case Unit::Century:
            return NS_PER_CENTURY;
    }
    return NS_PER_SEC;
}

/// Period of one cycle in nanoseconds
constexpr uint64_t period_nanoseconds(Freq freq) noexcept {
    switch (freq) {
        case Freq::GigaHertz:
            return 1;
        case Freq::MegaHertz:
            return NS_PER_US;
        case Freq::KiloHertz:
            return NS_PER_MS;
        case Freq::Hertz:
            return NS_PER_SEC;
    }
    return NS_PER_SEC;
}

} // namespace detail

/// Seconds in one unit
constexpr double in_seconds(Unit unit) noexcept {
    switch (unit) {
        case Unit::Nanosecond:
            return 1e-9;
        case Unit::Microsecond:
            return 1e-6;
        case Unit::Millisecond:
            return 1e-3;
        case Unit::Second:
            return 1.0;
        case Unit::Minute:
            return 60.0;
        case Unit::Hour:
            return 3'600.0;
        case Unit::Day:
            return 86'400.0;
        case Unit::Week:
            return 604'800.0;
        case Unit::Century:
            return 3'155'760'000.0;
    }
    return 1.0;
}

/// Units in one second (inverse of in_seconds)
constexpr double from_seconds(Unit unit) noexcept {
    return 1.0 / in_seconds(unit);
}

constexpr double in_hertz(Freq freq) noexcept {
    switch (freq) {
        case Freq::GigaHertz:
            return 1e9;
        case Freq::MegaHertz:
            return 1e6;
        case Freq::KiloHertz:
            return 1e3;
        case Freq::Hertz:
            return 1.0;
    }
    return 1.0;
}

/// Short unit symbol, as used when rendering a Duration
[[nodiscard]] constexpr const char* to_string(Unit unit) noexcept {
    switch (unit) {
        case Unit::Nanosecond:
            return "ns";
        case Unit::Microsecond:
            return "us";
        case Unit::Millisecond:
            return "ms";
        case Unit::Second:
            return "s";
        case Unit::Minute:
            return "min";
        case Unit::Hour:
            return "h";
        case Unit::Day:
            return "days";
        case Unit::Week:
            return "weeks";
        case Unit::Century:
            return "centuries";
    }
    return "?";
}

[[nodiscard]] constexpr const char* to_string(Freq freq) noexcept {
    switch (freq) {
        case Freq::GigaHertz:
            return "GHz";
        case Freq::MegaHertz:
            return "MHz";
        case Freq::KiloHertz:
            return "kHz";
        case Freq::Hertz:
            return "Hz";
    }
    return "?";
}

} // namespace tempus
