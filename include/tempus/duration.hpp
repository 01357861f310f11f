#pragma once

#include "tempus/detail/duration_math.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"
#include "tempus/unit.hpp"

#include <compare>
#include <concepts>
#include <limits>
#include <optional>
#include <utility>

#include <cmath>
#include <cstdint>

namespace tempus {

/**
 * Duration split into its calendar-style components.
 *
 * All magnitudes are non-negative; `sign` carries the sign of the whole
 * duration and is -1, 0 or 1.
 */
struct Decomposition {
    int8_t sign{0};
    uint64_t days{0};
    uint64_t hours{0};
    uint64_t minutes{0};
    uint64_t seconds{0};
    uint64_t milliseconds{0};
    uint64_t microseconds{0};
    uint64_t nanoseconds{0};

    friend constexpr bool operator==(const Decomposition&, const Decomposition&) noexcept = default;
};

/**
 * Signed time span with exact nanosecond precision.
 *
 * ## Storage
 * 10-byte split representation: int16_t centuries + uint64_t nanoseconds,
 * where a century is 36,525 days of 86,400 s.
 *
 * ## Range
 * ±32,768 centuries (about ±3.27 million years) at 1 ns resolution.
 *
 * ## Negative Value Representation (Floor Semantics)
 * Negative durations use floor representation with always-positive nanoseconds:
 * - `-1 ns` = `{centuries: -1, nanoseconds: NANOSECONDS_PER_CENTURY - 1}`
 *
 * This ensures nanoseconds() always returns a value in [0, NANOSECONDS_PER_CENTURY)
 * and that comparing the (centuries, nanoseconds) pair lexicographically
 * orders durations by value.
 *
 * ## Overflow Policy
 * All arithmetic saturates to min()/max() on overflow:
 * - No exceptions are thrown
 * - `min() - 1 ns == min()` while `min() + 1 ns != min()`
 * - Narrowing accessors (try_truncated_nanoseconds) report overflow through
 *   expected<>
 *
 * This is a core library type: no allocation.
 */
class Duration {
public:
    static constexpr uint64_t NANOSECONDS_PER_CENTURY = detail::NS_PER_CENTURY;
    static constexpr uint64_t NANOSECONDS_PER_DAY = detail::NS_PER_DAY;
    static constexpr uint64_t NANOSECONDS_PER_SECOND = detail::NS_PER_SEC;
    static constexpr double SECONDS_PER_CENTURY = 3'155'760'000.0;

    // Named constants
    static constexpr Duration zero() noexcept { return Duration(0, 0); }

    static constexpr Duration min() noexcept {
        return Duration(std::numeric_limits<int16_t>::min(), 0);
    }

    static constexpr Duration max() noexcept {
        return Duration(std::numeric_limits<int16_t>::max(), detail::MAX_NANOS);
    }

    /// Smallest positive duration (1 ns)
    static constexpr Duration epsilon() noexcept { return Duration(0, 1); }
    static constexpr Duration min_positive() noexcept { return epsilon(); }

    /// Largest negative duration (-1 ns)
    static constexpr Duration min_negative() noexcept { return Duration(-1, detail::MAX_NANOS); }

    // Default construction - zero duration
    constexpr Duration() noexcept = default;

    /// Builds a duration from possibly non-normalized parts, saturating on overflow
    static constexpr Duration from_parts(int16_t centuries, uint64_t nanoseconds) noexcept {
        return from_total_nanoseconds(detail::to_total(centuries, nanoseconds));
    }

    static constexpr Duration from_total_nanoseconds(detail::int128_t ns) noexcept {
        auto [centuries, nanos] = detail::normalize(ns);
        return Duration(detail::clamp_to_duration(centuries, nanos), nanos);
    }

    static constexpr Duration from_truncated_nanoseconds(int64_t ns) noexcept {
        return from_total_nanoseconds(ns);
    }

    /**
     * Builds `value` units worth of time.
     *
     * The integer and fractional parts of `value` are scaled separately so
     * that whole units stay exact; the fractional part is rounded to the
     * nearest nanosecond. Infinite or out-of-range values saturate and NaN
     * yields zero.
     */
    static Duration from_unit(double value, Unit unit) noexcept {
        if (std::isnan(value)) {
            return zero();
        }
        const auto unit_ns = detail::nanoseconds_per(unit);
        const double limit =
            static_cast<double>(detail::MAX_TOTAL_NS) / static_cast<double>(unit_ns) + 1.0;
        if (value >= limit) {
            return max();
        }
        if (value <= -limit) {
            return min();
        }
        double whole = 0.0;
        const double frac = std::modf(value, &whole);
        detail::int128_t total =
            static_cast<detail::int128_t>(whole) * static_cast<detail::int128_t>(unit_ns);
        total += static_cast<detail::int128_t>(std::llround(frac * static_cast<double>(unit_ns)));
        return from_total_nanoseconds(total);
    }

    static Duration from_days(double value) noexcept { return from_unit(value, Unit::Day); }
    static Duration from_hours(double value) noexcept { return from_unit(value, Unit::Hour); }
    static Duration from_minutes(double value) noexcept { return from_unit(value, Unit::Minute); }
    static Duration from_seconds(double value) noexcept { return from_unit(value, Unit::Second); }
    static Duration from_milliseconds(double value) noexcept {
        return from_unit(value, Unit::Millisecond);
    }
    static Duration from_microseconds(double value) noexcept {
        return from_unit(value, Unit::Microsecond);
    }
    static Duration from_nanoseconds(double value) noexcept {
        return from_unit(value, Unit::Nanosecond);
    }

    /**
     * Builds a duration from its components. A negative `sign` negates the
     * sum of all components.
     */
    static constexpr Duration compose(int8_t sign, uint64_t days, uint64_t hours,
                                      uint64_t minutes, uint64_t seconds, uint64_t milliseconds,
                                      uint64_t microseconds, uint64_t nanoseconds) noexcept {
        using detail::int128_t;
        int128_t total = static_cast<int128_t>(days) * detail::NS_PER_DAY +
                         static_cast<int128_t>(hours) * detail::NS_PER_HOUR +
                         static_cast<int128_t>(minutes) * detail::NS_PER_MIN +
                         static_cast<int128_t>(seconds) * detail::NS_PER_SEC +
                         static_cast<int128_t>(milliseconds) * detail::NS_PER_MS +
                         static_cast<int128_t>(microseconds) * detail::NS_PER_US +
                         static_cast<int128_t>(nanoseconds);
        return from_total_nanoseconds(sign < 0 ? -total : total);
    }

    static Duration compose_f64(int8_t sign, double days, double hours, double minutes,
                                double seconds, double milliseconds, double microseconds,
                                double nanoseconds) noexcept {
        Duration d = from_days(days) + from_hours(hours) + from_minutes(minutes) +
                     from_seconds(seconds) + from_milliseconds(milliseconds) +
                     from_microseconds(microseconds) + from_nanoseconds(nanoseconds);
        return sign < 0 ? -d : d;
    }

    /// Time-zone style offset, e.g. from_tz_offset(-1, 5, 30) for -05:30
    static constexpr Duration from_tz_offset(int8_t sign, int64_t hours, int64_t minutes) noexcept {
        detail::int128_t total = static_cast<detail::int128_t>(hours) * detail::NS_PER_HOUR +
                                 static_cast<detail::int128_t>(minutes) * detail::NS_PER_MIN;
        return from_total_nanoseconds(sign < 0 ? -total : total);
    }

    // Primary accessors - direct access to components
    constexpr int16_t centuries() const noexcept { return centuries_; }
    constexpr uint64_t nanoseconds() const noexcept { return nanoseconds_; }
    constexpr std::pair<int16_t, uint64_t> to_parts() const noexcept {
        return {centuries_, nanoseconds_};
    }

    constexpr detail::int128_t total_nanoseconds() const noexcept {
        return detail::to_total(centuries_, nanoseconds_);
    }

    /// Total nanoseconds if they fit on 64 bits
    expected<int64_t, DurationError> try_truncated_nanoseconds() const noexcept {
        const auto total = total_nanoseconds();
        if (total > std::numeric_limits<int64_t>::max()) {
            return unexpected(DurationError{DurationError::Kind::overflow});
        }
        if (total < std::numeric_limits<int64_t>::min()) {
            return unexpected(DurationError{DurationError::Kind::underflow});
        }
        return static_cast<int64_t>(total);
    }

    /// Total nanoseconds, saturated to the int64_t range
    constexpr int64_t truncated_nanoseconds() const noexcept {
        const auto total = total_nanoseconds();
        if (total > std::numeric_limits<int64_t>::max()) {
            return std::numeric_limits<int64_t>::max();
        }
        if (total < std::numeric_limits<int64_t>::min()) {
            return std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(total);
    }

    // Conversion to double: whole seconds and sub-seconds are converted separately
    // so that durations within a century keep nanosecond resolution.
    constexpr double to_seconds() const noexcept {
        const uint64_t seconds = nanoseconds_ / detail::NS_PER_SEC;
        const uint64_t subseconds = nanoseconds_ % detail::NS_PER_SEC;
        if (centuries_ == 0) {
            return static_cast<double>(seconds) + static_cast<double>(subseconds) * 1e-9;
        }
        return static_cast<double>(centuries_) * SECONDS_PER_CENTURY +
               static_cast<double>(seconds) + static_cast<double>(subseconds) * 1e-9;
    }

    constexpr double to_unit(Unit unit) const noexcept { return to_seconds() / in_seconds(unit); }

    // Predicates
    constexpr bool is_zero() const noexcept { return centuries_ == 0 && nanoseconds_ == 0; }
    constexpr bool is_negative() const noexcept { return centuries_ < 0; }
    constexpr bool is_positive() const noexcept { return !is_negative() && !is_zero(); }

    /// -1, 0 or 1
    constexpr int signum() const noexcept {
        if (is_negative()) {
            return -1;
        }
        return is_zero() ? 0 : 1;
    }

    // Absolute value (saturates for min())
    constexpr Duration abs() const noexcept { return is_negative() ? -(*this) : *this; }

    // Unary negation (saturates for min())
    constexpr Duration operator-() const noexcept {
        return from_total_nanoseconds(-total_nanoseconds());
    }

    /**
     * Splits |duration| into days, hours, minutes, seconds, milliseconds,
     * microseconds and nanoseconds, from the largest unit to the smallest.
     */
    constexpr Decomposition decompose() const noexcept {
        Decomposition parts;
        auto total = total_nanoseconds();
        parts.sign = static_cast<int8_t>(signum());
        auto rest = static_cast<detail::uint128_t>(total < 0 ? -total : total);

        parts.days = static_cast<uint64_t>(rest / detail::NS_PER_DAY);
        rest %= detail::NS_PER_DAY;
        parts.hours = static_cast<uint64_t>(rest / detail::NS_PER_HOUR);
        rest %= detail::NS_PER_HOUR;
        parts.minutes = static_cast<uint64_t>(rest / detail::NS_PER_MIN);
        rest %= detail::NS_PER_MIN;
        parts.seconds = static_cast<uint64_t>(rest / detail::NS_PER_SEC);
        rest %= detail::NS_PER_SEC;
        parts.milliseconds = static_cast<uint64_t>(rest / detail::NS_PER_MS);
        rest %= detail::NS_PER_MS;
        parts.microseconds = static_cast<uint64_t>(rest / detail::NS_PER_US);
        parts.nanoseconds = static_cast<uint64_t>(rest % detail::NS_PER_US);
        return parts;
    }

    /**
     * The decomposed component for `unit`, as a duration.
     *
     * `(5 * Unit::Hour + 3 * Unit::Second).subdivision(Unit::Hour) == 5 h`.
     * Weeks and centuries are not part of the decomposition: nullopt.
     */
    constexpr std::optional<Duration> subdivision(Unit unit) const noexcept {
        const auto parts = decompose();
        uint64_t count = 0;
        switch (unit) {
            case Unit::Nanosecond:
                count = parts.nanoseconds;
                break;
            case Unit::Microsecond:
                count = parts.microseconds;
                break;
            case Unit::Millisecond:
                count = parts.milliseconds;
                break;
            case Unit::Second:
                count = parts.seconds;
                break;
            case Unit::Minute:
                count = parts.minutes;
                break;
            case Unit::Hour:
                count = parts.hours;
                break;
            case Unit::Day:
                count = parts.days;
                break;
            case Unit::Week:
            case Unit::Century:
                return std::nullopt;
        }
        return from_total_nanoseconds(static_cast<detail::int128_t>(count) *
                                      detail::nanoseconds_per(unit));
    }

    /**
     * Largest multiple of |step| that is not greater than this duration.
     *
     * Returns zero if `step` is zero.
     */
    constexpr Duration floor(Duration step) const noexcept {
        auto modulus = step.total_nanoseconds();
        if (modulus < 0) {
            modulus = -modulus;
        }
        if (modulus == 0) {
            return zero();
        }
        const auto total = total_nanoseconds();
        auto rem = total % modulus;
        if (rem < 0) {
            rem += modulus;
        }
        return from_total_nanoseconds(total - rem);
    }

    /// floor(step) + |step|
    constexpr Duration ceil(Duration step) const noexcept { return floor(step) + step.abs(); }

    /// Whichever of floor(step) and ceil(step) is closer; ties go to ceil
    constexpr Duration round(Duration step) const noexcept {
        const Duration floored = floor(step);
        const Duration ceiled = ceil(step);
        if (*this - floored < (ceiled - *this).abs()) {
            return floored;
        }
        return ceiled;
    }

    /**
     * Rounds to the largest non-zero unit of the decomposition, so
     * 35 h 59 min becomes 1 day and 36 h 1 min becomes 2 days.
     */
    constexpr Duration approx() const noexcept {
        const auto parts = decompose();
        Unit unit = Unit::Nanosecond;
        if (parts.days > 0) {
            unit = Unit::Day;
        } else if (parts.hours > 0) {
            unit = Unit::Hour;
        } else if (parts.minutes > 0) {
            unit = Unit::Minute;
        } else if (parts.seconds > 0) {
            unit = Unit::Second;
        } else if (parts.milliseconds > 0) {
            unit = Unit::Millisecond;
        } else if (parts.microseconds > 0) {
            unit = Unit::Microsecond;
        }
        return round(from_total_nanoseconds(detail::nanoseconds_per(unit)));
    }

    constexpr Duration min(Duration other) const noexcept { return other < *this ? other : *this; }
    constexpr Duration max(Duration other) const noexcept { return other > *this ? other : *this; }

    // Arithmetic operators (saturate on overflow)
    constexpr Duration& operator+=(Duration other) noexcept {
        auto [centuries, nanos] =
            detail::add_time(centuries_, nanoseconds_, other.centuries_, other.nanoseconds_);
        centuries_ = detail::clamp_to_duration(centuries, nanos);
        nanoseconds_ = nanos;
        return *this;
    }

    constexpr Duration& operator-=(Duration other) noexcept {
        auto [centuries, nanos] =
            detail::sub_time(centuries_, nanoseconds_, other.centuries_, other.nanoseconds_);
        centuries_ = detail::clamp_to_duration(centuries, nanos);
        nanoseconds_ = nanos;
        return *this;
    }

    template <std::integral T>
    constexpr Duration& operator*=(T scalar) noexcept {
        auto [centuries, nanos] =
            detail::mul_time(centuries_, nanoseconds_, static_cast<detail::int128_t>(scalar));
        centuries_ = detail::clamp_to_duration(centuries, nanos);
        nanoseconds_ = nanos;
        return *this;
    }

    /**
     * Multiplication by a floating-point factor.
     *
     * The integer part of the factor is applied exactly; the fractional part
     * is applied in extended precision and rounded to the nearest nanosecond.
     */
    Duration& operator*=(double q) noexcept {
        const auto total = total_nanoseconds();
        if (std::isnan(q) || q == 0.0 || total == 0) {
            *this = zero();
            return *this;
        }
        const bool negative = (total < 0) != (q < 0.0);
        double whole = 0.0;
        const double frac = std::modf(q, &whole);
        // A whole factor past the range saturates any non-zero duration
        if (std::isinf(q) || std::fabs(whole) > static_cast<double>(detail::MAX_TOTAL_NS)) {
            *this = negative ? min() : max();
            return *this;
        }
        auto product = detail::mul_total(total, static_cast<detail::int128_t>(whole));
        if (product > detail::MAX_TOTAL_NS || product < detail::MIN_TOTAL_NS) {
            *this = negative ? min() : max();
            return *this;
        }
        const long double frac_ns =
            std::roundl(static_cast<long double>(total) * static_cast<long double>(frac));
        product += static_cast<detail::int128_t>(frac_ns);
        *this = from_total_nanoseconds(product);
        return *this;
    }

    template <std::integral T>
    constexpr Duration& operator/=(T scalar) noexcept {
        // Out-of-range unsigned divisors are larger than any duration: the quotient is zero
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (scalar > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                *this = zero();
                return *this;
            }
        }
        auto [centuries, nanos] =
            detail::div_time(centuries_, nanoseconds_, static_cast<int64_t>(scalar));
        centuries_ = detail::clamp_to_duration(centuries, nanos);
        nanoseconds_ = nanos;
        return *this;
    }

    // Division by zero saturates based on the sign of this duration
    Duration& operator/=(double q) noexcept {
        if (q == 0.0) {
            if (!is_zero()) {
                *this = is_negative() ? min() : max();
            }
            return *this;
        }
        return *this *= (1.0 / q);
    }

    friend constexpr Duration operator+(Duration lhs, Duration rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr Duration operator-(Duration lhs, Duration rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    template <std::integral T>
    friend constexpr Duration operator*(Duration d, T scalar) noexcept {
        d *= scalar;
        return d;
    }

    template <std::integral T>
    friend constexpr Duration operator*(T scalar, Duration d) noexcept {
        d *= scalar;
        return d;
    }

    template <std::floating_point T>
    friend Duration operator*(Duration d, T q) noexcept {
        d *= static_cast<double>(q);
        return d;
    }

    template <std::floating_point T>
    friend Duration operator*(T q, Duration d) noexcept {
        d *= static_cast<double>(q);
        return d;
    }

    template <std::integral T>
    friend constexpr Duration operator/(Duration d, T scalar) noexcept {
        d /= scalar;
        return d;
    }

    template <std::floating_point T>
    friend Duration operator/(Duration d, T q) noexcept {
        d /= static_cast<double>(q);
        return d;
    }

    // Comparison
    constexpr std::strong_ordering operator<=>(const Duration& other) const noexcept {
        if (centuries_ != other.centuries_) {
            return centuries_ <=> other.centuries_;
        }
        return nanoseconds_ <=> other.nanoseconds_;
    }

    constexpr bool operator==(const Duration& other) const noexcept = default;

    // A unit compares as one of that unit
    friend constexpr bool operator==(const Duration& d, Unit unit) noexcept {
        return d.total_nanoseconds() == static_cast<detail::int128_t>(detail::nanoseconds_per(unit));
    }

    friend constexpr std::strong_ordering operator<=>(const Duration& d, Unit unit) noexcept {
        return d.total_nanoseconds() <=> static_cast<detail::int128_t>(detail::nanoseconds_per(unit));
    }

private:
    int16_t centuries_{0};
    uint64_t nanoseconds_{0}; // Always in [0, NANOSECONDS_PER_CENTURY)

    constexpr Duration(int16_t centuries, uint64_t nanos) noexcept
        : centuries_(centuries), nanoseconds_(nanos) {}
};

/**
 * Check if a Duration has saturated to min() or max().
 *
 * This cannot distinguish between a legitimate boundary value and an
 * overflow; with a ±3 million year range, legitimate boundaries are rare.
 */
constexpr bool saturated(const Duration& d) noexcept {
    return d == Duration::max() || d == Duration::min();
}

// ============================================================================
// Unit and Freq arithmetic
// ============================================================================

/// One of `unit`, as a Duration
constexpr Duration to_duration(Unit unit) noexcept {
    return Duration::from_total_nanoseconds(detail::nanoseconds_per(unit));
}

template <std::integral T>
constexpr Duration operator*(T n, Unit unit) noexcept {
    // |n| * ns_per(unit) < 2^64 * 2^62, always representable before clamping
    return Duration::from_total_nanoseconds(static_cast<detail::int128_t>(n) *
                                            static_cast<detail::int128_t>(
                                                detail::nanoseconds_per(unit)));
}

template <std::integral T>
constexpr Duration operator*(Unit unit, T n) noexcept {
    return n * unit;
}

template <std::floating_point T>
Duration operator*(T value, Unit unit) noexcept {
    return Duration::from_unit(static_cast<double>(value), unit);
}

template <std::floating_point T>
Duration operator*(Unit unit, T value) noexcept {
    return Duration::from_unit(static_cast<double>(value), unit);
}

constexpr Duration operator+(Duration d, Unit unit) noexcept {
    return d + to_duration(unit);
}

constexpr Duration operator-(Duration d, Unit unit) noexcept {
    return d - to_duration(unit);
}

/// Duration of one cycle
constexpr Duration period(Freq freq) noexcept {
    return Duration::from_total_nanoseconds(detail::period_nanoseconds(freq));
}

/// Period of `n` times the frequency, e.g. `2 * Freq::MegaHertz == 500 ns`
template <std::integral T>
constexpr Duration operator*(T n, Freq freq) noexcept {
    return period(freq) / n;
}

template <std::floating_point T>
Duration operator*(T n, Freq freq) noexcept {
    return Duration::from_unit(static_cast<double>(detail::period_nanoseconds(freq)) /
                                   static_cast<double>(n),
                               Unit::Nanosecond);
}

template <typename T>
    requires std::integral<T> || std::floating_point<T>
auto operator*(Freq freq, T n) noexcept {
    return n * freq;
}

} // namespace tempus
