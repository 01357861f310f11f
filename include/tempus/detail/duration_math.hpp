// include/tempus/detail/duration_math.hpp
#pragma once

#include <limits>
#include <utility>

#include <cstdint>

namespace tempus::detail {

/**
 * Centralized mixed-radix arithmetic for Duration.
 *
 * A Duration is stored as (centuries: int16_t, nanoseconds: uint64_t) with
 * floor semantics, i.e. the logical value is
 *   centuries * NS_PER_CENTURY + nanoseconds
 * and nanoseconds always lies in [0, NS_PER_CENTURY).
 *
 * Every helper here works on the logical value as a 128-bit integer, splits
 * it back into the two limbs, and leaves clamping to the caller.
 *
 * Overflow policy:
 * - All operations saturate to min/max on overflow (no exceptions, no expected<>)
 * - The full representable range is ±32,768 centuries at 1 ns resolution
 */

using int128_t = __int128_t;
using uint128_t = __uint128_t;

inline constexpr uint64_t NS_PER_US = 1'000ULL;
inline constexpr uint64_t NS_PER_MS = 1'000'000ULL;
inline constexpr uint64_t NS_PER_SEC = 1'000'000'000ULL;
inline constexpr uint64_t NS_PER_MIN = 60 * NS_PER_SEC;
inline constexpr uint64_t NS_PER_HOUR = 60 * NS_PER_MIN;
inline constexpr uint64_t NS_PER_DAY = 24 * NS_PER_HOUR;
inline constexpr uint64_t NS_PER_WEEK = 7 * NS_PER_DAY;

/// Julian century: 36,525 days of 86,400 s
inline constexpr uint64_t NS_PER_CENTURY = 36'525 * NS_PER_DAY;

/// Largest valid nanoseconds limb
inline constexpr uint64_t MAX_NANOS = NS_PER_CENTURY - 1;

inline constexpr int128_t MIN_TOTAL_NS =
    static_cast<int128_t>(std::numeric_limits<int16_t>::min()) * NS_PER_CENTURY;
inline constexpr int128_t MAX_TOTAL_NS =
    static_cast<int128_t>(std::numeric_limits<int16_t>::max()) * NS_PER_CENTURY + MAX_NANOS;

/**
 * Total nanoseconds of a (centuries, nanoseconds) pair.
 *
 * Exact for any pair, normalized or not.
 */
constexpr int128_t to_total(int16_t centuries, uint64_t nanos) noexcept {
    return static_cast<int128_t>(centuries) * static_cast<int128_t>(NS_PER_CENTURY) +
           static_cast<int128_t>(nanos);
}

/**
 * Split total nanoseconds into (centuries, nanoseconds) with floor semantics.
 *
 * -1 ns → {-1, NS_PER_CENTURY - 1}.
 *
 * @param total Total nanoseconds (any value)
 * @return Pair of (centuries, nanoseconds) where nanoseconds ∈ [0, NS_PER_CENTURY).
 *         Centuries are NOT clamped to int16_t.
 */
constexpr auto normalize(int128_t total) noexcept -> std::pair<int128_t, uint64_t> {
    constexpr int128_t century = static_cast<int128_t>(NS_PER_CENTURY);
    int128_t centuries = total / century;
    int128_t rem = total % century;
    if (rem < 0) {
        rem += century;
        centuries -= 1;
    }
    return {centuries, static_cast<uint64_t>(rem)};
}

/**
 * Clamp centuries to int16_t range for Duration storage.
 *
 * On overflow/underflow, also sets nanoseconds to the boundary value so that
 * Duration::max() and Duration::min() are well-defined sentinels.
 *
 * @param centuries Centuries (may exceed int16_t range)
 * @param nanos Reference to nanoseconds (modified on saturation)
 * @return Clamped centuries value
 */
constexpr int16_t clamp_to_duration(int128_t centuries, uint64_t& nanos) noexcept {
    if (centuries > std::numeric_limits<int16_t>::max()) {
        nanos = MAX_NANOS;
        return std::numeric_limits<int16_t>::max();
    }
    if (centuries < std::numeric_limits<int16_t>::min()) {
        nanos = 0;
        return std::numeric_limits<int16_t>::min();
    }
    return static_cast<int16_t>(centuries);
}

/**
 * Add two (centuries, nanoseconds) values.
 *
 * Cannot overflow the 128-bit intermediate: both operands are bounded by
 * ±2^77 nanoseconds.
 *
 * @return Pair of (centuries, nanoseconds) - NOT clamped to storage range
 */
constexpr auto add_time(int16_t c_a, uint64_t ns_a, int16_t c_b,
                        uint64_t ns_b) noexcept -> std::pair<int128_t, uint64_t> {
    return normalize(to_total(c_a, ns_a) + to_total(c_b, ns_b));
}

/**
 * Subtract two (centuries, nanoseconds) values: a - b.
 *
 * @return Pair of (centuries, nanoseconds) - NOT clamped to storage range
 */
constexpr auto sub_time(int16_t c_a, uint64_t ns_a, int16_t c_b,
                        uint64_t ns_b) noexcept -> std::pair<int128_t, uint64_t> {
    return normalize(to_total(c_a, ns_a) - to_total(c_b, ns_b));
}

/**
 * Multiply a total nanosecond count by an integer, saturating just outside
 * the Duration range so that a later clamp lands on min() or max().
 */
constexpr int128_t mul_total(int128_t total, int128_t scalar) noexcept {
    if (total == 0 || scalar == 0) {
        return 0;
    }
    bool negative = (total < 0) != (scalar < 0);
    uint128_t abs_total = total < 0 ? uint128_t{0} - static_cast<uint128_t>(total)
                                    : static_cast<uint128_t>(total);
    uint128_t abs_scalar = scalar < 0 ? uint128_t{0} - static_cast<uint128_t>(scalar)
                                      : static_cast<uint128_t>(scalar);

    // Anything past MAX_TOTAL_NS + 1 saturates identically
    constexpr uint128_t limit = static_cast<uint128_t>(MAX_TOTAL_NS) + 1;
    if (abs_total > limit / abs_scalar) {
        return negative ? MIN_TOTAL_NS - 1 : MAX_TOTAL_NS + 1;
    }
    uint128_t product = abs_total * abs_scalar;
    if (product > limit) {
        product = limit;
    }
    return negative ? -static_cast<int128_t>(product) : static_cast<int128_t>(product);
}

/**
 * Multiply a time value by an integer scalar.
 *
 * @return Pair of (centuries, nanoseconds) - may need clamping
 */
constexpr auto mul_time(int16_t centuries, uint64_t nanos,
                        int128_t scalar) noexcept -> std::pair<int128_t, uint64_t> {
    return normalize(mul_total(to_total(centuries, nanos), scalar));
}

/**
 * Divide a time value by an integer scalar, truncating toward zero.
 *
 * Division by zero saturates based on the sign of the numerator.
 *
 * @return Pair of (centuries, nanoseconds) - may need clamping
 */
constexpr auto div_time(int16_t centuries, uint64_t nanos,
                        int64_t scalar) noexcept -> std::pair<int128_t, uint64_t> {
    int128_t total = to_total(centuries, nanos);
    if (scalar == 0) {
        if (total > 0) {
            return normalize(MAX_TOTAL_NS + 1);
        }
        if (total < 0) {
            return normalize(MIN_TOTAL_NS - 1);
        }
        return {0, 0};
    }
    return normalize(total / scalar);
}

/// Floor division for signed 64-bit integers (rounds toward negative infinity)
constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

/// Euclidean remainder, always in [0, |b|)
constexpr int64_t rem_euclid(int64_t a, int64_t b) noexcept {
    int64_t r = a % b;
    if (r < 0) {
        r += b < 0 ? -b : b;
    }
    return r;
}

} // namespace tempus::detail
