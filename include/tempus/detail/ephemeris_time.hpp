#pragma once

#include "tempus/duration.hpp"
#include "tempus/time_scale.hpp"

#include <numbers>

#include <cmath>

namespace tempus::detail {

/**
 * Relativistic corrections between TAI and the barycentric scales.
 *
 * ET follows the NAIF SPICE model (`deltet`): the periodic term is a
 * function of the Earth's mean anomaly, refined by a fixed number of
 * fixed-point steps. TDB uses the Fairhead and Bretagnon leading term, with
 * an iteration that stops once successive steps agree.
 *
 * Both work in floating-point seconds past J2000; the integer TAI offset
 * is applied with exact Duration arithmetic.
 */

// NAIF constants of the ET - TAI model
inline constexpr double NAIF_M0 = 6.239996;
inline constexpr double NAIF_M1 = 1.99096871e-7;
inline constexpr double NAIF_EB = 1.671e-2;
inline constexpr double NAIF_K = 1.657e-3;

/// TT - TAI
inline constexpr int64_t TT_OFFSET_MS = 32'184;
inline constexpr double TT_OFFSET_S = 32.184;

inline constexpr int ET_ITERATIONS = 5;
inline constexpr int TDB_MAX_ITERATIONS = 5;
inline constexpr double TDB_CONVERGENCE_S = 1e-9;

/// ET - TAI at `seconds` past J2000 (TT)
inline double delta_et_tai(double seconds) noexcept {
    // Mean anomaly, then eccentric anomaly
    const double m = NAIF_M0 + seconds * NAIF_M1;
    const double e = m + NAIF_EB * std::sin(m);
    return TT_OFFSET_S + NAIF_K * std::sin(e);
}

/// TDB - TT at `seconds` past J2000
inline double inner_g(double seconds) noexcept {
    const double g = 2.0 * std::numbers::pi / 360.0 * 357.528 + 1.990'910'018'065'731e-7 * seconds;
    return 1.658e-3 * std::sin(g + 1.67e-2 * std::sin(g));
}

/// One fixed-point step of the periodic ET term
inline double et_periodic_term(double seconds) noexcept {
    return -NAIF_K * std::sin(NAIF_M0 + NAIF_M1 * seconds +
                              NAIF_EB * std::sin(NAIF_M0 + NAIF_M1 * seconds));
}

/**
 * ET duration past J2000 to TAI duration past the prime epoch.
 */
inline Duration et_to_tai(Duration et) noexcept {
    double seconds = et.to_seconds();
    for (int i = 0; i < ET_ITERATIONS; ++i) {
        seconds += et_periodic_term(seconds);
    }
    const double delta = delta_et_tai(seconds - TT_OFFSET_S);
    return et - Duration::from_seconds(delta) + prime_epoch_offset(TimeScale::ET);
}

/**
 * TAI duration past the prime epoch to ET duration past J2000.
 */
inline Duration tai_to_et(Duration tai) noexcept {
    const Duration prime = prime_epoch_offset(TimeScale::ET);
    double seconds = (tai - prime).to_seconds();
    for (int i = 0; i < ET_ITERATIONS; ++i) {
        seconds -= et_periodic_term(seconds);
    }
    const double delta = delta_et_tai(seconds + TT_OFFSET_S);
    return tai + Duration::from_seconds(delta) - prime;
}

/**
 * TDB duration past J2000 to TAI duration past the prime epoch.
 */
inline Duration tdb_to_tai(Duration tdb) noexcept {
    const double gamma = inner_g(tdb.to_seconds());
    const Duration delta_tdb_tai = Duration::from_seconds(gamma) + TT_OFFSET_MS * Unit::Millisecond;
    return tdb - delta_tdb_tai + prime_epoch_offset(TimeScale::TDB);
}

/**
 * TAI duration past the prime epoch to TDB duration past J2000.
 *
 * Stops iterating when two successive step sizes differ by less than
 * TDB_CONVERGENCE_S.
 */
inline Duration tai_to_tdb(Duration tai) noexcept {
    const Duration prime = prime_epoch_offset(TimeScale::TDB);
    double seconds = (tai - prime).to_seconds();
    // Larger than any first step
    double delta = 1e8;
    for (int i = 0; i < TDB_MAX_ITERATIONS; ++i) {
        const double next = seconds - inner_g(seconds);
        const double new_delta = std::fabs(next - seconds);
        if (std::fabs(new_delta - delta) < TDB_CONVERGENCE_S) {
            break;
        }
        seconds = next;
        delta = new_delta;
    }
    const double gamma = inner_g(seconds + TT_OFFSET_S);
    const Duration delta_tdb_tai = Duration::from_seconds(gamma) + TT_OFFSET_MS * Unit::Millisecond;
    return tai + delta_tdb_tai - prime;
}

} // namespace tempus::detail
