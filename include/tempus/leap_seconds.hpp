#pragma once

#include <array>
#include <concepts>
#include <iterator>
#include <optional>
#include <ranges>

#include <cstddef>

namespace tempus {

/**
 * A TAI - UTC step.
 *
 * `timestamp_tai_s` is the TAI instant, in seconds past
 * 1900-01-01T00:00:00 TAI, from which `delta_at` seconds apply.
 * Entries not announced by the IERS are the fractional SOFA steps used
 * between 1960 and 1972.
 */
struct LeapSecond {
    double timestamp_tai_s{0.0};
    double delta_at{0.0};
    bool announced_by_iers{false};

    friend constexpr bool operator==(const LeapSecond&, const LeapSecond&) noexcept = default;
};

/**
 * Any random-access, sized range of LeapSecond sorted by timestamp.
 *
 * BuiltinLeapSeconds and LeapSecondsFile satisfy it, and so does a plain
 * `std::vector<LeapSecond>`.
 */
template <typename P>
concept LeapSecondProvider =
    std::ranges::random_access_range<const P> && std::ranges::sized_range<const P> &&
    std::same_as<std::ranges::range_value_t<const P>, LeapSecond>;

namespace detail {

// clang-format off
inline constexpr std::array<LeapSecond, 42> LATEST_LEAP_SECONDS{{
    {1'893'369'600.0, 1.417818, false}, // SOFA: 01 Jan 1960
    {1'924'992'000.0, 1.422818, false}, // SOFA: 01 Jan 1961
    {1'943'308'800.0, 1.372818, false}, // SOFA: 01 Aug 1961
    {1'956'528'000.0, 1.845858, false}, // SOFA: 01 Jan 1962
    {2'014'329'600.0, 1.945858, false}, // SOFA: 01 Jan 1963
    {2'019'600'000.0, 3.24013, false},  // SOFA: 01 Jan 1964
    {2'027'462'400.0, 3.34013, false},  // SOFA: 01 Apr 1964
    {2'040'681'600.0, 3.44013, false},  // SOFA: 01 Sep 1964
    {2'051'222'400.0, 3.54013, false},  // SOFA: 01 Jan 1965
    {2'056'320'000.0, 3.64013, false},  // SOFA: 01 Mar 1965
    {2'066'860'800.0, 3.74013, false},  // SOFA: 01 Jul 1965
    {2'072'217'600.0, 3.84013, false},  // SOFA: 01 Sep 1965
    {2'082'758'400.0, 4.31317, false},  // SOFA: 01 Jan 1966
    {2'148'508'800.0, 4.21317, false},  // SOFA: 01 Feb 1968
    {2'272'060'800.0, 10.0, true},      // IERS: 01 Jan 1972
    {2'287'785'600.0, 11.0, true},      // IERS: 01 Jul 1972
    {2'303'683'200.0, 12.0, true},      // IERS: 01 Jan 1973
    {2'335'219'200.0, 13.0, true},      // IERS: 01 Jan 1974
    {2'366'755'200.0, 14.0, true},      // IERS: 01 Jan 1975
    {2'398'291'200.0, 15.0, true},      // IERS: 01 Jan 1976
    {2'429'913'600.0, 16.0, true},      // IERS: 01 Jan 1977
    {2'461'449'600.0, 17.0, true},      // IERS: 01 Jan 1978
    {2'492'985'600.0, 18.0, true},      // IERS: 01 Jan 1979
    {2'524'521'600.0, 19.0, true},      // IERS: 01 Jan 1980
    {2'571'782'400.0, 20.0, true},      // IERS: 01 Jul 1981
    {2'603'318'400.0, 21.0, true},      // IERS: 01 Jul 1982
    {2'634'854'400.0, 22.0, true},      // IERS: 01 Jul 1983
    {2'698'012'800.0, 23.0, true},      // IERS: 01 Jul 1985
    {2'776'982'400.0, 24.0, true},      // IERS: 01 Jan 1988
    {2'840'140'800.0, 25.0, true},      // IERS: 01 Jan 1990
    {2'871'676'800.0, 26.0, true},      // IERS: 01 Jan 1991
    {2'918'937'600.0, 27.0, true},      // IERS: 01 Jul 1992
    {2'950'473'600.0, 28.0, true},      // IERS: 01 Jul 1993
    {2'982'009'600.0, 29.0, true},      // IERS: 01 Jul 1994
    {3'029'443'200.0, 30.0, true},      // IERS: 01 Jan 1996
    {3'076'704'000.0, 31.0, true},      // IERS: 01 Jul 1997
    {3'124'137'600.0, 32.0, true},      // IERS: 01 Jan 1999
    {3'345'062'400.0, 33.0, true},      // IERS: 01 Jan 2006
    {3'439'756'800.0, 34.0, true},      // IERS: 01 Jan 2009
    {3'550'089'600.0, 35.0, true},      // IERS: 01 Jul 2012
    {3'644'697'600.0, 36.0, true},      // IERS: 01 Jul 2015
    {3'692'217'600.0, 37.0, true},      // IERS: 01 Jan 2017
}};
// clang-format on

/**
 * TAI - UTC in effect at `tai_seconds`, scanning the table from the end.
 *
 * @param tai_seconds Seconds past 1900-01-01T00:00:00 TAI
 * @param iers_only Skip the entries not announced by the IERS
 * @param provider Sorted leap second table
 * @return delta_at of the latest matching entry, nullopt before the first one
 */
template <LeapSecondProvider P>
constexpr std::optional<double> leap_seconds_at(double tai_seconds, bool iers_only,
                                                const P& provider) noexcept {
    const auto first = std::ranges::begin(provider);
    auto it = std::ranges::end(provider);
    while (it != first) {
        --it;
        const LeapSecond& leap = *it;
        if (tai_seconds >= leap.timestamp_tai_s && (!iers_only || leap.announced_by_iers)) {
            return leap.delta_at;
        }
    }
    return std::nullopt;
}

} // namespace detail

/**
 * The built-in leap second table: 14 SOFA steps from 1960 then the 28 IERS
 * leap seconds up to 2017-01-01 (TAI - UTC = 37 s).
 */
class BuiltinLeapSeconds {
public:
    using value_type = LeapSecond;
    using const_iterator = const LeapSecond*;

    constexpr BuiltinLeapSeconds() noexcept = default;

    constexpr const_iterator begin() const noexcept {
        return detail::LATEST_LEAP_SECONDS.data();
    }
    constexpr const_iterator end() const noexcept {
        return detail::LATEST_LEAP_SECONDS.data() + detail::LATEST_LEAP_SECONDS.size();
    }
    constexpr size_t size() const noexcept { return detail::LATEST_LEAP_SECONDS.size(); }
    constexpr bool empty() const noexcept { return false; }
    constexpr const LeapSecond& operator[](size_t index) const noexcept {
        return detail::LATEST_LEAP_SECONDS[index];
    }
};

static_assert(LeapSecondProvider<BuiltinLeapSeconds>);

} // namespace tempus
