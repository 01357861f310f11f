#pragma once

#include "tempus/detail/ascii.hpp"
#include "tempus/duration.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"

#include <array>
#include <charconv>
#include <ostream>
#include <string>
#include <string_view>

#include <cmath>
#include <cstdint>

#include <fmt/format.h>

namespace tempus {

/**
 * Duration rendering and parsing.
 *
 * ## Rendering
 * The default form lists every non-zero component of decompose():
 * ```
 * 14889 days 23 h 47 min 34 s 123 ns
 * -5 h 256 ms 1 ns
 * 0 ns
 * ```
 * The exponent form (`{:e}`) picks a single unit from the magnitude and
 * prints the value as a floating-point number, e.g. `1.5 h`.
 *
 * ## Parsing
 * parse_duration() accepts whitespace-separated `<number> <unit>` pairs with
 * an optional leading sign, or a time zone offset `[+-]HH[:]MM[[:]SS]`.
 */

namespace detail {

struct UnitAlias {
    std::string_view name;
    Unit unit;
};

inline constexpr std::array<UnitAlias, 25> UNIT_ALIASES{{
    {"d", Unit::Day},
    {"day", Unit::Day},
    {"days", Unit::Day},
    {"h", Unit::Hour},
    {"hr", Unit::Hour},
    {"hour", Unit::Hour},
    {"hours", Unit::Hour},
    {"min", Unit::Minute},
    {"mins", Unit::Minute},
    {"minute", Unit::Minute},
    {"minutes", Unit::Minute},
    {"s", Unit::Second},
    {"sec", Unit::Second},
    {"second", Unit::Second},
    {"seconds", Unit::Second},
    {"ms", Unit::Millisecond},
    {"millisecond", Unit::Millisecond},
    {"milliseconds", Unit::Millisecond},
    {"us", Unit::Microsecond},
    {"\xCE\xBCs", Unit::Microsecond}, // μs
    {"microsecond", Unit::Microsecond},
    {"microseconds", Unit::Microsecond},
    {"ns", Unit::Nanosecond},
    {"nanosecond", Unit::Nanosecond},
    {"nanoseconds", Unit::Nanosecond},
}};

inline bool lookup_unit(std::string_view name, Unit& unit) noexcept {
    for (const auto& alias : UNIT_ALIASES) {
        if (alias.name == name) {
            unit = alias.unit;
            return true;
        }
    }
    return false;
}

/// Pops the next whitespace-delimited token, empty when none is left
constexpr std::string_view next_token(std::string_view& s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    size_t end = 0;
    while (end < s.size() && !is_space(s[end])) {
        ++end;
    }
    auto token = s.substr(0, end);
    s.remove_prefix(end);
    return token;
}

/// Parses the whole of `text` as a number, false on trailing characters
template <typename T>
bool parse_number(std::string_view text, T& value) noexcept {
    if (text.empty()) {
        return false;
    }
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

/**
 * Parses a time zone offset `[+-]HH[:]MM[[:]SS]`, sign included in `s`.
 *
 * The sign itself is not applied; the caller negates the result.
 */
inline expected<Duration, ParseError> parse_offset(std::string_view s) noexcept {
    size_t sep = 0;
    switch (s.size()) {
        case 3:
        case 5:
        case 7:
            sep = 0;
            break;
        case 4:
        case 6:
        case 9:
            sep = 1;
            break;
        default:
            return unexpected(ParseError{ParseError::Kind::invalid_timezone, 0,
                                         "invalid timezone format [+/-]HH:MM"});
    }

    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t seconds = 0;
    if (!parse_number(s.substr(1, 2), hours)) {
        return unexpected(ParseError{ParseError::Kind::value_error, 0, "invalid hours"});
    }
    if (s.size() > 3 + sep) {
        if (!parse_number(s.substr(3 + sep, 2), minutes)) {
            return unexpected(ParseError{ParseError::Kind::value_error, 0, "invalid minute"});
        }
        if (s.size() > 5 + 2 * sep) {
            if (!parse_number(s.substr(5 + 2 * sep), seconds)) {
                return unexpected(ParseError{ParseError::Kind::value_error, 0, "invalid seconds"});
            }
        }
    }
    return hours * Unit::Hour + minutes * Unit::Minute + seconds * Unit::Second;
}

/// Parses `<number> <unit>` pairs; a repeated unit keeps its last value
inline expected<Duration, ParseError> parse_components(std::string_view s) noexcept {
    // days, hours, minutes, seconds, ms, us, ns
    std::array<double, 7> parts{};
    bool any = false;

    while (true) {
        auto number = next_token(s);
        if (number.empty()) {
            break;
        }
        double value = 0.0;
        if (!parse_number(number, value)) {
            return unexpected(ParseError{ParseError::Kind::value_error, 0,
                                         "could not parse what precedes the space"});
        }
        auto unit_name = next_token(s);
        if (unit_name.empty()) {
            return unexpected(ParseError{ParseError::Kind::unknown_or_missing_unit, 0,
                                         "expect a unit after the last numeric"});
        }
        Unit unit = Unit::Second;
        if (!lookup_unit(unit_name, unit)) {
            return unexpected(
                ParseError{ParseError::Kind::unknown_or_missing_unit, 0, "unknown unit"});
        }
        switch (unit) {
            case Unit::Day:
                parts[0] = value;
                break;
            case Unit::Hour:
                parts[1] = value;
                break;
            case Unit::Minute:
                parts[2] = value;
                break;
            case Unit::Second:
                parts[3] = value;
                break;
            case Unit::Millisecond:
                parts[4] = value;
                break;
            case Unit::Microsecond:
                parts[5] = value;
                break;
            default:
                parts[6] = value;
                break;
        }
        any = true;
    }

    if (!any) {
        return unexpected(
            ParseError{ParseError::Kind::nothing_to_parse, 0, "input string is empty"});
    }
    return Duration::compose_f64(1, parts[0], parts[1], parts[2], parts[3], parts[4], parts[5],
                                 parts[6]);
}

} // namespace detail

/**
 * Parse a Duration from its string form.
 *
 * ```cpp
 * parse_duration("5 h 256 ms 1 ns");   // 5 * Unit::Hour + 256 * Unit::Millisecond + 1 ns
 * parse_duration("10.598 days");       // 10.598 * Unit::Day
 * parse_duration("-01:15:30");         // -(1 h 15 min 30 s)
 * parse_duration("+3615");             // 36 h 15 min
 * ```
 *
 * A leading `+` or `-` is first tried as a time zone offset; when that
 * fails the rest is parsed as a duration and negated for `-`.
 */
inline expected<Duration, ParseError> parse_duration(std::string_view input) noexcept {
    auto s = detail::trim(input);
    if (s.empty()) {
        return unexpected(
            ParseError{ParseError::Kind::nothing_to_parse, 0, "input string is empty"});
    }

    const bool negative = s.front() == '-';
    if (negative || s.front() == '+') {
        if (auto offset = detail::parse_offset(s)) {
            return negative ? -*offset : *offset;
        }
    }

    auto parsed = detail::parse_components(negative ? s.substr(1) : s);
    if (!parsed) {
        return parsed;
    }
    return negative ? -*parsed : *parsed;
}

/// Throwing form of parse_duration()
inline Duration duration_from_str(std::string_view input) {
    return detail::unwrap_or_throw(parse_duration(input));
}

} // namespace tempus

/**
 * fmt support: `{}` prints the component form, `{:e}` the single-unit form.
 */
template <>
struct fmt::formatter<tempus::Duration> {
    bool exponent = false;

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it == 'e') {
            exponent = true;
            ++it;
        }
        if (it != ctx.end() && *it != '}') {
            throw format_error("invalid format specifier for Duration");
        }
        return it;
    }

    template <typename FormatContext>
    auto format(const tempus::Duration& d, FormatContext& ctx) const -> decltype(ctx.out()) {
        return exponent ? format_exponent(d, ctx.out()) : format_components(d, ctx.out());
    }

private:
    template <typename OutputIt>
    static OutputIt format_components(const tempus::Duration& d, OutputIt out) {
        if (d.is_zero()) {
            return fmt::format_to(out, "0 ns");
        }
        const auto parts = d.decompose();
        if (parts.sign < 0) {
            out = fmt::format_to(out, "-");
        }
        const uint64_t values[] = {parts.days,    parts.hours,        parts.minutes,
                                   parts.seconds, parts.milliseconds, parts.microseconds,
                                   parts.nanoseconds};
        const char* units[] = {parts.days > 1 ? "days" : "day", "h", "min", "s", "ms", "us", "ns"};
        bool first = true;
        for (size_t i = 0; i < 7; ++i) {
            if (values[i] == 0) {
                continue;
            }
            out = fmt::format_to(out, fmt::runtime(first ? "{} {}" : " {} {}"), values[i], units[i]);
            first = false;
        }
        return out;
    }

    template <typename OutputIt>
    static OutputIt format_exponent(const tempus::Duration& d, OutputIt out) {
        const double seconds = d.to_seconds();
        const double magnitude = std::fabs(seconds);
        if (magnitude < 1e-5) {
            return fmt::format_to(out, "{} ns", seconds * 1e9);
        }
        if (magnitude < 1e-2) {
            return fmt::format_to(out, "{} ms", seconds * 1e3);
        }
        if (magnitude < 180.0) {
            return fmt::format_to(out, "{} s", seconds);
        }
        if (magnitude < 3'600.0) {
            return fmt::format_to(out, "{} min", seconds / 60.0);
        }
        if (magnitude < 86'400.0) {
            return fmt::format_to(out, "{} h", seconds / 3'600.0);
        }
        return fmt::format_to(out, "{} days", seconds / 86'400.0);
    }
};

namespace tempus {

[[nodiscard]] inline std::string to_string(const Duration& d) {
    return fmt::format("{}", d);
}

inline std::ostream& operator<<(std::ostream& os, const Duration& d) {
    return os << to_string(d);
}

} // namespace tempus
