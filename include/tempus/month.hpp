#pragma once

#include "tempus/detail/ascii.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"

#include <array>
#include <string_view>

#include <cstdint>

#include <fmt/format.h>

namespace tempus {

enum class MonthName : uint8_t {
    January = 1,
    February,
    March,
    April,
    May,
    June,
    July,
    August,
    September,
    October,
    November,
    December
};

/// Month for 1..=12; anything else maps to January
constexpr MonthName month_from_number(uint8_t month) noexcept {
    if (month < 1 || month > 12) {
        return MonthName::January;
    }
    return static_cast<MonthName>(month);
}

constexpr uint8_t to_number(MonthName month) noexcept {
    return static_cast<uint8_t>(month);
}

namespace detail {

inline constexpr std::array<std::string_view, 12> MONTH_LONG_NAMES{
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

inline constexpr std::array<std::string_view, 12> MONTH_SHORT_NAMES{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Accepted spellings: all lowercase, title case, or all uppercase
constexpr bool matches_month_spelling(std::string_view input, std::string_view name) noexcept {
    if (input.size() != name.size() || input.empty()) {
        return false;
    }
    bool lower = true;
    bool upper = true;
    bool title = input.front() == name.front();
    for (size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];
        const char expected_lower = ascii_lower(name[i]);
        const char expected_upper = ascii_upper(name[i]);
        lower = lower && c == expected_lower;
        upper = upper && c == expected_upper;
        if (i > 0) {
            title = title && c == expected_lower;
        }
    }
    return lower || upper || title;
}

} // namespace detail

/// Three-letter abbreviation, e.g. "Jan"
[[nodiscard]] constexpr const char* to_short_string(MonthName month) noexcept {
    return detail::MONTH_SHORT_NAMES[to_number(month) - 1].data();
}

[[nodiscard]] constexpr const char* to_string(MonthName month) noexcept {
    return detail::MONTH_LONG_NAMES[to_number(month) - 1].data();
}

/**
 * Parse a month name.
 *
 * Accepts the three-letter or full English name written in lowercase,
 * title case or uppercase ("jan", "Jan", "JAN", "January", "JANUARY",
 * "january").
 */
inline expected<MonthName, ParseError> parse_month_name(std::string_view name) noexcept {
    for (uint8_t i = 0; i < 12; ++i) {
        if (detail::matches_month_spelling(name, detail::MONTH_SHORT_NAMES[i]) ||
            detail::matches_month_spelling(name, detail::MONTH_LONG_NAMES[i])) {
            return static_cast<MonthName>(i + 1);
        }
    }
    return unexpected(
        ParseError{ParseError::Kind::unknown_month_name, 0, "unknown month name"});
}

} // namespace tempus

template <>
struct fmt::formatter<tempus::MonthName> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tempus::MonthName month, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(tempus::to_string(month), ctx);
    }
};
