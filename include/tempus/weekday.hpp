#pragma once

#include "tempus/detail/ascii.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"

#include <string_view>

#include <cstdint>

#include <fmt/format.h>

namespace tempus {

/// Day of the week, Monday first
enum class Weekday : uint8_t {
    Monday = 0,
    Tuesday = 1,
    Wednesday = 2,
    Thursday = 3,
    Friday = 4,
    Saturday = 5,
    Sunday = 6
};

inline constexpr int64_t DAYS_PER_WEEK = 7;

/// Weekday for any integer, wrapping modulo 7 (so -1 is Sunday)
constexpr Weekday weekday_from_number(int64_t n) noexcept {
    int64_t r = n % DAYS_PER_WEEK;
    if (r < 0) {
        r += DAYS_PER_WEEK;
    }
    return static_cast<Weekday>(r);
}

constexpr uint8_t to_number(Weekday wd) noexcept {
    return static_cast<uint8_t>(wd);
}

constexpr Weekday operator+(Weekday wd, int64_t days) noexcept {
    return weekday_from_number(static_cast<int64_t>(wd) + days % DAYS_PER_WEEK);
}

constexpr Weekday operator-(Weekday wd, int64_t days) noexcept {
    return weekday_from_number(static_cast<int64_t>(wd) - days % DAYS_PER_WEEK);
}

constexpr Weekday& operator+=(Weekday& wd, int64_t days) noexcept {
    wd = wd + days;
    return wd;
}

constexpr Weekday& operator-=(Weekday& wd, int64_t days) noexcept {
    wd = wd - days;
    return wd;
}

/// Days to move forward from `from` to reach `to`, in [0, 6]
constexpr int64_t days_until(Weekday from, Weekday to) noexcept {
    return (static_cast<int64_t>(to) - static_cast<int64_t>(from) + DAYS_PER_WEEK) %
           DAYS_PER_WEEK;
}

[[nodiscard]] constexpr const char* to_string(Weekday wd) noexcept {
    switch (wd) {
        case Weekday::Monday:
            return "Monday";
        case Weekday::Tuesday:
            return "Tuesday";
        case Weekday::Wednesday:
            return "Wednesday";
        case Weekday::Thursday:
            return "Thursday";
        case Weekday::Friday:
            return "Friday";
        case Weekday::Saturday:
            return "Saturday";
        case Weekday::Sunday:
            return "Sunday";
    }
    return "Monday";
}

/// Full weekday name, any case, surrounding blanks ignored
inline expected<Weekday, ParseError> parse_weekday(std::string_view name) noexcept {
    name = detail::trim(name);
    for (int i = 0; i < DAYS_PER_WEEK; ++i) {
        const auto wd = static_cast<Weekday>(i);
        if (detail::iequals(name, to_string(wd))) {
            return wd;
        }
    }
    return unexpected(ParseError{ParseError::Kind::unknown_weekday, 0, "unknown weekday name"});
}

} // namespace tempus

template <>
struct fmt::formatter<tempus::Weekday> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tempus::Weekday wd, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(tempus::to_string(wd), ctx);
    }
};
