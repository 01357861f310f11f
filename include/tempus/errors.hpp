#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include <cstdint>

namespace tempus {

/**
 * @brief A narrowing conversion of a Duration did not fit its target type
 *
 * Returned by accessors such as Duration::try_truncated_nanoseconds() and
 * Epoch::to_gpst_nanoseconds(). Arithmetic never produces this error: it
 * saturates instead.
 */
struct DurationError {
    enum class Kind : uint8_t {
        overflow, ///< Value is above the range of the target type
        underflow ///< Value is below the range of the target type
    };

    Kind kind;

    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::overflow:
                return "Duration overflow";
            case Kind::underflow:
                return "Duration underflow";
        }
        return "Unknown duration error";
    }

    friend constexpr bool operator==(const DurationError&, const DurationError&) noexcept = default;
};

/**
 * @brief Invalid calendar input
 */
struct CalendarError {
    enum class Kind : uint8_t {
        carry,                 ///< Calendar date does not fit the representable range
        invalid_gregorian_date ///< Field out of range (month, day, hour, leap second...)
    };

    Kind kind;

    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::carry:
                return "Calendar date out of representable range";
            case Kind::invalid_gregorian_date:
                return "Invalid Gregorian date";
        }
        return "Unknown calendar error";
    }

    friend constexpr bool operator==(const CalendarError&, const CalendarError&) noexcept = default;
};

/**
 * @brief Failure to parse a string, a name or an external data file
 *
 * `details` is a static string describing where the parse failed and
 * `errno_value` is populated for I/O failures only.
 */
struct ParseError {
    enum class Kind : uint8_t {
        value_error,             ///< Malformed numeric literal
        time_system,             ///< Unknown time scale name
        unknown_format,          ///< Line or token does not follow the expected layout
        unknown_or_missing_unit, ///< Duration unit absent or not recognized
        unsupported_time_system, ///< Time scale recognized but not usable here
        unknown_weekday,         ///< Weekday name not recognized
        unknown_month_name,      ///< Month name not recognized
        invalid_timezone,        ///< Malformed [+-]HH[:]MM[[:]SS] offset
        nothing_to_parse,        ///< Empty input
        io_error                 ///< File could not be opened or read
    };

    Kind kind;
    int errno_value{0};
    const char* details{""};

    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::value_error:
                return "Invalid numeric value";
            case Kind::time_system:
                return "Unknown time scale";
            case Kind::unknown_format:
                return "Unknown format";
            case Kind::unknown_or_missing_unit:
                return "Unknown or missing unit";
            case Kind::unsupported_time_system:
                return "Unsupported time scale";
            case Kind::unknown_weekday:
                return "Unknown weekday";
            case Kind::unknown_month_name:
                return "Unknown month name";
            case Kind::invalid_timezone:
                return "Invalid time zone offset";
            case Kind::nothing_to_parse:
                return "Nothing to parse";
            case Kind::io_error:
                return "I/O error";
        }
        return "Unknown parse error";
    }
};

/**
 * @brief Unified library error type
 *
 * A variant that can represent:
 * - DurationError: narrowing accessor failure
 * - CalendarError: invalid Gregorian input
 * - ParseError: string, name or file parsing failure
 */
using Error = std::variant<DurationError, CalendarError, ParseError>;

[[nodiscard]] inline bool is_duration_error(const Error& e) noexcept {
    return std::holds_alternative<DurationError>(e);
}

[[nodiscard]] inline bool is_calendar_error(const Error& e) noexcept {
    return std::holds_alternative<CalendarError>(e);
}

[[nodiscard]] inline bool is_parse_error(const Error& e) noexcept {
    return std::holds_alternative<ParseError>(e);
}

/**
 * @brief Get human-readable error message from any Error
 */
[[nodiscard]] inline const char* error_message(const Error& e) noexcept {
    return std::visit([](auto&& err) -> const char* { return err.message(); }, e);
}

namespace detail {

// Backs the throwing convenience wrappers (from_gregorian, from_path, ...).
template <typename Expected>
auto unwrap_or_throw(Expected&& result) -> typename std::decay_t<Expected>::value_type {
    if (!result) {
        throw std::invalid_argument(result.error().message());
    }
    return *std::forward<Expected>(result);
}

} // namespace detail

} // namespace tempus
