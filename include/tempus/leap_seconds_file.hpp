#pragma once

#include "tempus/detail/read_file.hpp"
#include "tempus/duration_format.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"
#include "tempus/leap_seconds.hpp"
#include "tempus/logger.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <cstdint>

namespace tempus {

/**
 * Leap second table loaded from an IERS `leap-seconds.list` file.
 *
 * ## Format
 * ```
 * # comment
 * 2272060800	10	# 1 Jan 1972
 * 2287785600	11	# 1 Jul 1972
 * ```
 * Lines starting with `#` are skipped. Every other non-blank line starts
 * with the NTP timestamp (seconds past 1900-01-01) and TAI - UTC, both as
 * integers. All loaded entries count as announced by the IERS.
 *
 * ## Usage
 * ```cpp
 * auto table = LeapSecondsFile::from_path("leap-seconds.list");
 * if (!table) {
 *     fmt::print("{}\n", table.error().message());
 *     return;
 * }
 * auto delta = epoch.leap_seconds_with(true, *table);
 * ```
 *
 * The table satisfies LeapSecondProvider and is immutable once built.
 */
class LeapSecondsFile {
public:
    using value_type = LeapSecond;
    using const_iterator = std::vector<LeapSecond>::const_iterator;

    LeapSecondsFile() = default;

    static expected<LeapSecondsFile, ParseError> from_string(std::string_view contents) {
        LeapSecondsFile table;
        size_t line_number = 0;
        while (!contents.empty()) {
            const auto eol = contents.find('\n');
            auto line = contents.substr(0, eol);
            contents.remove_prefix(eol == std::string_view::npos ? contents.size() : eol + 1);
            ++line_number;

            line = detail::trim(line);
            if (line.empty() || line.front() == '#') {
                continue;
            }

            auto timestamp_text = detail::next_token(line);
            auto delta_text = detail::next_token(line);
            if (delta_text.empty()) {
                TEMPUS_WARN("leap seconds line {}: expected two columns", line_number);
                return unexpected(ParseError{ParseError::Kind::unknown_format, 0,
                                             "expected a timestamp and a TAI-UTC column"});
            }

            uint64_t timestamp = 0;
            uint32_t delta_at = 0;
            if (!detail::parse_number(timestamp_text, timestamp) ||
                !detail::parse_number(delta_text, delta_at)) {
                TEMPUS_WARN("leap seconds line {}: invalid number", line_number);
                return unexpected(
                    ParseError{ParseError::Kind::value_error, 0, "invalid leap second entry"});
            }
            table.data_.push_back(LeapSecond{static_cast<double>(timestamp),
                                             static_cast<double>(delta_at), true});
        }

        std::sort(table.data_.begin(), table.data_.end(),
                  [](const LeapSecond& a, const LeapSecond& b) {
                      return a.timestamp_tai_s < b.timestamp_tai_s;
                  });
        TEMPUS_DEBUG("loaded {} leap seconds", table.data_.size());
        return table;
    }

    static expected<LeapSecondsFile, ParseError> from_path(const std::string& path) {
        auto contents = detail::read_file(path);
        if (!contents) {
            TEMPUS_WARN("cannot read leap seconds file {}: errno {}", path,
                        contents.error().errno_value);
            return unexpected(contents.error());
        }
        TEMPUS_DEBUG("parsing leap seconds file {}", path);
        return from_string(*contents);
    }

    const_iterator begin() const noexcept { return data_.begin(); }
    const_iterator end() const noexcept { return data_.end(); }
    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }
    const LeapSecond& operator[](size_t index) const noexcept { return data_[index]; }

private:
    std::vector<LeapSecond> data_;
};

static_assert(LeapSecondProvider<LeapSecondsFile>);

} // namespace tempus
