#pragma once

#include "tempus/detail/ascii.hpp"
#include "tempus/detail/read_file.hpp"
#include "tempus/duration.hpp"
#include "tempus/duration_format.hpp"
#include "tempus/epoch.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"
#include "tempus/logger.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tempus {

/// TAI - UT1 from `epoch` onwards
struct DeltaTaiUt1 {
    Epoch epoch;
    Duration delta_tai_minus_ut1;

    friend bool operator==(const DeltaTaiUt1&, const DeltaTaiUt1&) noexcept = default;
};

/**
 * Table of TAI - UT1 loaded from a JPL EOP2 "short" file.
 *
 * ## Format
 * ```
 * EOP2 header lines, ignored
 *  EOP2=
 *  59580.00,   55.123,  280.456, 37104.5210, ...
 *  $END
 * ```
 * Rows between ` EOP2=` and ` $END` are comma-separated. The first column
 * is the MJD in TAI and the fourth is TAI - UT1 in milliseconds; extra
 * columns are ignored.
 *
 * ## Usage
 * ```cpp
 * auto provider = Ut1Provider::from_eop_file("latest_eop2.short");
 * if (provider) {
 *     auto ut1 = epoch.to_ut1(*provider);
 * }
 * ```
 *
 * Records are sorted by epoch when loaded; the table is read-only afterwards.
 */
class Ut1Provider {
public:
    using value_type = DeltaTaiUt1;
    using const_iterator = std::vector<DeltaTaiUt1>::const_iterator;

    Ut1Provider() = default;

    static expected<Ut1Provider, ParseError> from_eop_data(std::string_view contents) {
        Ut1Provider provider;
        bool in_data = false;
        size_t line_number = 0;
        while (!contents.empty()) {
            const auto eol = contents.find('\n');
            auto line = contents.substr(0, eol);
            contents.remove_prefix(eol == std::string_view::npos ? contents.size() : eol + 1);
            ++line_number;

            line = detail::trim(line);
            if (line == "EOP2=") {
                in_data = true;
                continue;
            }
            if (line == "$END") {
                break;
            }
            if (!in_data || line.empty()) {
                continue;
            }

            auto record = parse_record(line);
            if (!record) {
                TEMPUS_WARN("EOP line {}: {}", line_number, record.error().details);
                return unexpected(record.error());
            }
            provider.data_.push_back(*record);
        }

        std::sort(provider.data_.begin(), provider.data_.end(),
                  [](const DeltaTaiUt1& a, const DeltaTaiUt1& b) { return a.epoch < b.epoch; });
        TEMPUS_DEBUG("loaded {} UT1 records", provider.data_.size());
        return provider;
    }

    static expected<Ut1Provider, ParseError> from_eop_file(const std::string& path) {
        auto contents = detail::read_file(path);
        if (!contents) {
            TEMPUS_WARN("cannot read EOP file {}: errno {}", path, contents.error().errno_value);
            return unexpected(contents.error());
        }
        TEMPUS_DEBUG("parsing EOP file {}", path);
        return from_eop_data(*contents);
    }

    const_iterator begin() const noexcept { return data_.begin(); }
    const_iterator end() const noexcept { return data_.end(); }
    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }
    const DeltaTaiUt1& operator[](size_t index) const noexcept { return data_[index]; }

    /// Last record strictly before `epoch`, nullptr if there is none
    const DeltaTaiUt1* at(const Epoch& epoch) const noexcept {
        auto it = std::lower_bound(
            data_.begin(), data_.end(), epoch,
            [](const DeltaTaiUt1& record, const Epoch& e) { return record.epoch < e; });
        if (it == data_.begin()) {
            return nullptr;
        }
        return &*std::prev(it);
    }

private:
    static expected<DeltaTaiUt1, ParseError> parse_record(std::string_view line) {
        std::string_view columns[4];
        size_t count = 0;
        while (count < 4) {
            const auto comma = line.find(',');
            columns[count++] = detail::trim(line.substr(0, comma));
            if (comma == std::string_view::npos) {
                break;
            }
            line.remove_prefix(comma + 1);
        }
        if (count < 4) {
            return unexpected(ParseError{ParseError::Kind::unknown_format, 0,
                                         "expected EOP line to contain 4 comma-separated columns"});
        }

        double mjd_tai_days = 0.0;
        if (!detail::parse_number(columns[0], mjd_tai_days)) {
            return unexpected(ParseError{ParseError::Kind::value_error, 0,
                                         "when parsing MJD TAI days (first column)"});
        }
        double delta_ut1_ms = 0.0;
        if (!detail::parse_number(columns[3], delta_ut1_ms)) {
            return unexpected(ParseError{ParseError::Kind::value_error, 0,
                                         "when parsing TAI-UT1 in ms (fourth column)"});
        }
        return DeltaTaiUt1{Epoch::from_mjd_tai(mjd_tai_days),
                           Duration::from_milliseconds(delta_ut1_ms)};
    }

    std::vector<DeltaTaiUt1> data_;
};

// Epoch members that need the complete Ut1Provider

inline std::optional<Duration> Epoch::ut1_offset(const Ut1Provider& provider) const {
    const DeltaTaiUt1* record = provider.at(*this);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->delta_tai_minus_ut1;
}

inline Duration Epoch::to_ut1_duration(const Ut1Provider& provider) const {
    return to_tai_duration() - ut1_offset(provider).value_or(Duration::zero());
}

inline Epoch Epoch::to_ut1(const Ut1Provider& provider) const {
    return from_tai_duration(to_ut1_duration(provider));
}

inline Epoch Epoch::from_ut1_duration(Duration d, const Ut1Provider& provider) {
    Epoch e = from_tai_duration(d);
    e += e.ut1_offset(provider).value_or(Duration::zero());
    return e;
}

} // namespace tempus
