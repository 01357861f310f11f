#pragma once

#include "tempus/detail/duration_math.hpp"
#include "tempus/duration.hpp"
#include "tempus/duration_format.hpp"
#include "tempus/epoch.hpp"

#include <fmt/format.h>

#include <iterator>
#include <limits>
#include <ostream>
#include <string>

#include <cstddef>
#include <cstdint>

namespace tempus {

/**
 * Evenly spaced epochs from a start epoch up to an end epoch.
 *
 * Item `i` is `start + i * step`. An exclusive series stops before `end`,
 * an inclusive one includes `end` when a step lands on it. A step that is
 * not positive yields an empty series.
 *
 * ## Usage
 * ```cpp
 * auto start = Epoch::from_gregorian_utc_at_midnight(2017, 1, 14);
 * auto end = Epoch::from_gregorian_utc_at_noon(2017, 1, 14);
 * for (const Epoch& e : TimeSeries::exclusive(start, end, 2 * Unit::Hour)) {
 *     fmt::print("{}\n", e); // 00:00, 02:00, ... 10:00
 * }
 * ```
 */
class TimeSeries {
public:
    class iterator {
    public:
        using value_type = Epoch;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        iterator() = default;

        Epoch operator*() const noexcept { return series_->start_ + series_->step_ * index_; }

        iterator& operator++() noexcept {
            ++index_;
            return *this;
        }
        void operator++(int) noexcept { ++index_; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return it.index_ >= it.series_->size();
        }

    private:
        friend class TimeSeries;

        explicit iterator(const TimeSeries* series) noexcept
            : series_(series) {}

        const TimeSeries* series_{nullptr};
        uint64_t index_{0};
    };

    static TimeSeries exclusive(const Epoch& start, const Epoch& end, Duration step) noexcept {
        return TimeSeries(start, end - start, step, false);
    }

    static TimeSeries inclusive(const Epoch& start, const Epoch& end, Duration step) noexcept {
        return TimeSeries(start, end - start, step, true);
    }

    iterator begin() const noexcept { return iterator(this); }
    std::default_sentinel_t end() const noexcept { return {}; }

    /// Number of epochs the series yields, saturated to the uint64_t range
    uint64_t size() const noexcept {
        if (!step_.is_positive() || duration_.is_negative()) {
            return 0;
        }
        const detail::int128_t span = duration_.total_nanoseconds();
        const detail::int128_t step = step_.total_nanoseconds();
        const detail::int128_t count = inclusive_ ? span / step + 1 : (span + step - 1) / step;
        constexpr auto limit = static_cast<detail::int128_t>(std::numeric_limits<uint64_t>::max());
        return count > limit ? std::numeric_limits<uint64_t>::max() : static_cast<uint64_t>(count);
    }

    bool empty() const noexcept { return size() == 0; }

    const Epoch& start() const noexcept { return start_; }
    Duration step() const noexcept { return step_; }
    bool is_inclusive() const noexcept { return inclusive_; }

    /// Bound of the series: `end` when inclusive, one step before `end` otherwise
    Epoch last_bound() const noexcept {
        return inclusive_ ? start_ + duration_ : start_ + duration_ - step_;
    }

private:
    TimeSeries(const Epoch& start, Duration duration, Duration step, bool inclusive) noexcept
        : start_(start),
          duration_(duration),
          step_(step),
          inclusive_(inclusive) {}

    Epoch start_;
    Duration duration_;
    Duration step_;
    bool inclusive_{false};
};

static_assert(std::input_iterator<TimeSeries::iterator>);

} // namespace tempus

/**
 * Formats a TimeSeries as `TimeSeries [start : bound : step]`.
 *
 * Accepts the Epoch presentation types (`x`, `X`, `e`, `E`) for both epochs.
 */
template <>
struct fmt::formatter<tempus::TimeSeries> {
    fmt::formatter<tempus::Epoch> epoch_formatter;

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        return epoch_formatter.parse(ctx);
    }

    template <typename FormatContext>
    auto format(const tempus::TimeSeries& series, FormatContext& ctx) const
        -> decltype(ctx.out()) {
        auto out = fmt::format_to(ctx.out(), "TimeSeries [");
        ctx.advance_to(out);
        out = epoch_formatter.format(series.start(), ctx);
        out = fmt::format_to(out, " : ");
        ctx.advance_to(out);
        out = epoch_formatter.format(series.last_bound(), ctx);
        return fmt::format_to(out, " : {}]", series.step());
    }
};

namespace tempus {

[[nodiscard]] inline std::string to_string(const TimeSeries& series) {
    return fmt::format("{}", series);
}

inline std::ostream& operator<<(std::ostream& os, const TimeSeries& series) {
    return os << to_string(series);
}

} // namespace tempus
