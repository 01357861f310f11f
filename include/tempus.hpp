#pragma once

/**
 * @file tempus.hpp
 * @brief Convenience header for the whole library
 *
 * Core types:
 * - Duration: signed nanosecond span over +/- 32768 centuries, saturating
 * - Unit, Freq: time units and frequencies that multiply into Durations
 * - TimeScale: TAI, TT, ET, TDB, UTC, GPST, GST, BDT, QZSST
 * - Epoch: an instant in a time scale, with conversion between scales
 * - TimeSeries: evenly spaced epochs
 *
 * Calendar:
 * - Gregorian, compute_gregorian(), is_gregorian_valid(), is_leap_year()
 * - Weekday, MonthName
 *
 * External tables:
 * - BuiltinLeapSeconds and LeapSecondsFile (IERS leap-seconds.list)
 * - Ut1Provider (JPL EOP2 short files)
 *
 * Errors are reported through expected<T, E> with DurationError,
 * CalendarError or ParseError; see errors.hpp.
 */

#include "tempus/duration.hpp"
#include "tempus/duration_format.hpp"
#include "tempus/epoch.hpp"
#include "tempus/errors.hpp"
#include "tempus/expected.hpp"
#include "tempus/gregorian.hpp"
#include "tempus/leap_seconds.hpp"
#include "tempus/leap_seconds_file.hpp"
#include "tempus/logger.hpp"
#include "tempus/month.hpp"
#include "tempus/time_scale.hpp"
#include "tempus/time_series.hpp"
#include "tempus/unit.hpp"
#include "tempus/ut1.hpp"
#include "tempus/weekday.hpp"
