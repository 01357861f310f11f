#include <iostream>
#include <string>

#include <fmt/format.h>
#include <tempus.hpp>

using namespace tempus;

// Helper function to print an epoch in several time scales
void printEpoch(const Epoch& e, const std::string& label) {
    fmt::print("{}:\n", label);
    fmt::print("  Own scale: {}\n", e);
    fmt::print("  TAI:       {:x}\n", e);
    fmt::print("  TT:        {:X}\n", e);
    fmt::print("  TDB:       {:e}\n", e);
    fmt::print("  GPST:      {}\n", e.to_time_scale(TimeScale::GPST));
    fmt::print("  MJD (TAI): {:.9f}\n", e.to_mjd_tai_days());
    fmt::print("  Weekday:   {}\n\n", e.weekday_utc());
}

int main(int argc, char* argv[]) {
    std::cout << "Tempus Epoch Examples\n";
    std::cout << "=====================\n\n";

    // Example 1: Creating epochs
    std::cout << "1. Creating Epochs\n";
    std::cout << "------------------\n";

    auto utc = Epoch::from_gregorian_utc_hms(2022, 12, 1, 10, 11, 12);
    printEpoch(utc, "From a UTC calendar date");

    auto unix_time = Epoch::from_unix_seconds(1'651'487'955.0);
    printEpoch(unix_time, "From UNIX seconds (1651487955)");

    auto gps = Epoch::from_time_of_week(2238, 345'618'000'000'000, TimeScale::GPST);
    printEpoch(gps, "From GPS week 2238");

    auto invalid = Epoch::maybe_from_gregorian_utc(2021, 2, 29, 0, 0, 0, 0);
    if (!invalid) {
        fmt::print("2021-02-29 rejected: {}\n\n", invalid.error().message());
    }

    // Example 2: Arithmetic across a leap second
    std::cout << "2. Arithmetic\n";
    std::cout << "-------------\n";

    auto before = Epoch::from_gregorian_utc_hms(2016, 12, 31, 23, 59, 0);
    auto after = before + 2 * Unit::Minute;
    fmt::print("{} + 2 min = {}\n", before, after);
    fmt::print("Elapsed in UTC: {}\n", after - before);
    fmt::print("Elapsed in TAI: {}\n\n", after.to_time_scale(TimeScale::TAI) - before);

    auto parsed = parse_duration("1 h 30 min 15.5 s");
    if (parsed) {
        fmt::print("{} + {} = {}\n\n", utc, *parsed, utc + *parsed);
    }

    // Example 3: Rounding and weekdays
    std::cout << "3. Rounding and Weekdays\n";
    std::cout << "------------------------\n";

    auto precise = Epoch::from_gregorian_tai(2022, 10, 3, 17, 44, 29, 898'032'665);
    fmt::print("Epoch:          {}\n", precise);
    fmt::print("Floor 3 min:    {}\n", precise.floor(3 * Unit::Minute));
    fmt::print("Round 1 s:      {}\n", precise.round(to_duration(Unit::Second)));
    fmt::print("Next Monday:    {}\n", precise.next_weekday_at_midnight(Weekday::Monday));
    fmt::print("ISO format:     {}\n", precise.to_isoformat());
    fmt::print("RFC 3339:       {}\n\n", precise.to_rfc3339());

    // Example 4: Time series
    std::cout << "4. Time Series\n";
    std::cout << "--------------\n";

    auto series = TimeSeries::inclusive(Epoch::from_gregorian_utc_at_midnight(2017, 1, 14),
                                        Epoch::from_gregorian_utc_at_noon(2017, 1, 14),
                                        2 * Unit::Hour);
    fmt::print("{} ({} epochs)\n", series, series.size());
    for (const Epoch& e : series) {
        fmt::print("  {} = {:x}\n", e, e);
    }
    std::cout << "\n";

    // Example 5: External tables, from files given on the command line
    std::cout << "5. External Tables\n";
    std::cout << "------------------\n";

    if (argc > 1) {
        auto leap_seconds = LeapSecondsFile::from_path(argv[1]);
        if (leap_seconds) {
            fmt::print("{} entries in {}\n", leap_seconds->size(), argv[1]);
            fmt::print("TAI - UTC on {}: {} s\n", utc,
                       utc.leap_seconds_with(true, *leap_seconds).value_or(0.0));
        } else {
            fmt::print("cannot load {}: {}\n", argv[1], leap_seconds.error().message());
        }
    }
    if (argc > 2) {
        auto eop = Ut1Provider::from_eop_file(argv[2]);
        if (eop && !eop->empty()) {
            const Epoch probe = (*eop)[eop->size() - 1].epoch + Unit::Hour;
            fmt::print("{} in UT1: {:x}\n", probe, probe.to_ut1(*eop));
        } else if (!eop) {
            fmt::print("cannot load {}: {}\n", argv[2], eop.error().message());
        }
    }
    if (argc <= 1) {
        std::cout << "Usage: epoch_example [leap-seconds.list] [eop2.short]\n";
    }

    return 0;
}
