#ifndef TIMEDATE_DATE_TIME_H
#define TIMEDATE_DATE_TIME_H

#include <timedate/timedate_export.h>

#include <chrono>
#include <string>

namespace timedate {
    using instant_clock = std::chrono::system_clock;
    // Microsecond precision keeps the full calendar range representable and matches host timestamps
    using instant_t = std::chrono::time_point<instant_clock, std::chrono::microseconds>;
    using time_delta_t = std::chrono::microseconds;
    using local_time_t = std::chrono::local_time<std::chrono::microseconds>;
    using local_date_t = std::chrono::year_month_day;

    constexpr time_delta_t smallest_time_increment() noexcept { return time_delta_t(1); }

    inline auto static MIN_TD = smallest_time_increment();

    /**
     * Modulo that rounds towards negative infinity, so the result is always in [0, divisor) for a positive divisor.
     * Required for instants before the epoch where the built-in % would produce a negative remainder.
     */
    constexpr time_delta_t floor_mod(time_delta_t value, time_delta_t divisor) noexcept {
        auto r = value % divisor;
        return r < time_delta_t::zero() ? r + divisor : r;
    }

    inline instant_t now_instant() {
        return std::chrono::time_point_cast<std::chrono::microseconds>(instant_clock::now());
    }

    /**
     * A calendar date and a time of day broken out of a point in time, utc or local.
     */
    struct DateTimeFields {
        local_date_t date;
        std::chrono::hh_mm_ss<time_delta_t> time_of_day;
    };

    TIMEDATE_EXPORT DateTimeFields split_fields(time_delta_t since_epoch);

    inline DateTimeFields split_fields(instant_t t) { return split_fields(t.time_since_epoch()); }

    inline DateTimeFields split_fields(local_time_t t) { return split_fields(t.time_since_epoch()); }

    // 2023-01-01T23:00:00.000000Z
    TIMEDATE_EXPORT std::string to_iso_string(instant_t t);

    // 2023-01-01T23:00:00.000000 (no designator, the wall clock of some zone)
    TIMEDATE_EXPORT std::string to_iso_string(local_time_t t);
} // namespace timedate

#endif  // TIMEDATE_DATE_TIME_H
