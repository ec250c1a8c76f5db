#ifndef TIMEDATE_FORMATTER_H
#define TIMEDATE_FORMATTER_H

#include <timedate/representation.h>
#include <timedate/time_zone.h>
#include <timedate/util/date_time.h>

#include <string>

namespace timedate {
    // Beats are referenced to Biel Mean Time (UTC+1), @000 starts at 23:00:00 UTC.
    inline constexpr std::chrono::hours BIEL_MEAN_TIME_OFFSET{1};

    inline constexpr time_delta_t BEAT_LENGTH{86'400'000}; // 86.4 seconds

    /**
     * The Swatch Internet Time beat [0, 999] for the instant.
     *
     * The time of day (in BMT) is scaled to whole tenths and divided by 864 as integers. Dividing floating point
     * seconds by 86.4 rounds differently near beat boundaries, e.g. 63763.2s is beat 738 not 737.
     */
    [[nodiscard]] TIMEDATE_EXPORT int swatch_beat(instant_t t);

    [[nodiscard]] TIMEDATE_EXPORT std::string format_time(const DateTimeFields &fields);

    [[nodiscard]] TIMEDATE_EXPORT std::string format_date(const DateTimeFields &fields);

    /**
     * Produces the value of a representation for a single instant. Both the utc and local fields are derived from
     * the same instant, a value never mixes readings of the clock.
     */
    [[nodiscard]] TIMEDATE_EXPORT std::string format_value(instant_t t, const TimeZone &zone, RepresentationKind kind);

    /**
     * The formatter bound to the configured zone.
     */
    struct TIMEDATE_EXPORT Formatter {
        explicit Formatter(TimeZone::ptr zone);

        [[nodiscard]] std::string format(instant_t t, RepresentationKind kind) const;

        [[nodiscard]] const TimeZone &zone() const { return *_zone; }

    private:
        TimeZone::ptr _zone;
    };
} // namespace timedate

#endif // TIMEDATE_FORMATTER_H
