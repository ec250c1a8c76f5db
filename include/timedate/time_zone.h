#ifndef TIMEDATE_TIME_ZONE_H
#define TIMEDATE_TIME_ZONE_H

#include <timedate/timedate_export.h>
#include <timedate/util/date_time.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace timedate {
    /**
     * The conversion capability between the absolute timeline and a zone's wall clock.
     *
     * Implementations only provide the offset in effect at an instant, the conversions are derived from it so that
     * every zone resolves gaps and folds in the same way.
     */
    struct TIMEDATE_EXPORT TimeZone {
        using ptr = std::shared_ptr<const TimeZone>;

        virtual ~TimeZone() = default;

        [[nodiscard]] virtual std::string name() const = 0;

        // Local wall clock minus UTC, in effect at the instant.
        [[nodiscard]] virtual std::chrono::seconds utc_offset(instant_t t) const = 0;

        [[nodiscard]] local_time_t to_local(instant_t t) const;

        /**
         * Maps a wall clock reading back onto the timeline.
         *
         * * A reading that occurs exactly once maps to that instant.
         * * A reading that occurs twice (clocks set back) maps to the earliest instant.
         * * A reading that never occurs (clocks set forward) maps to the instant of the transition, which is the
         *   first valid wall clock reading after the gap. A skipped local midnight therefore resolves to the moment
         *   the day actually begins.
         */
        [[nodiscard]] instant_t to_instant(local_time_t local) const;
    };

    struct TIMEDATE_EXPORT FixedOffsetTimeZone : TimeZone {
        explicit FixedOffsetTimeZone(std::chrono::seconds offset, std::string name = {});

        static TimeZone::ptr utc();

        [[nodiscard]] std::string name() const override;

        [[nodiscard]] std::chrono::seconds utc_offset(instant_t t) const override;

    private:
        std::chrono::seconds _offset;
        std::string _name;
    };

    /**
     * The zone of the running process as seen by the C library (TZ environment variable or /etc/localtime).
     */
    struct TIMEDATE_EXPORT SystemTimeZone : TimeZone {
        [[nodiscard]] std::string name() const override;

        [[nodiscard]] std::chrono::seconds utc_offset(instant_t t) const override;
    };

    /**
     * A zone from the system time zone database (e.g. "Europe/Berlin"), read through the C library.
     *
     * The C library holds a single process wide zone, so every reading points TZ at this zone under a process wide
     * lock and restores the previous setting afterwards.
     */
    struct TIMEDATE_EXPORT NamedTimeZone : TimeZone {
        // Throws ConfigError when the database has no zone of that name
        explicit NamedTimeZone(std::string name);

        [[nodiscard]] std::string name() const override;

        [[nodiscard]] std::chrono::seconds utc_offset(instant_t t) const override;

    private:
        std::string _name;
        // The TZ setting selecting the zone file
        std::string _tz;
    };

    /**
     * A zone described by the host as an initial offset followed by the offsets that apply from each transition
     * instant onwards. This is how a host with its own zone database hands a zone to the core.
     */
    struct TIMEDATE_EXPORT TransitionTimeZone : TimeZone {
        using Transition = std::pair<instant_t, std::chrono::seconds>;

        TransitionTimeZone(std::string name, std::chrono::seconds initial_offset, std::vector<Transition> transitions);

        [[nodiscard]] std::string name() const override;

        [[nodiscard]] std::chrono::seconds utc_offset(instant_t t) const override;

        [[nodiscard]] const std::vector<Transition> &transitions() const { return _transitions; }

    private:
        std::string _name;
        std::chrono::seconds _initial_offset;
        std::vector<Transition> _transitions;
    };

    /**
     * Parses a configured zone name: "UTC" or "Z", "local" for the process zone, a fixed offset in one of the
     * forms +HH:MM, +HHMM, +HH (a leading '-' for zones west of Greenwich, optionally prefixed by "UTC"), or the name
     * of a zone in the system database such as "Europe/Berlin".
     * Throws ConfigError for anything else.
     */
    TIMEDATE_EXPORT TimeZone::ptr parse_time_zone(std::string_view name);
} // namespace timedate

#endif // TIMEDATE_TIME_ZONE_H
