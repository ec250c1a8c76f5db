#ifndef TIMEDATE_REPRESENTATION_H
#define TIMEDATE_REPRESENTATION_H

#include <timedate/timedate_export.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace timedate {
    /**
     * The supported ways of presenting the current time. The enumeration is closed, every table below is a switch
     * over all of the values so that adding a kind without handling it is flagged by the compiler.
     */
    enum class RepresentationKind : uint8_t {
        Time,        // local HH:MM
        Date,        // local YYYY-MM-DD
        DateTime,    // local "date, time"
        DateTimeUTC, // utc "date, time"
        DateTimeISO, // local YYYY-MM-DDTHH:MM:00
        TimeDate,    // local "time, date"
        Beat,        // Swatch Internet Time @NNN
        TimeUTC,     // utc HH:MM
    };

    // Canonical order, this is the order publishers are created in.
    inline constexpr std::array<RepresentationKind, 8> ALL_REPRESENTATION_KINDS{
        RepresentationKind::Time,        RepresentationKind::Date,        RepresentationKind::DateTime,
        RepresentationKind::DateTimeUTC, RepresentationKind::DateTimeISO, RepresentationKind::TimeDate,
        RepresentationKind::Beat,        RepresentationKind::TimeUTC,
    };

    // "time", "date", "date_time", "date_time_utc", "date_time_iso", "time_date", "beat", "time_utc"
    [[nodiscard]] TIMEDATE_EXPORT std::string_view option_key(RepresentationKind kind);

    [[nodiscard]] TIMEDATE_EXPORT std::optional<RepresentationKind> kind_from_option_key(std::string_view key);

    // The human readable name, e.g. "Date & Time (UTC)"
    [[nodiscard]] TIMEDATE_EXPORT std::string_view label(RepresentationKind kind);

    /**
     * Derived from the tokens of the option key: both "date" and "time" give mdi:calendar-clock, "date" alone gives
     * mdi:calendar and anything else mdi:clock.
     */
    [[nodiscard]] TIMEDATE_EXPORT std::string_view icon(RepresentationKind kind);

    // "{base_id}_{option key}"
    [[nodiscard]] TIMEDATE_EXPORT std::string unique_id(std::string_view base_id, RepresentationKind kind);
} // namespace timedate

#endif // TIMEDATE_REPRESENTATION_H
