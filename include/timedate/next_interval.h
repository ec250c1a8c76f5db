#ifndef TIMEDATE_NEXT_INTERVAL_H
#define TIMEDATE_NEXT_INTERVAL_H

#include <timedate/representation.h>
#include <timedate/time_zone.h>
#include <timedate/util/date_time.h>

#include <optional>

namespace timedate {
    inline constexpr time_delta_t MINUTE_CADENCE{std::chrono::seconds(60)};

    /**
     * The fixed re-computation period of a kind. Date has none, it is aligned to local midnight which is not a fixed
     * distance apart once daylight saving is involved.
     */
    [[nodiscard]] TIMEDATE_EXPORT std::optional<time_delta_t> update_cadence(RepresentationKind kind);

    /**
     * The distance from reference to the next multiple of cadence since the epoch, in (0, cadence]. A reference
     * sitting exactly on a boundary gives a full cadence, never zero.
     */
    [[nodiscard]] TIMEDATE_EXPORT time_delta_t delta_to_boundary(instant_t reference, time_delta_t cadence);

    /**
     * When a value of this kind computed at now next changes, strictly after now.
     *
     * * Date: the next local midnight, computed on the wall clock and mapped back with TimeZone::to_instant.
     * * Beat: the next 86.4s tick, phase aligned on now + 1h (the Biel Mean Time day), returned relative to now.
     * * Everything else: the next whole minute.
     */
    [[nodiscard]] TIMEDATE_EXPORT instant_t next_update_time(instant_t now, const TimeZone &zone,
                                                             RepresentationKind kind);
} // namespace timedate

#endif // TIMEDATE_NEXT_INTERVAL_H
