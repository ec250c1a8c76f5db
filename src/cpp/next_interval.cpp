#include <timedate/formatter.h>
#include <timedate/next_interval.h>
#include <timedate/util/errors.h>

namespace timedate {
    std::optional<time_delta_t> update_cadence(RepresentationKind kind) {
        switch (kind) {
            case RepresentationKind::Date: return std::nullopt;
            case RepresentationKind::Beat: return BEAT_LENGTH;
            case RepresentationKind::Time:
            case RepresentationKind::DateTime:
            case RepresentationKind::DateTimeUTC:
            case RepresentationKind::DateTimeISO:
            case RepresentationKind::TimeDate:
            case RepresentationKind::TimeUTC: return MINUTE_CADENCE;
        }
        throw_error<std::logic_error>("No update cadence for unknown representation kind: {}", static_cast<int>(kind));
    }

    time_delta_t delta_to_boundary(instant_t reference, time_delta_t cadence) {
        if (cadence <= time_delta_t::zero()) {
            throw_error<std::invalid_argument>("Cadence must be positive, got {}us", cadence.count());
        }
        auto delta = cadence - floor_mod(reference.time_since_epoch(), cadence);
        // floor_mod is in [0, cadence) so delta is already in (0, cadence], kept explicit as a zero delta would
        // re-arm on the instant that just fired
        if (delta <= time_delta_t::zero()) { delta += cadence; }
        return delta;
    }

    namespace {
        instant_t next_local_midnight(instant_t now, const TimeZone &zone) {
            using namespace std::chrono;
            const auto today = floor<days>(zone.to_local(now));
            auto next_day = today + days(1);
            auto next = zone.to_instant(local_time_t{next_day});
            // Only a zone that moves its clock back across a whole day could land here, step on rather than fire early
            while (next <= now) {
                next_day += days(1);
                next = zone.to_instant(local_time_t{next_day});
            }
            return next;
        }
    } // namespace

    instant_t next_update_time(instant_t now, const TimeZone &zone, RepresentationKind kind) {
        if (kind == RepresentationKind::Date) { return next_local_midnight(now, zone); }
        const auto cadence = *update_cadence(kind);
        // The Biel Mean Time shift only moves the phase, the result stays relative to the real now
        const instant_t reference = kind == RepresentationKind::Beat ? now + BIEL_MEAN_TIME_OFFSET : now;
        return now + delta_to_boundary(reference, cadence);
    }
} // namespace timedate
