#include <timedate/formatter.h>
#include <timedate/util/errors.h>

#include <fmt/format.h>

namespace timedate {
    int swatch_beat(instant_t t) {
        constexpr time_delta_t day{std::chrono::days(1)};
        const auto time_of_day = floor_mod((t + BIEL_MEAN_TIME_OFFSET).time_since_epoch(), day);
        // seconds * 10 // 864, carried out on the microsecond count
        return static_cast<int>(time_of_day.count() * 10 / (864 * 1'000'000LL));
    }

    std::string format_time(const DateTimeFields &fields) {
        return fmt::format("{:02}:{:02}", fields.time_of_day.hours().count(), fields.time_of_day.minutes().count());
    }

    std::string format_date(const DateTimeFields &fields) {
        return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(fields.date.year()),
                           static_cast<unsigned>(fields.date.month()), static_cast<unsigned>(fields.date.day()));
    }

    std::string format_value(instant_t t, const TimeZone &zone, RepresentationKind kind) {
        switch (kind) {
            case RepresentationKind::Time: return format_time(split_fields(zone.to_local(t)));
            case RepresentationKind::Date: return format_date(split_fields(zone.to_local(t)));
            case RepresentationKind::DateTime: {
                const auto local = split_fields(zone.to_local(t));
                return fmt::format("{}, {}", format_date(local), format_time(local));
            }
            case RepresentationKind::DateTimeUTC: {
                const auto utc = split_fields(t);
                return fmt::format("{}, {}", format_date(utc), format_time(utc));
            }
            case RepresentationKind::DateTimeISO: {
                // Minute precision, the value is the local date and time re-emitted as a naive ISO 8601 timestamp
                const auto local = split_fields(zone.to_local(t));
                return fmt::format("{}T{}:00", format_date(local), format_time(local));
            }
            case RepresentationKind::TimeDate: {
                const auto local = split_fields(zone.to_local(t));
                return fmt::format("{}, {}", format_time(local), format_date(local));
            }
            case RepresentationKind::Beat: return fmt::format("@{:03}", swatch_beat(t));
            case RepresentationKind::TimeUTC: return format_time(split_fields(t));
        }
        throw_error<std::logic_error>("Cannot format unknown representation kind: {}", static_cast<int>(kind));
    }

    Formatter::Formatter(TimeZone::ptr zone) : _zone{std::move(zone)} {
        if (!_zone) { throw_error<std::invalid_argument>("Formatter requires a time zone"); }
    }

    std::string Formatter::format(instant_t t, RepresentationKind kind) const { return format_value(t, *_zone, kind); }
} // namespace timedate
