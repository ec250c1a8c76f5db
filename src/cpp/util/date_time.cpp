#include <timedate/util/date_time.h>

#include <fmt/format.h>

namespace timedate {
    namespace {
        std::string format_fields(const DateTimeFields &fields, const char *suffix) {
            return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}{}", static_cast<int>(fields.date.year()),
                               static_cast<unsigned>(fields.date.month()), static_cast<unsigned>(fields.date.day()),
                               fields.time_of_day.hours().count(), fields.time_of_day.minutes().count(),
                               fields.time_of_day.seconds().count(), fields.time_of_day.subseconds().count(), suffix);
        }
    } // namespace

    DateTimeFields split_fields(time_delta_t since_epoch) {
        using namespace std::chrono;
        const sys_days day{floor<days>(since_epoch)};
        return DateTimeFields{year_month_day{day}, hh_mm_ss<time_delta_t>{since_epoch - day.time_since_epoch()}};
    }

    std::string to_iso_string(instant_t t) { return format_fields(split_fields(t), "Z"); }

    std::string to_iso_string(local_time_t t) { return format_fields(split_fields(t), ""); }
} // namespace timedate
