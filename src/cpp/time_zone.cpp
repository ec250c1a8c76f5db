#include <timedate/time_zone.h>
#include <timedate/util/errors.h>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <mutex>
#include <optional>

namespace timedate {
    namespace {
        std::string offset_name(std::chrono::seconds offset) {
            if (offset == std::chrono::seconds::zero()) { return "UTC"; }
            const auto magnitude = offset < std::chrono::seconds::zero() ? -offset : offset;
            const auto hours = std::chrono::duration_cast<std::chrono::hours>(magnitude);
            const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(magnitude - hours);
            return fmt::format("{}{:02}:{:02}", offset < std::chrono::seconds::zero() ? '-' : '+', hours.count(),
                               minutes.count());
        }

        std::string_view trim(std::string_view text) {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) { text.remove_prefix(1); }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) { text.remove_suffix(1); }
            return text;
        }

        bool iequals(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(lhs, rhs, [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
            });
        }

        std::optional<int> parse_two_digits(std::string_view text) {
            if (text.size() != 2) { return std::nullopt; }
            int value{0};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) { return std::nullopt; }
            return value;
        }

        std::optional<std::chrono::seconds> parse_offset(std::string_view text) {
            if (text.empty() || (text.front() != '+' && text.front() != '-')) { return std::nullopt; }
            const bool negative = text.front() == '-';
            text.remove_prefix(1);

            std::string_view hours_text;
            std::string_view minutes_text{"00"};
            if (text.size() == 2) {
                hours_text = text;
            } else if (text.size() == 4) {
                hours_text = text.substr(0, 2);
                minutes_text = text.substr(2);
            } else if (text.size() == 5 && text[2] == ':') {
                hours_text = text.substr(0, 2);
                minutes_text = text.substr(3);
            } else {
                return std::nullopt;
            }

            auto hours = parse_two_digits(hours_text);
            auto minutes = parse_two_digits(minutes_text);
            if (!hours || !minutes || *hours > 23 || *minutes > 59) { return std::nullopt; }
            std::chrono::seconds offset = std::chrono::hours(*hours) + std::chrono::minutes(*minutes);
            return negative ? -offset : offset;
        }

        // TZ and the C library's zone state are process wide, every reading of them goes through this lock
        std::mutex &tz_environment_mutex() {
            static std::mutex mutex;
            return mutex;
        }

        // Requires tz_environment_mutex to be held
        std::chrono::seconds c_library_offset(instant_t t) {
            const std::time_t tt =
                static_cast<std::time_t>(std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count());
            std::tm result{};
            if (localtime_r(&tt, &result) == nullptr) {
                throw_error("Unable to convert {} to local time", to_iso_string(t));
            }
            return std::chrono::seconds(result.tm_gmtoff);
        }

        // Points TZ at another zone until destroyed, then restores whatever was there before
        struct ScopedTzSetting {
            explicit ScopedTzSetting(const std::string &tz) {
                if (const char *current = std::getenv("TZ")) { _previous = current; }
                ::setenv("TZ", tz.c_str(), 1);
                ::tzset();
            }

            ~ScopedTzSetting() {
                if (_previous) {
                    ::setenv("TZ", _previous->c_str(), 1);
                } else {
                    ::unsetenv("TZ");
                }
                ::tzset();
            }

            ScopedTzSetting(const ScopedTzSetting &) = delete;

            ScopedTzSetting &operator=(const ScopedTzSetting &) = delete;

        private:
            std::optional<std::string> _previous;
        };

        std::filesystem::path zoneinfo_directory() {
            if (const char *dir = std::getenv("TZDIR"); dir != nullptr && *dir != '\0') { return dir; }
            return "/usr/share/zoneinfo";
        }

        // Area/Location style names, which also keeps the name from walking out of the database directory
        bool is_zone_name(std::string_view text) {
            if (text.empty() || text.front() == '/' || text.back() == '/') { return false; }
            return std::ranges::all_of(text, [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '/' || c == '_' || c == '-' || c == '+';
            });
        }
    } // namespace

    local_time_t TimeZone::to_local(instant_t t) const {
        return local_time_t{t.time_since_epoch() + utc_offset(t)};
    }

    instant_t TimeZone::to_instant(local_time_t local) const {
        using namespace std::chrono;
        const instant_t guess{local.time_since_epoch()};
        // A day either side is far enough to see the offsets on both sides of any transition affecting this reading
        const std::array<seconds, 3> offsets{utc_offset(guess - hours(24)), utc_offset(guess),
                                             utc_offset(guess + hours(24))};

        std::optional<instant_t> earliest;
        instant_t lo{instant_t::max()};
        instant_t hi{instant_t::min()};
        for (const auto offset : offsets) {
            const instant_t candidate{guess - offset};
            lo = std::min(lo, candidate);
            hi = std::max(hi, candidate);
            if (to_local(candidate) == local && (!earliest || candidate < *earliest)) { earliest = candidate; }
        }
        if (earliest) { return *earliest; }

        // The reading falls in a gap, the first instant carrying the later offset is where the wall clock resumes
        const auto before = utc_offset(lo);
        while (hi - lo > MIN_TD) {
            const instant_t mid{lo + (hi - lo) / 2};
            if (utc_offset(mid) == before) {
                lo = mid;
            } else {
                hi = mid;
            }
        }
        return hi;
    }

    FixedOffsetTimeZone::FixedOffsetTimeZone(std::chrono::seconds offset, std::string name)
        : _offset{offset}, _name{name.empty() ? offset_name(offset) : std::move(name)} {}

    TimeZone::ptr FixedOffsetTimeZone::utc() {
        static const TimeZone::ptr instance{std::make_shared<FixedOffsetTimeZone>(std::chrono::seconds::zero())};
        return instance;
    }

    std::string FixedOffsetTimeZone::name() const { return _name; }

    std::chrono::seconds FixedOffsetTimeZone::utc_offset(instant_t) const { return _offset; }

    std::string SystemTimeZone::name() const { return "local"; }

    std::chrono::seconds SystemTimeZone::utc_offset(instant_t t) const {
        std::lock_guard<std::mutex> lock(tz_environment_mutex());
        return c_library_offset(t);
    }

    NamedTimeZone::NamedTimeZone(std::string name) : _name{std::move(name)} {
        if (!is_zone_name(_name)) { throw_error<ConfigError>("Invalid time zone name '{}'", _name); }
        const auto path = zoneinfo_directory() / _name;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw_error<ConfigError>("Unknown time zone '{}', no such zone in {}", _name,
                                     zoneinfo_directory().string());
        }
        // A leading ':' makes the C library read the zone file rather than parse a POSIX rule
        _tz = ":" + path.string();
    }

    std::string NamedTimeZone::name() const { return _name; }

    std::chrono::seconds NamedTimeZone::utc_offset(instant_t t) const {
        std::lock_guard<std::mutex> lock(tz_environment_mutex());
        ScopedTzSetting setting{_tz};
        return c_library_offset(t);
    }

    TransitionTimeZone::TransitionTimeZone(std::string name, std::chrono::seconds initial_offset,
                                           std::vector<Transition> transitions)
        : _name{std::move(name)}, _initial_offset{initial_offset}, _transitions{std::move(transitions)} {
        if (!std::ranges::is_sorted(_transitions, {}, &Transition::first)) {
            throw_error<std::invalid_argument>("Transitions for zone '{}' must be sorted by instant", _name);
        }
    }

    std::string TransitionTimeZone::name() const { return _name; }

    std::chrono::seconds TransitionTimeZone::utc_offset(instant_t t) const {
        // The last transition at or before t applies
        auto it = std::ranges::upper_bound(_transitions, t, {}, &Transition::first);
        if (it == _transitions.begin()) { return _initial_offset; }
        return std::prev(it)->second;
    }

    TimeZone::ptr parse_time_zone(std::string_view name) {
        auto text = trim(name);
        if (iequals(text, "utc") || iequals(text, "z") || iequals(text, "gmt")) { return FixedOffsetTimeZone::utc(); }
        if (iequals(text, "local")) { return std::make_shared<SystemTimeZone>(); }

        auto offset_text = text;
        if (offset_text.size() > 3 && iequals(offset_text.substr(0, 3), "utc")) { offset_text.remove_prefix(3); }
        if (auto offset = parse_offset(offset_text)) {
            if (*offset == std::chrono::seconds::zero()) { return FixedOffsetTimeZone::utc(); }
            return std::make_shared<FixedOffsetTimeZone>(*offset);
        }
        if (is_zone_name(text)) { return std::make_shared<NamedTimeZone>(std::string(text)); }
        throw_error<ConfigError>("Unrecognised time zone '{}'", text);
    }
} // namespace timedate
