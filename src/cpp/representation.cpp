#include <timedate/representation.h>
#include <timedate/util/errors.h>

#include <fmt/format.h>

#include <algorithm>
#include <ranges>

namespace timedate {
    namespace {
        [[noreturn]] void unknown_kind(RepresentationKind kind) {
            throw_error<std::logic_error>("Unknown representation kind: {}", static_cast<int>(kind));
        }

        bool has_token(std::string_view key, std::string_view token) {
            return std::ranges::any_of(key | std::views::split('_'), [token](auto &&part) {
                return std::string_view(part.begin(), part.end()) == token;
            });
        }
    } // namespace

    std::string_view option_key(RepresentationKind kind) {
        switch (kind) {
            case RepresentationKind::Time: return "time";
            case RepresentationKind::Date: return "date";
            case RepresentationKind::DateTime: return "date_time";
            case RepresentationKind::DateTimeUTC: return "date_time_utc";
            case RepresentationKind::DateTimeISO: return "date_time_iso";
            case RepresentationKind::TimeDate: return "time_date";
            case RepresentationKind::Beat: return "beat";
            case RepresentationKind::TimeUTC: return "time_utc";
        }
        unknown_kind(kind);
    }

    std::optional<RepresentationKind> kind_from_option_key(std::string_view key) {
        auto it = std::ranges::find(ALL_REPRESENTATION_KINDS, key, option_key);
        if (it == ALL_REPRESENTATION_KINDS.end()) { return std::nullopt; }
        return *it;
    }

    std::string_view label(RepresentationKind kind) {
        switch (kind) {
            case RepresentationKind::Time: return "Time";
            case RepresentationKind::Date: return "Date";
            case RepresentationKind::DateTime: return "Date & Time";
            case RepresentationKind::DateTimeUTC: return "Date & Time (UTC)";
            case RepresentationKind::DateTimeISO: return "Date & Time (ISO)";
            case RepresentationKind::TimeDate: return "Time & Date";
            case RepresentationKind::Beat: return "Internet Time";
            case RepresentationKind::TimeUTC: return "Time (UTC)";
        }
        unknown_kind(kind);
    }

    std::string_view icon(RepresentationKind kind) {
        const auto key = option_key(kind);
        const bool date = has_token(key, "date");
        if (date && has_token(key, "time")) { return "mdi:calendar-clock"; }
        if (date) { return "mdi:calendar"; }
        return "mdi:clock";
    }

    std::string unique_id(std::string_view base_id, RepresentationKind kind) {
        return fmt::format("{}_{}", base_id, option_key(kind));
    }
} // namespace timedate
