#ifndef TIMEDATE_CONFIG_H
#define TIMEDATE_CONFIG_H

#include <timedate/representation.h>

#include <bitset>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace timedate {
    /**
     * Which representations are enabled, one flag per kind.
     */
    struct TIMEDATE_EXPORT RepresentationOptions {
        RepresentationOptions() = default;

        RepresentationOptions(std::initializer_list<RepresentationKind> kinds);

        void enable(RepresentationKind kind, bool enabled = true);

        [[nodiscard]] bool enabled(RepresentationKind kind) const;

        [[nodiscard]] std::vector<RepresentationKind> enabled_kinds() const;

        [[nodiscard]] std::vector<RepresentationKind> disabled_kinds() const;

        // option key -> flag for every kind, the shape a config entry stores
        [[nodiscard]] std::map<std::string, bool> to_flags() const;

        bool operator==(const RepresentationOptions &) const = default;

    private:
        std::bitset<ALL_REPRESENTATION_KINDS.size()> _flags;
    };

    inline const std::vector<std::string> DEFAULT_DISPLAY_OPTIONS{"time"};

    /**
     * Imports the legacy list form of the configuration, e.g. ["time", "date", "beat"]. Every entry must be an option
     * key, duplicates are harmless. Throws ConfigError for an unknown entry.
     */
    [[nodiscard]] TIMEDATE_EXPORT RepresentationOptions
    options_from_display_options(const std::vector<std::string> &display_options = DEFAULT_DISPLAY_OPTIONS);

    /**
     * Imports per-kind flags keyed by option key. Missing keys are disabled. Throws ConfigError for an unknown key.
     */
    [[nodiscard]] TIMEDATE_EXPORT RepresentationOptions options_from_flags(const std::map<std::string, bool> &flags);

    /**
     * Everything needed to set up the platform for one configuration entry.
     */
    struct TIMEDATE_EXPORT TimeDateConfig {
        // Base of every publisher's unique id
        std::string entry_id;
        // Name understood by parse_time_zone, required
        std::optional<std::string> time_zone;
        RepresentationOptions options{RepresentationKind::Time};
    };
} // namespace timedate

#endif // TIMEDATE_CONFIG_H
