#ifndef TIMEDATE_PLATFORM_H
#define TIMEDATE_PLATFORM_H

#include <timedate/config.h>
#include <timedate/publisher.h>
#include <timedate/runtime/runtime_context.h>
#include <timedate/time_zone.h>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <string>
#include <vector>

namespace timedate {
    /**
     * Sets up the publishers of one configuration entry.
     *
     * setup_entry() resolves the zone (a missing or unknown zone fails the whole entry, nothing is created), removes
     * any value left in the sink for a disabled kind, then creates and activates one publisher per enabled kind in
     * the canonical kind order. unload() deactivates and releases them all.
     */
    struct TIMEDATE_EXPORT TimeDatePlatform {
        explicit TimeDatePlatform(RuntimeContext context);

        ~TimeDatePlatform();

        TimeDatePlatform(const TimeDatePlatform &) = delete;

        TimeDatePlatform &operator=(const TimeDatePlatform &) = delete;

        /**
         * Throws SetupError when the zone is missing or cannot be resolved and ConfigError when the entry has no id.
         * Setting up an already loaded platform unloads it first.
         */
        void setup_entry(const TimeDateConfig &config);

        /**
         * As setup_entry but with an already resolved zone, for hosts that own their zone database.
         */
        void setup_entry(const TimeDateConfig &config, TimeZone::ptr zone);

        void unload();

        void reload(const TimeDateConfig &config);

        [[nodiscard]] bool is_loaded() const { return _zone != nullptr; }

        [[nodiscard]] const TimeZone::ptr &zone() const { return _zone; }

        [[nodiscard]] const RuntimeContext &context() const { return _context; }

        [[nodiscard]] const std::string &entry_id() const { return _entry_id; }

        [[nodiscard]] std::vector<RepresentationKind> kinds() const;

        [[nodiscard]] std::vector<std::string> unique_ids() const;

        [[nodiscard]] TimeDatePublisher *publisher(RepresentationKind kind) const;

        [[nodiscard]] size_t size() const { return _publishers.size(); }

    private:
        RuntimeContext _context;
        TimeZone::ptr _zone;
        std::string _entry_id;
        // Creation order, kept for deterministic teardown
        std::vector<RepresentationKind> _order;
        ankerl::unordered_dense::map<std::string, TimeDatePublisher::ptr> _publishers;
    };
} // namespace timedate

#endif // TIMEDATE_PLATFORM_H
