#include <timedate/platform.h>
#include <timedate/util/errors.h>

#include <fmt/ranges.h>

#include <ranges>

namespace timedate {
    namespace {
        constexpr std::string_view LOGGER{"timedate.platform"};
    }

    TimeDatePlatform::TimeDatePlatform(RuntimeContext context) : _context{std::move(context)} { _context.validate(); }

    TimeDatePlatform::~TimeDatePlatform() {
        try {
            unload();
        } catch (const std::exception &e) {
            _context.diagnostics->error(LOGGER, "Failed to unload {}: {}", _entry_id, e.what());
        }
    }

    void TimeDatePlatform::setup_entry(const TimeDateConfig &config) {
        if (!config.time_zone || config.time_zone->empty()) {
            _context.diagnostics->error(LOGGER, "Timezone is not set in the configuration of {}", config.entry_id);
            throw_error<SetupError>("Timezone is not set in the configuration of '{}'", config.entry_id);
        }

        TimeZone::ptr zone;
        try {
            zone = parse_time_zone(*config.time_zone);
        } catch (const ConfigError &e) {
            _context.diagnostics->error(LOGGER, "Unable to resolve the timezone of {}: {}", config.entry_id, e.what());
            throw_error<SetupError>("Unable to resolve the timezone of '{}': {}", config.entry_id, e.what());
        }
        setup_entry(config, std::move(zone));
    }

    void TimeDatePlatform::setup_entry(const TimeDateConfig &config, TimeZone::ptr zone) {
        if (!zone) {
            _context.diagnostics->error(LOGGER, "Timezone is not set in the configuration of {}", config.entry_id);
            throw_error<SetupError>("Timezone is not set in the configuration of '{}'", config.entry_id);
        }
        if (config.entry_id.empty()) { throw_error<ConfigError>("A configuration entry requires an id"); }

        if (is_loaded()) { unload(); }

        // Values of kinds that have since been disabled must not linger in the host
        for (auto kind : config.options.disabled_kinds()) { _context.sink->retract(unique_id(config.entry_id, kind)); }

        _zone = std::move(zone);
        _entry_id = config.entry_id;
        for (auto kind : config.options.enabled_kinds()) {
            auto id = unique_id(_entry_id, kind);
            auto publisher = std::make_unique<TimeDatePublisher>(id, kind, _zone, _context);
            auto *raw = publisher.get();
            _publishers.emplace(std::move(id), std::move(publisher));
            _order.push_back(kind);
            raw->activate();
        }

        std::vector<std::string_view> keys;
        for (auto kind : _order) { keys.push_back(option_key(kind)); }
        _context.diagnostics->info(LOGGER, "Set up {} in {} with [{}]", _entry_id, _zone->name(),
                                   fmt::join(keys, ", "));
    }

    void TimeDatePlatform::unload() {
        // Deactivate everything (cancelling timers) before anything is released
        for (auto kind : _order | std::views::reverse) {
            if (auto *p = publisher(kind)) { p->deactivate(); }
        }
        _publishers.clear();
        _order.clear();
        _zone.reset();
    }

    void TimeDatePlatform::reload(const TimeDateConfig &config) {
        unload();
        setup_entry(config);
    }

    std::vector<RepresentationKind> TimeDatePlatform::kinds() const { return _order; }

    std::vector<std::string> TimeDatePlatform::unique_ids() const {
        std::vector<std::string> result;
        result.reserve(_order.size());
        for (auto kind : _order) { result.push_back(unique_id(_entry_id, kind)); }
        return result;
    }

    TimeDatePublisher *TimeDatePlatform::publisher(RepresentationKind kind) const {
        auto it = _publishers.find(unique_id(_entry_id, kind));
        return it == _publishers.end() ? nullptr : it->second.get();
    }
} // namespace timedate
