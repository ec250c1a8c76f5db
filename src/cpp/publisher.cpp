#include <timedate/next_interval.h>
#include <timedate/publisher.h>
#include <timedate/util/errors.h>

#include <algorithm>
#include <utility>

namespace timedate {
    namespace {
        constexpr std::string_view LOGGER{"timedate.publisher"};
    }

    std::string_view to_string(PublisherState state) {
        switch (state) {
            case PublisherState::Idle: return "Idle";
            case PublisherState::Armed: return "Armed";
            case PublisherState::Firing: return "Firing";
        }
        return "Unknown";
    }

    TimeDatePublisher::TimeDatePublisher(std::string unique_id, RepresentationKind kind, TimeZone::ptr zone,
                                         RuntimeContext context)
        : _unique_id{std::move(unique_id)}, _kind{kind}, _formatter{std::move(zone)}, _context{std::move(context)} {
        _context.validate();
        _value = _formatter.format(_context.clock->now(), _kind);
    }

    TimeDatePublisher::~TimeDatePublisher() {
        try {
            deactivate();
        } catch (const std::exception &e) {
            _context.diagnostics->error(LOGGER, "Failed to deactivate {} on release: {}", _unique_id, e.what());
        }
    }

    void TimeDatePublisher::activate() {
        if (!is_started()) {
            start_component(*this);
            return;
        }
        bool idle;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            idle = _state == PublisherState::Idle;
        }
        // Started but left Idle by an arm failure
        if (idle) { start(); }
    }

    void TimeDatePublisher::deactivate() { stop_component(*this); }

    std::string TimeDatePublisher::value() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _value;
    }

    PublisherState TimeDatePublisher::state() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state;
    }

    std::optional<instant_t> TimeDatePublisher::next_update() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _next_update;
    }

    void TimeDatePublisher::start() {
        const auto now = _context.clock->now();
        auto value = _formatter.format(now, _kind);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _value = value;
        }
        _publish(value);

        std::lock_guard<std::mutex> arming(_arm_mutex);
        _arm(now);
    }

    void TimeDatePublisher::stop() {
        TimerHandle handle;
        {
            std::lock_guard<std::mutex> arming(_arm_mutex);
            std::lock_guard<std::mutex> lock(_mutex);
            _state = PublisherState::Idle;
            _next_update.reset();
            handle = std::exchange(_timer, TimerHandle{});
        }
        // Cancel before anything is released, this blocks until a fire in progress on another thread has returned
        _context.timers->cancel(handle);
        _context.sink->retract(_unique_id);
    }

    void TimeDatePublisher::_publish(const std::string &value) {
        _context.sink->publish(
            PublishedValue{_unique_id, _kind, std::string(name()), std::string(icon()), value});
    }

    void TimeDatePublisher::_arm(instant_t now) {
        TimerHandle timer;
        instant_t next;
        try {
            next = next_update_time(now, _formatter.zone(), _kind);
            if (_context.diagnostics->enabled(LogLevel::Debug)) {
                _context.diagnostics->debug(LOGGER, "{} + {}us -> {} ({})", to_iso_string(now), (next - now).count(),
                                            to_iso_string(next), option_key(_kind));
            }
            timer = _context.timers->schedule_at(next, [this](instant_t when) { _on_timer(when); });
        } catch (const std::exception &e) {
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _timer = TimerHandle{};
                _next_update.reset();
                _state = PublisherState::Idle;
            }
            _context.diagnostics->error(LOGGER, "Unable to schedule the next update of {}: {}", _unique_id,
                                        e.what());
            return;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        _timer = timer;
        _next_update = next;
        _state = PublisherState::Armed;
    }

    void TimeDatePublisher::_on_timer(instant_t when) {
        {
            // Waits for an arm in progress on another thread to record its timer
            std::lock_guard<std::mutex> arming(_arm_mutex);
            std::lock_guard<std::mutex> lock(_mutex);
            // A stale fire, e.g. delivered after a restart armed a new timer
            if (_state != PublisherState::Armed) { return; }
            _state = PublisherState::Firing;
            _next_update.reset();
        }

        auto value = _formatter.format(when, _kind);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_state != PublisherState::Firing) { return; }
            _value = value;
        }
        _publish(value);

        std::lock_guard<std::mutex> arming(_arm_mutex);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            // Deactivated while publishing
            if (_state != PublisherState::Firing) { return; }
        }
        // Never align from before the fire instant, a clock reading slightly behind would fire the same boundary twice
        _arm(std::max(_context.clock->now(), when));
    }
} // namespace timedate
