#ifndef TIMEDATE_PUBLISHER_H
#define TIMEDATE_PUBLISHER_H

#include <timedate/formatter.h>
#include <timedate/representation.h>
#include <timedate/runtime/runtime_context.h>
#include <timedate/util/lifecycle.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace timedate {
    enum class PublisherState : uint8_t {
        Idle,   // No timer armed
        Armed,  // Waiting for the next update instant
        Firing, // Computing and publishing the value for the instant that just fired
    };

    TIMEDATE_EXPORT std::string_view to_string(PublisherState state);

    /**
     * Keeps one representation of the current time published, re-computing it at each representation boundary
     * (next minute, next local midnight, next beat).
     *
     * The value is computed on construction so it is never empty. activate() publishes it and arms the first timer,
     * every fire re-computes the value for the fire instant, publishes it and then arms the next timer. There is
     * never more than one timer outstanding and a new one is only armed once the previous fire has published.
     *
     * deactivate() cancels the outstanding timer (waiting for an in-flight fire to complete) and then retracts the
     * value from the sink. It is idempotent and is also performed on destruction.
     *
     * If a timer cannot be armed the failure is logged and the publisher stays Idle with its last value, a later
     * activate() tries again. Nothing is retried automatically.
     */
    struct TIMEDATE_EXPORT TimeDatePublisher : ComponentLifeCycle {
        using ptr = std::unique_ptr<TimeDatePublisher>;

        TimeDatePublisher(std::string unique_id, RepresentationKind kind, TimeZone::ptr zone, RuntimeContext context);

        ~TimeDatePublisher() override;

        TimeDatePublisher(const TimeDatePublisher &) = delete;

        TimeDatePublisher &operator=(const TimeDatePublisher &) = delete;

        void activate();

        void deactivate();

        [[nodiscard]] const std::string &unique_id() const { return _unique_id; }

        [[nodiscard]] RepresentationKind kind() const { return _kind; }

        [[nodiscard]] std::string_view name() const { return label(_kind); }

        [[nodiscard]] std::string_view icon() const { return timedate::icon(_kind); }

        [[nodiscard]] std::string value() const;

        [[nodiscard]] PublisherState state() const;

        [[nodiscard]] std::optional<instant_t> next_update() const;

    protected:
        void start() override;

        void stop() override;

    private:
        void _publish(const std::string &value);

        // Requires _arm_mutex to be held, takes _mutex itself only to record the outcome
        void _arm(instant_t now);

        void _on_timer(instant_t when);

        std::string _unique_id;
        RepresentationKind _kind;
        Formatter _formatter;
        RuntimeContext _context;

        // Serialises arming against stop() and fires, never held while reading the observable state below
        std::mutex _arm_mutex;
        // Guards the observable state, never held while calling into the sink, the timers or diagnostics
        mutable std::mutex _mutex;
        PublisherState _state{PublisherState::Idle};
        std::string _value;
        // While Firing this still holds the handle of the fire in progress, so a concurrent deactivate waits for it
        TimerHandle _timer;
        std::optional<instant_t> _next_update;
    };
} // namespace timedate

#endif // TIMEDATE_PUBLISHER_H
