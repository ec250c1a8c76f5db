#ifndef TIMEDATE_TIMER_SERVICE_H
#define TIMEDATE_TIMER_SERVICE_H

#include <timedate/timedate_export.h>
#include <timedate/util/date_time.h>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace timedate {
    /**
     * The source of "now".
     */
    struct TIMEDATE_EXPORT Clock {
        using ptr = std::shared_ptr<Clock>;

        virtual ~Clock() = default;

        [[nodiscard]] virtual instant_t now() const = 0;
    };

    /**
     * Identifies one armed timer. A default constructed handle refers to nothing.
     */
    struct TimerHandle {
        uint64_t id{0};

        [[nodiscard]] explicit operator bool() const noexcept { return id != 0; }

        auto operator<=>(const TimerHandle &) const = default;
    };

    /**
     * One-shot timers at absolute instants.
     *
     * The callback receives the instant it was scheduled for. A timer fires at most once, is forgotten once it has
     * fired, and never fires after cancel has returned.
     */
    struct TIMEDATE_EXPORT TimerService {
        using ptr = std::shared_ptr<TimerService>;
        using callback_t = std::function<void(instant_t)>;

        virtual ~TimerService() = default;

        /**
         * Arms a timer, throws if the timer cannot be armed (e.g. the service has been shut down).
         */
        [[nodiscard]] virtual TimerHandle schedule_at(instant_t when, callback_t callback) = 0;

        /**
         * Cancels an armed timer. Returns false when there was nothing to cancel (already fired, cancelled, or an
         * empty handle), which is not an error.
         */
        virtual bool cancel(TimerHandle handle) = 0;

        [[nodiscard]] virtual size_t pending() const = 0;
    };
} // namespace timedate

#endif // TIMEDATE_TIMER_SERVICE_H
