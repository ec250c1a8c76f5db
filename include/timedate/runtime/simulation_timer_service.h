#ifndef TIMEDATE_SIMULATION_TIMER_SERVICE_H
#define TIMEDATE_SIMULATION_TIMER_SERVICE_H

#include <timedate/runtime/timer_service.h>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <set>
#include <utility>

namespace timedate {
    /**
     * A clock and timer service driven by hand. Time only moves when advanced, timers fire synchronously on the
     * advancing thread in time order (ties in the order they were scheduled), and now() reads the fire time while
     * each callback runs. Used for replay and in tests.
     */
    struct TIMEDATE_EXPORT SimulationTimerService : Clock, TimerService {
        explicit SimulationTimerService(instant_t start_time);

        [[nodiscard]] instant_t now() const override;

        [[nodiscard]] TimerHandle schedule_at(instant_t when, callback_t callback) override;

        bool cancel(TimerHandle handle) override;

        [[nodiscard]] size_t pending() const override;

        [[nodiscard]] std::optional<instant_t> next_scheduled_time() const;

        /**
         * Fires every timer due at or before until (including timers armed by those callbacks) and leaves the
         * clock at until. Returns the number of timers fired.
         */
        size_t advance_to(instant_t until);

        size_t advance_by(time_delta_t delta);

        /**
         * Moves the clock to the earliest armed timer and fires everything due then. Returns false if nothing is
         * armed.
         */
        bool advance_to_next_scheduled_time();

    private:
        struct Alarm {
            instant_t when;
            callback_t callback;
        };

        instant_t _now;
        uint64_t _next_id{0};
        std::set<std::pair<instant_t, uint64_t> > _alarms;
        ankerl::unordered_dense::map<uint64_t, Alarm> _callbacks;
    };
} // namespace timedate

#endif // TIMEDATE_SIMULATION_TIMER_SERVICE_H
