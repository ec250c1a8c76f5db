#ifndef TIMEDATE_REAL_TIME_TIMER_SERVICE_H
#define TIMEDATE_REAL_TIME_TIMER_SERVICE_H

#include <timedate/runtime/timer_service.h>
#include <timedate/util/diagnostics.h>

#include <ankerl/unordered_dense.h>

#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace timedate {
    /**
     * Wall clock timers served by a single worker thread.
     *
     * Callbacks run one at a time on the worker. cancel() from any other thread blocks while a callback for that
     * handle is running, so once cancel returns the callback is neither pending nor executing and the owner may be
     * released. Cancelling from within the callback itself does not block.
     *
     * An exception escaping a callback is logged and the worker carries on.
     */
    struct TIMEDATE_EXPORT RealTimeTimerService : Clock, TimerService {
        using ptr = std::shared_ptr<RealTimeTimerService>;

        explicit RealTimeTimerService(Diagnostics::ptr diagnostics = nullptr);

        ~RealTimeTimerService() override;

        RealTimeTimerService(const RealTimeTimerService &) = delete;

        RealTimeTimerService &operator=(const RealTimeTimerService &) = delete;

        [[nodiscard]] instant_t now() const override;

        [[nodiscard]] TimerHandle schedule_at(instant_t when, callback_t callback) override;

        bool cancel(TimerHandle handle) override;

        [[nodiscard]] size_t pending() const override;

        /**
         * Drops every armed timer and joins the worker. Scheduling after shutdown throws. Must not be called from a
         * timer callback.
         */
        void shutdown();

        [[nodiscard]] bool is_shutdown() const;

    private:
        void run();

        struct Alarm {
            instant_t when;
            callback_t callback;
        };

        Diagnostics::ptr _diagnostics;

        mutable std::mutex _mutex;
        std::condition_variable _condition;
        bool _stopping{false};
        uint64_t _next_id{0};
        uint64_t _running{0};
        std::set<std::pair<instant_t, uint64_t> > _alarms;
        ankerl::unordered_dense::map<uint64_t, Alarm> _callbacks;

        // Declared last so everything above exists before the worker starts
        std::thread _worker;
    };
} // namespace timedate

#endif // TIMEDATE_REAL_TIME_TIMER_SERVICE_H
