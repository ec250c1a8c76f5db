#ifndef TIMEDATE_LIFECYCLE_H
#define TIMEDATE_LIFECYCLE_H

#include <timedate/timedate_export.h>

namespace timedate {
    struct ComponentLifeCycle;

    void TIMEDATE_EXPORT start_component(ComponentLifeCycle &component);

    void TIMEDATE_EXPORT stop_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * This will start the component in the constructor and stop in the destructor.
     * The destructor never throws, a failure during stop is reported on stderr.
     */
    struct TIMEDATE_EXPORT StartStopContext {
        explicit StartStopContext(ComponentLifeCycle &component);

        ~StartStopContext() noexcept;

        StartStopContext(const StartStopContext &) = delete;

        StartStopContext &operator=(const StartStopContext &) = delete;

    private:
        ComponentLifeCycle &_component;
    };

    /**
     * The life-cycle of a publishing component:
     *
     * * The component is constructed, it may compute initial state but must not schedule anything.
     *
     * * The start method is called when the component becomes active, this is where timers are armed and values
     *   are first published.
     *
     * * The stop method is called when the component is deactivated. It must cancel everything start (or any
     *   later callback) scheduled before returning, and must leave nothing visible to the host.
     *
     * NOTE: start and stop may be called many times over the life-time of the component. The component must be able
     *       to start again cleanly after stop. Calling start on a started component, or stop on a stopped one, is
     *       a no-op handled by start_component / stop_component.
     */
    struct TIMEDATE_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        /**
         * The component is started (true) or stopped (false).
         * By default, this is stopped.
         */
        [[nodiscard]] bool is_started() const;

        /**
         * The component is in the process of starting.
         */
        [[nodiscard]] bool is_starting() const;

        /**
         * The process is in the process of stopping.
         */
        [[nodiscard]] bool is_stopping() const;

    protected:
        virtual void start() = 0;

        virtual void stop() = 0;

    private:
        bool _started{false};
        bool _transitioning{false};

        friend TransitionGuard;

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);
    };
}

#endif //TIMEDATE_LIFECYCLE_H
