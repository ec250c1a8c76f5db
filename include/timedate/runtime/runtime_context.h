#ifndef TIMEDATE_RUNTIME_CONTEXT_H
#define TIMEDATE_RUNTIME_CONTEXT_H

#include <timedate/runtime/timer_service.h>
#include <timedate/util/diagnostics.h>
#include <timedate/value_sink.h>

namespace timedate {
    /**
     * The collaborators supplied by the host. Every component receives these at construction, nothing is looked up
     * globally.
     */
    struct TIMEDATE_EXPORT RuntimeContext {
        Clock::ptr clock;
        TimerService::ptr timers;
        ValueSink::ptr sink;
        Diagnostics::ptr diagnostics;

        /**
         * Throws std::invalid_argument naming the first missing collaborator. A missing diagnostics sink is replaced
         * with NullDiagnostics rather than rejected.
         */
        void validate();
    };
} // namespace timedate

#endif // TIMEDATE_RUNTIME_CONTEXT_H
