#include <timedate/runtime/runtime_context.h>
#include <timedate/util/errors.h>

namespace timedate {
    void RuntimeContext::validate() {
        if (!clock) { throw_error<std::invalid_argument>("RuntimeContext requires a clock"); }
        if (!timers) { throw_error<std::invalid_argument>("RuntimeContext requires a timer service"); }
        if (!sink) { throw_error<std::invalid_argument>("RuntimeContext requires a value sink"); }
        if (!diagnostics) { diagnostics = std::make_shared<NullDiagnostics>(); }
    }
} // namespace timedate
