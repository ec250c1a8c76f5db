#ifndef TIMEDATE_PY_TIME_H
#define TIMEDATE_PY_TIME_H

/*
 * Instants cross the Python boundary as integer microseconds since the Unix epoch (UTC) and durations as integer
 * microseconds. This sidesteps datetime's local-time interpretation of naive values entirely; the Python side
 * converts with int(dt.timestamp() * 1_000_000).
 */

#include <nanobind/nanobind.h>

#include <timedate/util/date_time.h>

#include <cstdint>

namespace nb = nanobind;
using namespace nb::literals;

namespace timedate::python {
    inline instant_t to_instant(int64_t us) { return instant_t{time_delta_t{us}}; }

    inline int64_t from_instant(instant_t t) { return t.time_since_epoch().count(); }

    inline local_time_t to_local(int64_t us) { return local_time_t{time_delta_t{us}}; }

    inline int64_t from_local(local_time_t t) { return t.time_since_epoch().count(); }
} // namespace timedate::python

#endif // TIMEDATE_PY_TIME_H
