/*
 * The entry point into the python _timedate module exposing the C++ publishers to python.
 *
 * Instants and durations are exchanged as integer microseconds (see py_time.h). Calls that may wait on the timer
 * worker release the GIL, the worker takes it back for every call into Python. Releasing a platform or a real time
 * service does the same.
 */
#include "py_time.h"

void export_types(nb::module_ &);

void export_runtime(nb::module_ &);

NB_MODULE(_timedate, m) {
    m.doc() = "Time and date representations published on their own update boundaries";

    export_types(m);
    export_runtime(m);
}
