#include "py_time.h"

#include <timedate/platform.h>
#include <timedate/publisher.h>
#include <timedate/runtime/real_time_timer_service.h>
#include <timedate/runtime/runtime_context.h>
#include <timedate/runtime/simulation_timer_service.h>
#include <timedate/util/diagnostics.h>
#include <timedate/value_sink.h>

#include <nanobind/operators.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <fmt/format.h>

#include <memory>

namespace {
    using namespace timedate;

    /**
     * Hands published values to Python callables. Publishers call in from the timer worker thread, so every call
     * (and the final release of the callables) takes the GIL.
     */
    struct CallbackSink : ValueSink {
        CallbackSink(nb::object on_publish, nb::object on_retract)
            : _on_publish{std::move(on_publish)}, _on_retract{std::move(on_retract)} {}

        ~CallbackSink() override {
            nb::gil_scoped_acquire gil;
            _on_publish = nb::object();
            _on_retract = nb::object();
        }

        void publish(const PublishedValue &value) override {
            nb::gil_scoped_acquire gil;
            // The value only lives for the duration of the call, Python gets its own copy
            _on_publish(nb::cast(value, nb::rv_policy::copy));
        }

        void retract(std::string_view unique_id) override {
            nb::gil_scoped_acquire gil;
            _on_retract(std::string(unique_id));
        }

    private:
        nb::object _on_publish;
        nb::object _on_retract;
    };

    /**
     * Wraps a Python callable as a timer callback, the callable is released under the GIL whichever thread drops
     * the last copy.
     */
    TimerService::callback_t py_timer_callback(nb::object fn) {
        std::shared_ptr<nb::object> held(new nb::object(std::move(fn)), [](nb::object *o) {
            nb::gil_scoped_acquire gil;
            delete o;
        });
        return [held](instant_t when) {
            nb::gil_scoped_acquire gil;
            (*held)(timedate::python::from_instant(when));
        };
    }

    // Runs fn with the GIL released if this thread holds it
    template<typename Fn>
    void without_gil(Fn &&fn) {
        if (PyGILState_Check()) {
            nb::gil_scoped_release release;
            fn();
        } else {
            fn();
        }
    }

    /*
     * nanobind destroys bound objects with the GIL held, while a fire on the worker may be waiting for the GIL to
     * publish. The bound types run the part of teardown that waits on the worker with the GIL released, leaving the
     * base destructors nothing to wait for.
     */

    struct PyTimeDatePlatform : TimeDatePlatform {
        using TimeDatePlatform::TimeDatePlatform;

        ~PyTimeDatePlatform() {
            try {
                without_gil([this] { unload(); });
            } catch (const std::exception &e) {
                context().diagnostics->error("timedate.platform", "Failed to unload {}: {}", entry_id(), e.what());
            }
        }
    };

    struct PyRealTimeTimerService : RealTimeTimerService {
        using RealTimeTimerService::RealTimeTimerService;

        ~PyRealTimeTimerService() override {
            without_gil([this] { shutdown(); });
        }
    };

    template<typename Service>
    RuntimeContext make_context(std::shared_ptr<Service> service, ValueSink::ptr sink, Diagnostics::ptr diagnostics) {
        RuntimeContext context{service, service, std::move(sink), std::move(diagnostics)};
        context.validate();
        return context;
    }
} // namespace

void export_runtime(nb::module_ &m) {
    using namespace timedate;
    using timedate::python::from_instant;
    using timedate::python::to_instant;

    nb::exception<SetupError>(m, "SetupError");
    nb::exception<ConfigError>(m, "ConfigError", PyExc_ValueError);

    nb::enum_<LogLevel>(m, "LogLevel")
            .value("Debug", LogLevel::Debug)
            .value("Info", LogLevel::Info)
            .value("Warning", LogLevel::Warning)
            .value("Error", LogLevel::Error);

    nb::class_<Diagnostics>(m, "Diagnostics")
            .def("enabled", &Diagnostics::enabled, "level"_a)
            .def("log", &Diagnostics::log, "level"_a, "logger"_a, "message"_a);
    nb::class_<StderrDiagnostics, Diagnostics>(m, "StderrDiagnostics")
            .def(nb::init<LogLevel>(), "min_level"_a = LogLevel::Info)
            .def("set_min_level", &StderrDiagnostics::set_min_level, "level"_a);
    nb::class_<NullDiagnostics, Diagnostics>(m, "NullDiagnostics").def(nb::init<>());

    nb::class_<PublishedValue>(m, "PublishedValue")
            .def_ro("unique_id", &PublishedValue::unique_id)
            .def_ro("kind", &PublishedValue::kind)
            .def_ro("name", &PublishedValue::name)
            .def_ro("icon", &PublishedValue::icon)
            .def_ro("value", &PublishedValue::value)
            .def(nb::self == nb::self)
            .def("__repr__", [](const PublishedValue &self) {
                return fmt::format("PublishedValue({}, {})", self.unique_id, self.value);
            });

    nb::class_<ValueSink>(m, "ValueSink")
            .def("publish", &ValueSink::publish, "value"_a)
            .def("retract", &ValueSink::retract, "unique_id"_a);

    nb::class_<ValueStore, ValueSink>(m, "ValueStore")
            .def(nb::init<>())
            .def("get", &ValueStore::get, "unique_id"_a)
            .def("__contains__", &ValueStore::contains, "unique_id"_a)
            .def("__len__", &ValueStore::size)
            .def("values", &ValueStore::values)
            .def_prop_ro("publish_count", &ValueStore::publish_count);

    nb::class_<CallbackSink, ValueSink>(m, "CallbackSink")
            .def(nb::init<nb::object, nb::object>(), "on_publish"_a, "on_retract"_a);

    nb::class_<SimulationTimerService>(m, "SimulationTimerService")
            .def("__init__",
                 [](SimulationTimerService *self, int64_t start_time) {
                     new(self) SimulationTimerService(to_instant(start_time));
                 },
                 "start_time"_a)
            .def_prop_ro("now", [](const SimulationTimerService &self) { return from_instant(self.now()); })
            .def_prop_ro("pending", &SimulationTimerService::pending)
            .def_prop_ro("next_scheduled_time",
                         [](const SimulationTimerService &self) -> std::optional<int64_t> {
                             if (auto next = self.next_scheduled_time()) { return from_instant(*next); }
                             return std::nullopt;
                         })
            .def("schedule_at",
                 [](SimulationTimerService &self, int64_t when, nb::object fn) {
                     return self.schedule_at(to_instant(when), py_timer_callback(std::move(fn))).id;
                 },
                 "when"_a, "fn"_a)
            .def("cancel", [](SimulationTimerService &self, uint64_t id) { return self.cancel(TimerHandle{id}); },
                 "handle"_a)
            .def("advance_to", [](SimulationTimerService &self, int64_t until) { return self.advance_to(to_instant(until)); },
                 "until"_a)
            .def("advance_by",
                 [](SimulationTimerService &self, int64_t delta) { return self.advance_by(time_delta_t{delta}); },
                 "delta"_a)
            .def("advance_to_next_scheduled_time", &SimulationTimerService::advance_to_next_scheduled_time);

    // Callbacks run on the worker and need the GIL, anything that can wait on the worker releases it
    nb::class_<PyRealTimeTimerService>(m, "RealTimeTimerService")
            .def(nb::init<Diagnostics::ptr>(), "diagnostics"_a.none() = nb::none())
            .def_prop_ro("now", [](const PyRealTimeTimerService &self) { return from_instant(self.now()); })
            .def_prop_ro("pending", &RealTimeTimerService::pending)
            .def("schedule_at",
                 [](PyRealTimeTimerService &self, int64_t when, nb::object fn) {
                     return self.schedule_at(to_instant(when), py_timer_callback(std::move(fn))).id;
                 },
                 "when"_a, "fn"_a)
            .def("cancel", [](PyRealTimeTimerService &self, uint64_t id) { return self.cancel(TimerHandle{id}); },
                 "handle"_a, nb::call_guard<nb::gil_scoped_release>())
            .def("shutdown", &RealTimeTimerService::shutdown, nb::call_guard<nb::gil_scoped_release>())
            .def_prop_ro("is_shutdown", &RealTimeTimerService::is_shutdown)
            .def("__enter__", [](PyRealTimeTimerService &self) -> PyRealTimeTimerService & { return self; },
                 nb::rv_policy::reference)
            .def("__exit__",
                 [](PyRealTimeTimerService &self, nb::handle, nb::handle, nb::handle) {
                     nb::gil_scoped_release release;
                     self.shutdown();
                 },
                 "exc_type"_a.none(), "exc_value"_a.none(), "traceback"_a.none());

    nb::class_<RuntimeContext>(m, "RuntimeContext")
            .def_static("simulation", &make_context<SimulationTimerService>, "timers"_a, "sink"_a,
                        "diagnostics"_a.none() = nb::none())
            .def_static("real_time", &make_context<PyRealTimeTimerService>, "timers"_a, "sink"_a,
                        "diagnostics"_a.none() = nb::none());

    nb::enum_<PublisherState>(m, "PublisherState")
            .value("Idle", PublisherState::Idle)
            .value("Armed", PublisherState::Armed)
            .value("Firing", PublisherState::Firing);

    nb::class_<TimeDatePublisher>(m, "TimeDatePublisher")
            .def_prop_ro("unique_id", &TimeDatePublisher::unique_id)
            .def_prop_ro("kind", &TimeDatePublisher::kind)
            .def_prop_ro("name", &TimeDatePublisher::name)
            .def_prop_ro("icon", &TimeDatePublisher::icon)
            .def_prop_ro("value", &TimeDatePublisher::value)
            .def_prop_ro("state", &TimeDatePublisher::state)
            .def_prop_ro("is_active", [](const TimeDatePublisher &self) { return self.is_started(); })
            .def_prop_ro("next_update",
                         [](const TimeDatePublisher &self) -> std::optional<int64_t> {
                             if (auto next = self.next_update()) { return from_instant(*next); }
                             return std::nullopt;
                         })
            .def("activate", &TimeDatePublisher::activate, nb::call_guard<nb::gil_scoped_release>())
            .def("deactivate", &TimeDatePublisher::deactivate, nb::call_guard<nb::gil_scoped_release>());

    nb::class_<PyTimeDatePlatform>(m, "TimeDatePlatform")
            .def(nb::init<RuntimeContext>(), "context"_a)
            .def("setup_entry", nb::overload_cast<const TimeDateConfig &>(&TimeDatePlatform::setup_entry),
                 "config"_a, nb::call_guard<nb::gil_scoped_release>())
            .def("setup_entry",
                 [](PyTimeDatePlatform &self, const TimeDateConfig &config, std::shared_ptr<TimeZone> zone) {
                     nb::gil_scoped_release release;
                     self.setup_entry(config, std::move(zone));
                 },
                 "config"_a, "zone"_a)
            .def("unload", &TimeDatePlatform::unload, nb::call_guard<nb::gil_scoped_release>())
            .def("reload", &TimeDatePlatform::reload, "config"_a, nb::call_guard<nb::gil_scoped_release>())
            .def_prop_ro("is_loaded", &TimeDatePlatform::is_loaded)
            .def_prop_ro("entry_id", &TimeDatePlatform::entry_id)
            .def_prop_ro("kinds", &TimeDatePlatform::kinds)
            .def_prop_ro("unique_ids", &TimeDatePlatform::unique_ids)
            .def("publisher", &TimeDatePlatform::publisher, "kind"_a, nb::rv_policy::reference_internal)
            .def("__len__", &TimeDatePlatform::size);
}
