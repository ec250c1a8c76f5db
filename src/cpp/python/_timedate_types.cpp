#include "py_time.h"

#include <timedate/config.h>
#include <timedate/formatter.h>
#include <timedate/next_interval.h>
#include <timedate/representation.h>
#include <timedate/time_zone.h>

#include <nanobind/operators.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <memory>

void export_types(nb::module_ &m) {
    using namespace timedate;
    using timedate::python::from_instant;
    using timedate::python::from_local;
    using timedate::python::to_instant;
    using timedate::python::to_local;

    nb::enum_<RepresentationKind>(m, "RepresentationKind")
            .value("Time", RepresentationKind::Time)
            .value("Date", RepresentationKind::Date)
            .value("DateTime", RepresentationKind::DateTime)
            .value("DateTimeUTC", RepresentationKind::DateTimeUTC)
            .value("DateTimeISO", RepresentationKind::DateTimeISO)
            .value("TimeDate", RepresentationKind::TimeDate)
            .value("Beat", RepresentationKind::Beat)
            .value("TimeUTC", RepresentationKind::TimeUTC);

    m.attr("ALL_REPRESENTATION_KINDS") =
            std::vector<RepresentationKind>(ALL_REPRESENTATION_KINDS.begin(), ALL_REPRESENTATION_KINDS.end());
    m.def("option_key", &option_key, "kind"_a);
    m.def("kind_from_option_key", &kind_from_option_key, "key"_a);
    m.def("label", &label, "kind"_a);
    m.def("icon", &icon, "kind"_a);
    m.def("unique_id", &unique_id, "base_id"_a, "kind"_a);

    // Zones are handed out as mutable shared pointers, the core only ever holds them as const
    nb::class_<TimeZone>(m, "TimeZone")
            .def_prop_ro("name", &TimeZone::name)
            .def("utc_offset", [](const TimeZone &self, int64_t t) { return self.utc_offset(to_instant(t)).count(); },
                 "t"_a)
            .def("to_local", [](const TimeZone &self, int64_t t) { return from_local(self.to_local(to_instant(t))); },
                 "t"_a)
            .def("to_instant",
                 [](const TimeZone &self, int64_t local) { return from_instant(self.to_instant(to_local(local))); },
                 "local"_a);

    nb::class_<FixedOffsetTimeZone, TimeZone>(m, "FixedOffsetTimeZone")
            .def("__init__",
                 [](FixedOffsetTimeZone *self, int64_t offset_seconds, std::string name) {
                     new(self) FixedOffsetTimeZone(std::chrono::seconds(offset_seconds), std::move(name));
                 },
                 "offset_seconds"_a, "name"_a = "");

    nb::class_<SystemTimeZone, TimeZone>(m, "SystemTimeZone").def(nb::init<>());

    nb::class_<NamedTimeZone, TimeZone>(m, "NamedTimeZone").def(nb::init<std::string>(), "name"_a);

    nb::class_<TransitionTimeZone, TimeZone>(m, "TransitionTimeZone")
            .def("__init__",
                 [](TransitionTimeZone *self, std::string name, int64_t initial_offset_seconds,
                    const std::vector<std::pair<int64_t, int64_t> > &transitions) {
                     std::vector<TransitionTimeZone::Transition> converted;
                     converted.reserve(transitions.size());
                     for (const auto &[at, offset] : transitions) {
                         converted.emplace_back(to_instant(at), std::chrono::seconds(offset));
                     }
                     new(self) TransitionTimeZone(std::move(name), std::chrono::seconds(initial_offset_seconds),
                                                  std::move(converted));
                 },
                 "name"_a, "initial_offset_seconds"_a, "transitions"_a);

    m.def("parse_time_zone",
          [](std::string_view name) { return std::const_pointer_cast<TimeZone>(parse_time_zone(name)); }, "name"_a);

    m.def("swatch_beat", [](int64_t t) { return swatch_beat(to_instant(t)); }, "t"_a);
    m.def("format_value",
          [](int64_t t, const TimeZone &zone, RepresentationKind kind) { return format_value(to_instant(t), zone, kind); },
          "t"_a, "zone"_a, "kind"_a);
    m.def("next_update_time",
          [](int64_t now, const TimeZone &zone, RepresentationKind kind) {
              return from_instant(next_update_time(to_instant(now), zone, kind));
          },
          "now"_a, "zone"_a, "kind"_a);
    m.def("update_cadence", [](RepresentationKind kind) -> std::optional<int64_t> {
        if (auto cadence = update_cadence(kind)) { return cadence->count(); }
        return std::nullopt;
    }, "kind"_a);

    nb::class_<RepresentationOptions>(m, "RepresentationOptions")
            .def(nb::init<>())
            .def("__init__",
                 [](RepresentationOptions *self, const std::vector<RepresentationKind> &kinds) {
                     new(self) RepresentationOptions();
                     for (auto kind : kinds) { self->enable(kind); }
                 },
                 "kinds"_a)
            .def("enable", &RepresentationOptions::enable, "kind"_a, "enabled"_a = true)
            .def("enabled", &RepresentationOptions::enabled, "kind"_a)
            .def_prop_ro("enabled_kinds", &RepresentationOptions::enabled_kinds)
            .def_prop_ro("disabled_kinds", &RepresentationOptions::disabled_kinds)
            .def("to_flags", &RepresentationOptions::to_flags)
            .def(nb::self == nb::self);

    m.def("options_from_display_options", &options_from_display_options,
          "display_options"_a = DEFAULT_DISPLAY_OPTIONS);
    m.def("options_from_flags", &options_from_flags, "flags"_a);

    nb::class_<TimeDateConfig>(m, "TimeDateConfig")
            .def(nb::init<>())
            .def("__init__",
                 [](TimeDateConfig *self, std::string entry_id, std::optional<std::string> time_zone,
                    RepresentationOptions options) {
                     new(self) TimeDateConfig{std::move(entry_id), std::move(time_zone), options};
                 },
                 "entry_id"_a, "time_zone"_a, "options"_a)
            .def_rw("entry_id", &TimeDateConfig::entry_id)
            .def_rw("time_zone", &TimeDateConfig::time_zone)
            .def_rw("options", &TimeDateConfig::options);
}
