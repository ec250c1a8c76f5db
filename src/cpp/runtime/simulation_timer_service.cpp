#include <timedate/runtime/simulation_timer_service.h>
#include <timedate/util/errors.h>

#include <algorithm>

namespace timedate {
    SimulationTimerService::SimulationTimerService(instant_t start_time) : _now{start_time} {}

    instant_t SimulationTimerService::now() const { return _now; }

    TimerHandle SimulationTimerService::schedule_at(instant_t when, callback_t callback) {
        if (when < _now) {
            throw_error<std::invalid_argument>("Cannot set alarm in the past: {} < {}", to_iso_string(when),
                                               to_iso_string(_now));
        }
        if (!callback) { throw_error<std::invalid_argument>("Cannot set alarm without a callback"); }

        TimerHandle handle{++_next_id};
        _alarms.emplace(when, handle.id);
        _callbacks.emplace(handle.id, Alarm{when, std::move(callback)});
        return handle;
    }

    bool SimulationTimerService::cancel(TimerHandle handle) {
        if (!handle) { return false; }
        auto it = _callbacks.find(handle.id);
        if (it == _callbacks.end()) { return false; }
        _alarms.erase({it->second.when, handle.id});
        _callbacks.erase(it);
        return true;
    }

    size_t SimulationTimerService::pending() const { return _callbacks.size(); }

    std::optional<instant_t> SimulationTimerService::next_scheduled_time() const {
        if (_alarms.empty()) { return std::nullopt; }
        return _alarms.begin()->first;
    }

    size_t SimulationTimerService::advance_to(instant_t until) {
        if (until < _now) {
            throw_error<std::invalid_argument>("Cannot move the clock backwards: {} < {}", to_iso_string(until),
                                               to_iso_string(_now));
        }

        size_t fired{0};
        while (!_alarms.empty() && _alarms.begin()->first <= until) {
            auto [when, id] = *_alarms.begin();
            _alarms.erase(_alarms.begin());

            auto cb = _callbacks.find(id);
            if (cb == _callbacks.end()) { continue; }
            auto callback = std::move(cb->second.callback);
            _callbacks.erase(cb);

            _now = std::max(_now, when);
            callback(when);
            ++fired;
        }
        _now = until;
        return fired;
    }

    size_t SimulationTimerService::advance_by(time_delta_t delta) { return advance_to(_now + delta); }

    bool SimulationTimerService::advance_to_next_scheduled_time() {
        auto next = next_scheduled_time();
        if (!next) { return false; }
        advance_to(*next);
        return true;
    }
} // namespace timedate
