#include <timedate/runtime/real_time_timer_service.h>
#include <timedate/util/errors.h>

namespace timedate {
    namespace {
        constexpr std::string_view LOGGER{"timedate.timer"};
    }

    RealTimeTimerService::RealTimeTimerService(Diagnostics::ptr diagnostics)
        : _diagnostics{diagnostics ? std::move(diagnostics) : std::make_shared<NullDiagnostics>()},
          _worker{[this] { run(); }} {}

    RealTimeTimerService::~RealTimeTimerService() { shutdown(); }

    instant_t RealTimeTimerService::now() const { return now_instant(); }

    TimerHandle RealTimeTimerService::schedule_at(instant_t when, callback_t callback) {
        if (!callback) { throw_error<std::invalid_argument>("Cannot set alarm without a callback"); }

        std::unique_lock<std::mutex> lock(_mutex);
        if (_stopping) { throw_error("Cannot set alarm, the timer service has been shut down"); }

        TimerHandle handle{++_next_id};
        _alarms.emplace(when, handle.id);
        _callbacks.emplace(handle.id, Alarm{when, std::move(callback)});
        // The worker may be sleeping towards a later alarm
        _condition.notify_all();
        return handle;
    }

    bool RealTimeTimerService::cancel(TimerHandle handle) {
        if (!handle) { return false; }

        // Released after the lock, the callback may own state whose destructor cancels other timers
        callback_t dropped;
        std::unique_lock<std::mutex> lock(_mutex);
        bool removed = false;
        auto it = _callbacks.find(handle.id);
        if (it != _callbacks.end()) {
            dropped = std::move(it->second.callback);
            _alarms.erase({it->second.when, handle.id});
            _callbacks.erase(it);
            removed = true;
            _condition.notify_all();
        }

        if (_running == handle.id && std::this_thread::get_id() != _worker.get_id()) {
            _condition.wait(lock, [this, &handle] { return _running != handle.id; });
        }
        return removed;
    }

    size_t RealTimeTimerService::pending() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _callbacks.size();
    }

    void RealTimeTimerService::shutdown() {
        ankerl::unordered_dense::map<uint64_t, Alarm> dropped;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _stopping = true;
            _alarms.clear();
            std::swap(dropped, _callbacks);
        }
        dropped.clear();
        _condition.notify_all();
        if (_worker.joinable() && std::this_thread::get_id() != _worker.get_id()) { _worker.join(); }
    }

    bool RealTimeTimerService::is_shutdown() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _stopping;
    }

    void RealTimeTimerService::run() {
        std::unique_lock<std::mutex> lock(_mutex);
        while (!_stopping) {
            if (_alarms.empty()) {
                _condition.wait(lock);
                continue;
            }

            const auto [when, id] = *_alarms.begin();
            if (now_instant() < when) {
                // Woken early by a new alarm, a cancel or shutdown, re-evaluate from the top
                _condition.wait_until(lock, when);
                continue;
            }

            _alarms.erase(_alarms.begin());
            auto cb = _callbacks.find(id);
            if (cb == _callbacks.end()) { continue; }
            callback_t callback = std::move(cb->second.callback);
            _callbacks.erase(cb);

            _running = id;
            lock.unlock();
            try {
                callback(when);
            } catch (const std::exception &e) {
                _diagnostics->error(LOGGER, "Timer callback for {} raised: {}", to_iso_string(when), e.what());
            } catch (...) {
                // Anything else would terminate the worker and with it every other timer
                _diagnostics->error(LOGGER, "Timer callback for {} raised a non standard exception",
                                    to_iso_string(when));
            }
            callback = nullptr;
            lock.lock();
            _running = 0;
            _condition.notify_all();
        }
    }
} // namespace timedate
