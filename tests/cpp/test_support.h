#ifndef TIMEDATE_TEST_SUPPORT_H
#define TIMEDATE_TEST_SUPPORT_H

#include <timedate/runtime/timer_service.h>
#include <timedate/util/date_time.h>
#include <timedate/util/diagnostics.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace timedate::testing {
    inline instant_t utc(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0) {
        using namespace std::chrono;
        return instant_t{sys_days{year{y} / month{m} / day{d}}.time_since_epoch() + hours(hh) + minutes(mm) +
                         seconds(ss)};
    }

    inline local_time_t local(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0) {
        return local_time_t{utc(y, m, d, hh, mm, ss).time_since_epoch()};
    }

    // Keeps every line logged, whatever the level
    struct RecordingDiagnostics : Diagnostics {
        struct Line {
            LogLevel level;
            std::string logger;
            std::string message;
        };

        [[nodiscard]] bool enabled(LogLevel) const override { return true; }

        void log(LogLevel level, std::string_view logger, std::string_view message) override {
            std::lock_guard<std::mutex> lock(_mutex);
            _lines.push_back(Line{level, std::string(logger), std::string(message)});
        }

        [[nodiscard]] size_t count(LogLevel level) const {
            std::lock_guard<std::mutex> lock(_mutex);
            return static_cast<size_t>(std::ranges::count(_lines, level, &Line::level));
        }

        [[nodiscard]] bool contains(LogLevel level, std::string_view text) const {
            std::lock_guard<std::mutex> lock(_mutex);
            return std::ranges::any_of(_lines, [&](const Line &line) {
                return line.level == level && line.message.find(text) != std::string::npos;
            });
        }

    private:
        mutable std::mutex _mutex;
        std::vector<Line> _lines;
    };

    // Refuses to arm while failing is set, counts the attempts
    struct FailingTimerService : TimerService {
        explicit FailingTimerService(TimerService::ptr delegate) : _delegate{std::move(delegate)} {}

        [[nodiscard]] TimerHandle schedule_at(instant_t when, callback_t callback) override {
            ++attempts;
            if (failing) { throw std::runtime_error("timer service unavailable"); }
            return _delegate->schedule_at(when, std::move(callback));
        }

        bool cancel(TimerHandle handle) override { return _delegate->cancel(handle); }

        [[nodiscard]] size_t pending() const override { return _delegate->pending(); }

        bool failing{true};
        size_t attempts{0};

    private:
        TimerService::ptr _delegate;
    };
} // namespace timedate::testing

#endif // TIMEDATE_TEST_SUPPORT_H
