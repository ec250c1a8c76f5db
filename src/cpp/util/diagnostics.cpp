#include <timedate/util/diagnostics.h>
#include <timedate/util/date_time.h>

#include <iostream>

namespace timedate {
    std::string_view to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error: return "ERROR";
        }
        return "UNKNOWN";
    }

    StderrDiagnostics::StderrDiagnostics(LogLevel min_level) : _min_level{min_level} {}

    bool StderrDiagnostics::enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return level >= _min_level;
    }

    void StderrDiagnostics::log(LogLevel level, std::string_view logger, std::string_view message) {
        std::string formatted = fmt::format("[{}] {} {}: {}", to_iso_string(now_instant()), to_string(level), logger,
                                            message);
        // Timer callbacks log from the worker thread, keep lines whole
        std::lock_guard<std::mutex> lock(_mutex);
        std::cerr << formatted << std::endl;
    }

    void StderrDiagnostics::set_min_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }
} // namespace timedate
