#ifndef TIMEDATE_DIAGNOSTICS_H
#define TIMEDATE_DIAGNOSTICS_H

#include <timedate/timedate_export.h>

#include <fmt/format.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace timedate {
    enum class LogLevel { Debug = 10, Info = 20, Warning = 30, Error = 40 };

    TIMEDATE_EXPORT std::string_view to_string(LogLevel level);

    /**
     * Diagnostics sink handed to every component at construction. Components never log through a global,
     * the host decides where the lines go.
     *
     * The formatting helpers check enabled() first so that a disabled debug line costs no formatting.
     */
    struct TIMEDATE_EXPORT Diagnostics {
        using ptr = std::shared_ptr<Diagnostics>;

        virtual ~Diagnostics() = default;

        [[nodiscard]] virtual bool enabled(LogLevel level) const = 0;

        virtual void log(LogLevel level, std::string_view logger, std::string_view message) = 0;

        template<typename... Ts>
        void debug(std::string_view logger, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            write(LogLevel::Debug, logger, fmt_str, std::forward<Ts>(xs)...);
        }

        template<typename... Ts>
        void info(std::string_view logger, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            write(LogLevel::Info, logger, fmt_str, std::forward<Ts>(xs)...);
        }

        template<typename... Ts>
        void warning(std::string_view logger, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            write(LogLevel::Warning, logger, fmt_str, std::forward<Ts>(xs)...);
        }

        template<typename... Ts>
        void error(std::string_view logger, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            write(LogLevel::Error, logger, fmt_str, std::forward<Ts>(xs)...);
        }

    private:
        template<typename... Ts>
        void write(LogLevel level, std::string_view logger, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
            if (enabled(level)) { log(level, logger, fmt::format(fmt_str, std::forward<Ts>(xs)...)); }
        }
    };

    /**
     * Writes "[2023-01-01T23:00:00.000000Z] LEVEL logger: message" lines to stderr.
     */
    struct TIMEDATE_EXPORT StderrDiagnostics : Diagnostics {
        explicit StderrDiagnostics(LogLevel min_level = LogLevel::Info);

        [[nodiscard]] bool enabled(LogLevel level) const override;

        void log(LogLevel level, std::string_view logger, std::string_view message) override;

        void set_min_level(LogLevel level);

    private:
        mutable std::mutex _mutex;
        LogLevel _min_level;
    };

    struct TIMEDATE_EXPORT NullDiagnostics : Diagnostics {
        [[nodiscard]] bool enabled(LogLevel) const override { return false; }

        void log(LogLevel, std::string_view, std::string_view) override {}
    };
} // namespace timedate

#endif // TIMEDATE_DIAGNOSTICS_H
