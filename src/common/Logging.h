#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace deskrelay::common {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Process-wide logger.
 *
 * Lines look like `2024-05-01 12:00:00 [deskrelay] [INFO ] [broker] text`.
 * Output goes to stdout (errors to stderr) unless a log file is configured.
 */
class Logging {
public:
    /**
     * @param level   minimum level written
     * @param logFile append to this file instead of the console (empty = console)
     * @return false if the log file could not be opened (console is used instead)
     */
    static bool init(LogLevel level, const std::string& logFile = "");
    static void shutdown();

    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    static void write(LogLevel level, std::string_view component, std::string_view text);

    // "debug", "info", "warn"/"warning", "error" (case-insensitive)
    static std::optional<LogLevel> parse_level(std::string_view name);
    static const char* level_name(LogLevel level);
};

} // namespace deskrelay::common

#define DESKRELAY_LOG(lvl, component, expr)                                        \
    do {                                                                            \
        if (::deskrelay::common::Logging::enabled(lvl)) {                           \
            std::ostringstream deskrelay_log_os_;                                   \
            deskrelay_log_os_ << expr;                                              \
            ::deskrelay::common::Logging::write(lvl, component, deskrelay_log_os_.str()); \
        }                                                                           \
    } while (0)

#define DESKRELAY_LOG_DEBUG(component, expr) DESKRELAY_LOG(::deskrelay::common::LogLevel::Debug, component, expr)
#define DESKRELAY_LOG_INFO(component, expr)  DESKRELAY_LOG(::deskrelay::common::LogLevel::Info, component, expr)
#define DESKRELAY_LOG_WARN(component, expr)  DESKRELAY_LOG(::deskrelay::common::LogLevel::Warning, component, expr)
#define DESKRELAY_LOG_ERROR(component, expr) DESKRELAY_LOG(::deskrelay::common::LogLevel::Error, component, expr)
