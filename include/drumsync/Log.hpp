#pragma once

#include <functional>
#include <source_location>
#include <string>

#include "Util.hpp"

namespace drumsync {

using LogSink = std::function<void(const LogEntry&)>;

/**
 * Process-wide log front end.
 *
 * Messages are prefixed with the component name ("BeatClock: ...") by the
 * caller. By default entries at or above the minimum level go to std::cerr,
 * either as plain text or as JSONL.
 */
class Log {
public:
    static void setMinimumLevel(LogLevel level);
    [[nodiscard]] static LogLevel minimumLevel();

    /**
     * Route entries to a custom sink. Passing an empty function restores
     * the default std::cerr output.
     */
    static void setSink(LogSink sink);

    static void setJsonOutput(bool enabled);

    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current()) {
        write(LogLevel::Debug, message, loc);
    }

    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current()) {
        write(LogLevel::Info, message, loc);
    }

    static void warning(const std::string& message,
                        const std::source_location& loc = std::source_location::current()) {
        write(LogLevel::Warning, message, loc);
    }

    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current()) {
        write(LogLevel::Error, message, loc);
    }

private:
    Log() = delete;
};

} // namespace drumsync
