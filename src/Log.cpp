#include "drumsync/Log.hpp"

#include <iostream>
#include <mutex>

namespace drumsync {

namespace {

struct LogState {
    std::mutex mutex;
    LogLevel minimum = LogLevel::Info;
    LogSink sink;
    bool json = false;
};

LogState& state() {
    static LogState instance;
    return instance;
}

} // namespace

void Log::setMinimumLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().minimum = level;
}

LogLevel Log::minimumLevel() {
    std::lock_guard<std::mutex> lock(state().mutex);
    return state().minimum;
}

void Log::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().sink = std::move(sink);
}

void Log::setJsonOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().json = enabled;
}

void Log::write(LogLevel level, const std::string& message, const std::source_location& loc) {
    LogSink sink;
    bool json = false;
    {
        std::lock_guard<std::mutex> lock(state().mutex);
        if (static_cast<int>(level) < static_cast<int>(state().minimum)) {
            return;
        }
        sink = state().sink;
        json = state().json;
    }

    const LogEntry entry = Util::createLogEntry(level, message, Util::wallClockMs(), loc);

    if (sink) {
        try {
            sink(entry);
        } catch (const std::exception& e) {
            std::cerr << "Log: Exception in log sink: " << e.what() << std::endl;
        }
        return;
    }

    if (json) {
        std::cerr << entry.toJsonl() << std::endl;
    } else {
        std::cerr << "[" << logLevelName(level) << "] " << message << std::endl;
    }
}

} // namespace drumsync
