#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "Types.hpp"

namespace drumsync {

// ============================================================================
// JSONL Structured Logging
// ============================================================================

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

[[nodiscard]] constexpr const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

/**
 * Escape a string for embedding in a JSON string literal.
 */
[[nodiscard]] inline std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

/**
 * JSONL formatted log entry for machine-readable logging.
 */
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string source;
    int64_t timestamp_ms;

    [[nodiscard]] std::string toJsonl() const {
        return fmt::format(R"({{"level":"{}","message":"{}","source":"{}","timestamp_ms":{}}})",
                           logLevelName(level), jsonEscape(message), jsonEscape(source), timestamp_ms);
    }
};

// ============================================================================
// Musical time conversions
// ============================================================================

/**
 * Conversions between wall-clock seconds, beats and the measure-relative
 * time position used throughout the timing core.
 *
 * A time position is (measureNumber - 1) + measureOffset, so measure 2
 * at a quarter of the way through is 1.25.
 */
class Util {
public:
    /**
     * Offsets are grouped at millisecond-of-measure resolution.
     */
    static constexpr int OFFSET_KEY_SCALE = 1000;

    [[nodiscard]] static constexpr double secondsPerBeat(double bpm) noexcept {
        return 60.0 / bpm;
    }

    [[nodiscard]] static constexpr double secondsPerMeasure(double bpm, const TimeSignature& timeSignature) noexcept {
        return secondsPerBeat(bpm) * timeSignature.beatsPerMeasure;
    }

    [[nodiscard]] static constexpr double timePosition(int measureNumber, double measureOffset) noexcept {
        return static_cast<double>(measureNumber - 1) + measureOffset;
    }

    /**
     * Zero-based measure index containing a time position.
     */
    [[nodiscard]] static int measureIndex(double timePosition) noexcept {
        return static_cast<int>(std::floor(timePosition));
    }

    [[nodiscard]] static int offsetKey(double measureOffset) noexcept {
        return static_cast<int>(measureOffset * OFFSET_KEY_SCALE);
    }

    /**
     * Signed hit error in milliseconds, positive when late, rounded to the microsecond
     * so that a hit authored on a window edge grades on that edge.
     */
    [[nodiscard]] static double timingErrorMs(double hitTime, double noteTime) noexcept {
        return std::round((hitTime - noteTime) * 1000000.0) / 1000.0;
    }

    /**
     * Parse an authored "m:ss" duration into seconds.
     *
     * @return the duration, or std::nullopt if the text is not of that form
     */
    [[nodiscard]] static std::optional<double> parseDuration(std::string_view text) noexcept;

    /**
     * Format seconds as "m:ss", truncating fractions.
     */
    [[nodiscard]] static std::string formatDuration(double seconds);

    /**
     * Milliseconds since the Unix epoch, for log timestamps.
     */
    [[nodiscard]] static int64_t wallClockMs() noexcept;

    /**
     * Create a JSONL log entry with source location.
     */
    [[nodiscard]] static LogEntry createLogEntry(
        LogLevel level,
        const std::string& message,
        int64_t timestamp_ms,
        const std::source_location& loc = std::source_location::current()
    ) {
        return LogEntry{
            level,
            message,
            fmt::format("{}:{}", fileName(loc.file_name()), loc.line()),
            timestamp_ms
        };
    }

private:
    [[nodiscard]] static std::string_view fileName(std::string_view path) noexcept {
        const auto slash = path.find_last_of("/\\");
        return slash == std::string_view::npos ? path : path.substr(slash + 1);
    }

    Util() = delete;
};

} // namespace drumsync
