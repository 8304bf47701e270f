#pragma once

/**
 * API Introspection / Self-Description System
 *
 * Lets tools and agents discover the drumsync API without reading source
 * code. The CLI prints this schema for --schema.
 */

#include <string>
#include <vector>

#include <fmt/format.h>

#include "NoteMatch.hpp"
#include "SafetyCurtain.hpp"
#include "Types.hpp"

namespace drumsync {

/**
 * Parameter metadata for API introspection.
 */
struct ParamInfo {
    std::string name;
    std::string type;          // "int", "float", "string", "bool"
    std::string description;
    std::string unit;          // "bpm", "ms", "multiplier", etc.
    double min_value = 0.0;
    double max_value = 0.0;
    bool has_range = false;

    [[nodiscard]] std::string toJson() const {
        std::string json = fmt::format(
            R"({{"name":"{}","type":"{}","description":"{}")",
            name, type, jsonEscape(description)
        );
        if (!unit.empty()) {
            json += fmt::format(R"(,"unit":"{}")", unit);
        }
        if (has_range) {
            json += fmt::format(R"(,"min":{},"max":{})", min_value, max_value);
        }
        json += "}";
        return json;
    }
};

struct CommandInfo {
    std::string name;
    std::string description;
    std::vector<ParamInfo> params;
    std::string returns;

    [[nodiscard]] std::string toJson() const;
};

/**
 * Input/Output format metadata.
 */
struct IoInfo {
    std::string name;
    std::string description;
    std::string format;        // "json", "jsonl", "text", "midi"

    [[nodiscard]] std::string toJson() const {
        return fmt::format(R"({{"name":"{}","description":"{}","format":"{}"}})",
                           name, jsonEscape(description), format);
    }
};

template <typename T>
[[nodiscard]] std::string jsonArray(const std::vector<T>& items) {
    std::string json = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) json += ",";
        json += items[i].toJson();
    }
    json += "]";
    return json;
}

inline std::string CommandInfo::toJson() const {
    return fmt::format(
        R"({{"name":"{}","description":"{}","params":{},"returns":"{}"}})",
        name, jsonEscape(description), jsonArray(params), jsonEscape(returns)
    );
}

/**
 * Complete API Schema for self-description.
 */
class ApiSchema {
public:
    std::string name;
    std::string version;
    std::string description;
    std::vector<CommandInfo> commands;
    std::vector<IoInfo> inputs;
    std::vector<IoInfo> outputs;

    [[nodiscard]] std::string toJson() const {
        return fmt::format(
            R"({{"name":"{}","version":"{}","description":"{}","commands":{},"inputs":{},"outputs":{}}})",
            name, version, jsonEscape(description), jsonArray(commands), jsonArray(inputs), jsonArray(outputs)
        );
    }
};

/**
 * Get the drumsync API schema for introspection.
 */
[[nodiscard]] inline ApiSchema describe_api() {
    const TimingWindows defaults;

    ApiSchema schema;
    schema.name = "drumsync";
    schema.version = Version::STRING;
    schema.description = "Timing and input-matching core for drum practice. "
                         "Keeps a beat clock, metronome, background track and note schedule in sync "
                         "and scores live hits against the chart.";

    schema.commands = {
        {
            "load_chart",
            "Load a chart and build its note schedule; applies the saved practice speed",
            {
                {"chart", "Chart", "Chart metadata and notes (see parse_dtx)", "", 0, 0, false}
            },
            "void (throws ConfigurationError for bpm <= 0 or no notes)"
        },
        {
            "parse_dtx",
            "Parse DTXMania chart text into a Chart",
            {
                {"path", "string", "Path to a .dtx file", "", 0, 0, false}
            },
            "Chart (throws DtxParseError)"
        },
        {
            "start",
            "Start playback, or resume from the paused position",
            {},
            "void"
        },
        {
            "pause",
            "Pause playback, keeping the elapsed song time",
            {},
            "void"
        },
        {
            "tick",
            "Advance UI state from the beat clock; call once per frame",
            {},
            "PlaybackState"
        },
        {
            "restart",
            "Return to the top of the chart",
            {},
            "void"
        },
        {
            "skip_to_end",
            "Stop and mark the chart complete",
            {},
            "void"
        },
        {
            "update_speed",
            "Change the practice speed, live while playing",
            {
                {"multiplier", "float", "Tempo multiplier", "multiplier",
                 SafetyLimits::MIN_SPEED, SafetyLimits::MAX_SPEED, true}
            },
            "void"
        },
        {
            "process_hit",
            "Match a drum hit against the nearest unconsumed note",
            {
                {"drum", "string", "Drum name, e.g. \"snare\"", "", 0, 0, false},
                {"timestamp", "float", "Monotonic time of the hit", "s", 0, 0, false},
                {"velocity", "float", "Normalised velocity", "", 0.0, 1.0, true}
            },
            "NoteMatchResult or null when not listening"
        },
        {
            "set_timing_windows",
            "Set the accuracy thresholds; each bound is inclusive on the tighter tier",
            {
                {"perfect_ms", "float", fmt::format("Perfect threshold (default {})", defaults.perfectMs), "ms", 0, 0, false},
                {"great_ms", "float", fmt::format("Great threshold (default {})", defaults.greatMs), "ms", 0, 0, false},
                {"good_ms", "float", fmt::format("Good threshold (default {})", defaults.goodMs), "ms", 0, 0, false},
                {"search_window_ms", "float", fmt::format("Search window (default {})", defaults.searchWindowMs), "ms", 0, 0, false}
            },
            "void (throws ConfigurationError if unordered)"
        },
        {
            "set_time",
            "Inject time for deterministic operation (ManualTimeSource)",
            {
                {"seconds", "float", "Current monotonic time", "s", 0, 0, false}
            },
            "void"
        }
    };

    schema.inputs = {
        {"dtx_chart", "DTXMania chart text (#TITLE, #BPM, #mmmLL note lines)", "text"},
        {"key_event", "Keyboard key name mapped to a drum by InputMapper", "text"},
        {"midi_message", "Raw MIDI note-on bytes (0x9n note velocity)", "midi"}
    };

    schema.outputs = {
        {"playback_state", "Phase, progress, current beat and indicator position", "json"},
        {"note_match", "Timing error and accuracy tier for one hit", "json"},
        {"beat_event", "Metronome beat number and accent", "json"},
        {"log", "Structured log entries on stderr", "jsonl"}
    };

    return schema;
}

/**
 * JSON-formatted string for agent consumption.
 */
[[nodiscard]] inline std::string describe_api_json() {
    return describe_api().toJson();
}

} // namespace drumsync
