#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "Util.hpp"

namespace drumsync {

enum class PlaybackPhase : uint8_t {
    Stopped,
    Playing,
    Paused,
    Completed
};

[[nodiscard]] constexpr const char* playbackPhaseName(PlaybackPhase phase) noexcept {
    switch (phase) {
        case PlaybackPhase::Stopped:   return "stopped";
        case PlaybackPhase::Playing:   return "playing";
        case PlaybackPhase::Paused:    return "paused";
        case PlaybackPhase::Completed: return "completed";
    }
    return "stopped";
}

/**
 * Beat indicator in musical coordinates.
 */
struct IndicatorPosition {
    int measureIndex = 0;           // zero-based
    double beatPosition = 0.0;      // fraction of the measure, [0, 1)

    bool operator==(const IndicatorPosition&) const = default;
};

struct PixelPosition {
    double x = 0.0;
    double y = 0.0;
};

/**
 * Maps an indicator position onto the staff layout. Returns std::nullopt
 * for positions outside the laid-out measures.
 */
using IndicatorLayout = std::function<std::optional<PixelPosition>(const IndicatorPosition&)>;

/**
 * UI-visible playback state, written only by the PlaybackCoordinator.
 */
struct PlaybackState {
    PlaybackPhase phase = PlaybackPhase::Stopped;
    bool isPlaying = false;
    double playbackProgress = 0.0;              // [0, 1]
    size_t currentBeat = 0;                     // index into the NoteSchedule
    int currentMeasureIndex = 0;
    double currentBeatPosition = 0.0;
    int64_t totalBeatsElapsed = 0;
    std::optional<int64_t> lastDiscreteBeat;    // unset until the first tick of a run
    std::optional<uint64_t> activeBeatId;
    std::optional<IndicatorPosition> indicator;
    std::optional<PixelPosition> purpleBarPosition;
    double pausedElapsedSeconds = 0.0;
    std::optional<std::string> bgmLoadError;

    [[nodiscard]] std::string toJson() const {
        return fmt::format(
            R"({{"phase":"{}","is_playing":{},"progress":{:.4f},"current_beat":{},"measure":{},"beat_position":{:.4f},"total_beats":{},"active_beat_id":{},"paused_elapsed":{:.4f},"bgm_error":{}}})",
            playbackPhaseName(phase), isPlaying, playbackProgress, currentBeat, currentMeasureIndex,
            currentBeatPosition, totalBeatsElapsed,
            activeBeatId ? fmt::format("{}", *activeBeatId) : std::string("null"),
            pausedElapsedSeconds,
            bgmLoadError ? fmt::format("\"{}\"", jsonEscape(*bgmLoadError)) : std::string("null"));
    }
};

/**
 * Tunables for a PlaybackCoordinator.
 */
struct PlaybackConfig {
    double setupLatencySeconds = 0.05;      // lead time before a scheduled start
    double activeBeatTolerance = 0.05;      // measure units
    double bgmVolume = 0.7;
    double minimumBgmSpeed = 0.5;           // slowest speed the time-stretcher handles well
    std::chrono::milliseconds loadTimeout{2000};
};

} // namespace drumsync
