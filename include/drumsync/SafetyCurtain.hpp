#pragma once

/**
 * Safety Curtain - input limiter layer
 *
 * Whatever arrives from charts, settings files or the command line
 * (including NaN/Inf), values handed to the clock, the audio player and the
 * metronome stay within safe limits.
 */

#include <algorithm>
#include <cmath>

namespace drumsync {

struct SafetyLimits {
    // Tempo range accepted from charts
    static constexpr double MIN_BPM = 20.0;
    static constexpr double MAX_BPM = 300.0;

    // Practice speed multiplier
    static constexpr double MIN_SPEED = 0.25;
    static constexpr double MAX_SPEED = 1.5;
    static constexpr double DEFAULT_SPEED = 1.0;
    static constexpr double SPEED_STEP = 0.05;

    // Time-stretch range supported by the audio player
    static constexpr double MIN_BGM_RATE = 0.5;
    static constexpr double MAX_BGM_RATE = 2.0;

    // Metronome tempo range
    static constexpr double MIN_METRONOME_BPM = 40.0;
    static constexpr double MAX_METRONOME_BPM = 200.0;

    static constexpr double MIN_VOLUME = 0.0;
    static constexpr double MAX_VOLUME = 1.0;

    static constexpr int MIN_MIDI_VALUE = 0;
    static constexpr int MAX_MIDI_VALUE = 127;
};

/**
 * Clamps values to safe ranges. All methods are constexpr and noexcept.
 */
class SafetyCurtain {
public:
    [[nodiscard]] static constexpr bool isSafe(double value) noexcept {
        return std::isfinite(value);
    }

    /**
     * Clamp a value to a range, handling NaN/Inf by returning a default.
     */
    [[nodiscard]] static constexpr double clampSafe(
        double value,
        double min_val,
        double max_val,
        double default_val
    ) noexcept {
        if (!std::isfinite(value)) {
            return default_val;
        }
        return std::clamp(value, min_val, max_val);
    }

    [[nodiscard]] static constexpr double sanitizeBpm(double bpm) noexcept {
        constexpr double DEFAULT_BPM = 120.0;
        return clampSafe(bpm, SafetyLimits::MIN_BPM, SafetyLimits::MAX_BPM, DEFAULT_BPM);
    }

    [[nodiscard]] static constexpr double sanitizeSpeed(double speed) noexcept {
        return clampSafe(speed, SafetyLimits::MIN_SPEED, SafetyLimits::MAX_SPEED, SafetyLimits::DEFAULT_SPEED);
    }

    [[nodiscard]] static constexpr double sanitizeBgmRate(double rate) noexcept {
        return clampSafe(rate, SafetyLimits::MIN_BGM_RATE, SafetyLimits::MAX_BGM_RATE, 1.0);
    }

    [[nodiscard]] static constexpr double sanitizeMetronomeBpm(double bpm) noexcept {
        return clampSafe(bpm, SafetyLimits::MIN_METRONOME_BPM, SafetyLimits::MAX_METRONOME_BPM, 120.0);
    }

    [[nodiscard]] static constexpr double sanitizeVolume(double volume) noexcept {
        return clampSafe(volume, SafetyLimits::MIN_VOLUME, SafetyLimits::MAX_VOLUME, SafetyLimits::MAX_VOLUME);
    }

    [[nodiscard]] static constexpr int clampInt(int value, int min_val, int max_val) noexcept {
        return std::clamp(value, min_val, max_val);
    }

private:
    SafetyCurtain() = delete;
};

} // namespace drumsync
