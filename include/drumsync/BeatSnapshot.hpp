#pragma once

#include <cmath>
#include <cstdint>

namespace drumsync {

/**
 * One consistent reading of a running BeatClock.
 * Everything is derived from a single instant, so callers that need
 * several values in the same frame never tear across a beat boundary.
 */
struct BeatSnapshot {
    double instant = 0.0;           // time source seconds
    double reference = 0.0;         // clock reference start time
    double elapsed = 0.0;           // instant - reference, negative during a lead-in
    double bpm = 120.0;
    int beats_per_measure = 4;
    int64_t phase_offset_beats = 0;
    double total_beats = 0.0;       // elapsed / secondsPerBeat + phase offset

    [[nodiscard]] double getSecondsPerBeat() const { return 60.0 / bpm; }
    [[nodiscard]] double getSecondsPerMeasure() const { return getSecondsPerBeat() * beats_per_measure; }

    /**
     * Discrete beat count; floor() is the only rounding step.
     */
    [[nodiscard]] int64_t getDiscreteBeat() const {
        return static_cast<int64_t>(std::floor(total_beats));
    }

    /**
     * Zero-based beat within the current measure.
     */
    [[nodiscard]] int getBeatInMeasure() const {
        const int64_t beat = getDiscreteBeat();
        const int64_t wrapped = ((beat % beats_per_measure) + beats_per_measure) % beats_per_measure;
        return static_cast<int>(wrapped);
    }

    /**
     * Fraction of the way from the last beat to the next one.
     */
    [[nodiscard]] double getBeatPhase() const {
        return total_beats - std::floor(total_beats);
    }

    [[nodiscard]] bool isInLeadIn() const { return elapsed < 0.0; }
};

} // namespace drumsync
