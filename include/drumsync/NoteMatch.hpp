#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "Types.hpp"
#include "Util.hpp"

namespace drumsync {

/**
 * One physical input event.
 */
struct InputHit {
    DrumType drumType = DrumType::Kick;
    double timestamp = 0.0;         // TimeSource seconds
    double velocity = 1.0;          // normalised 0..1
};

enum class TimingAccuracy : uint8_t {
    Perfect,
    Great,
    Good,
    Miss
};

[[nodiscard]] constexpr const char* timingAccuracyName(TimingAccuracy accuracy) noexcept {
    switch (accuracy) {
        case TimingAccuracy::Perfect: return "perfect";
        case TimingAccuracy::Great:   return "great";
        case TimingAccuracy::Good:    return "good";
        case TimingAccuracy::Miss:    return "miss";
    }
    return "miss";
}

/**
 * Share of a full note score awarded for each accuracy tier.
 */
[[nodiscard]] constexpr double scoreMultiplier(TimingAccuracy accuracy) noexcept {
    switch (accuracy) {
        case TimingAccuracy::Perfect: return 1.0;
        case TimingAccuracy::Great:   return 0.8;
        case TimingAccuracy::Good:    return 0.5;
        case TimingAccuracy::Miss:    return 0.0;
    }
    return 0.0;
}

/**
 * Accuracy thresholds in milliseconds of absolute timing error.
 * Each bound is inclusive on the tighter tier.
 */
struct TimingWindows {
    double perfectMs = 25.0;
    double greatMs = 50.0;
    double goodMs = 100.0;
    double searchWindowMs = 200.0;  // no note this far away counts as a miss

    [[nodiscard]] bool isValid() const noexcept {
        return perfectMs >= 0.0 && perfectMs <= greatMs && greatMs <= goodMs && goodMs <= searchWindowMs;
    }

    [[nodiscard]] constexpr TimingAccuracy classify(double timingErrorMs) const noexcept {
        const double magnitude = timingErrorMs < 0.0 ? -timingErrorMs : timingErrorMs;
        if (magnitude <= perfectMs) return TimingAccuracy::Perfect;
        if (magnitude <= greatMs) return TimingAccuracy::Great;
        if (magnitude <= goodMs) return TimingAccuracy::Good;
        return TimingAccuracy::Miss;
    }
};

/**
 * Outcome of matching one InputHit. Never modified after creation.
 */
struct NoteMatchResult {
    InputHit hitInput;
    std::optional<uint64_t> matchedNoteId;
    double timingErrorMs = 0.0;         // positive = late
    TimingAccuracy timingAccuracy = TimingAccuracy::Miss;
    int measureNumber = 1;
    double measureOffset = 0.0;

    [[nodiscard]] bool isHit() const { return timingAccuracy != TimingAccuracy::Miss; }

    [[nodiscard]] std::string toJson() const {
        return fmt::format(
            R"({{"drum":"{}","timestamp":{:.6f},"velocity":{:.3f},"matched_note_id":{},"timing_error_ms":{:.2f},"accuracy":"{}","measure":{},"offset":{:.4f}}})",
            drumTypeName(hitInput.drumType), hitInput.timestamp, hitInput.velocity,
            matchedNoteId ? fmt::format("{}", *matchedNoteId) : std::string("null"),
            timingErrorMs, timingAccuracyName(timingAccuracy), measureNumber, measureOffset);
    }
};

} // namespace drumsync
