#pragma once

#include <cstdint>
#include <optional>

#include "BeatSnapshot.hpp"
#include "TimeSource.hpp"
#include "Types.hpp"

namespace drumsync {

/**
 * Result of BeatClock::currentBeatProgress().
 */
struct BeatProgress {
    double totalBeats = 0.0;
    int beatInMeasure = 0;
};

/**
 * Converts a monotonic time reference into beat and measure coordinates.
 *
 * The clock holds no timer; every query computes from the reference start
 * time, so there is nothing to drift. Owned and mutated by a single
 * PlaybackCoordinator.
 */
class BeatClock {
public:
    explicit BeatClock(TimeSourcePtr timeSource = SteadyTimeSource::shared());

    /**
     * Begin a fresh run with the reference at "now" and no phase offset.
     *
     * @throws ConfigurationError for a non-positive or non-finite bpm or an invalid time signature
     */
    void start(double bpm, const TimeSignature& timeSignature);

    /**
     * Begin a run whose reference is an explicit, possibly near-future,
     * start time. The beat counter continues from phaseOffsetBeats.
     *
     * @throws ConfigurationError for a non-positive or non-finite bpm or an invalid time signature
     */
    void startAtTime(double bpm, const TimeSignature& timeSignature, double startTime,
                     int64_t phaseOffsetBeats = 0);

    /**
     * Stop the run. The reference start time is kept, so capture any
     * elapsed time needed before calling start again.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /**
     * Seconds since the reference start time, or std::nullopt when stopped.
     * Negative while a scheduled start is still in the future.
     */
    [[nodiscard]] std::optional<double> currentPlaybackTime() const;

    /**
     * (now - reference) / secondsPerBeat + phaseOffsetBeats, or std::nullopt when stopped.
     */
    [[nodiscard]] std::optional<BeatProgress> currentBeatProgress() const;

    /**
     * Read the time source once and derive everything from that instant.
     */
    [[nodiscard]] std::optional<BeatSnapshot> snapshot() const;

    [[nodiscard]] double getReferenceStartTime() const { return referenceStartTime_; }
    [[nodiscard]] double getBpm() const { return bpm_; }
    [[nodiscard]] int getBeatsPerMeasure() const { return beatsPerMeasure_; }
    [[nodiscard]] int64_t getPhaseOffsetBeats() const { return phaseOffsetBeats_; }
    [[nodiscard]] double getSecondsPerBeat() const { return 60.0 / bpm_; }
    [[nodiscard]] const TimeSourcePtr& getTimeSource() const { return timeSource_; }

private:
    static void validate(double bpm, const TimeSignature& timeSignature);

    TimeSourcePtr timeSource_;
    double referenceStartTime_ = 0.0;
    double bpm_ = 120.0;
    int beatsPerMeasure_ = 4;
    int64_t phaseOffsetBeats_ = 0;
    bool running_ = false;
};

} // namespace drumsync
