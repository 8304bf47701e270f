#include "drumsync/BeatClock.hpp"

#include <cmath>
#include <fmt/format.h>

#include "drumsync/Errors.hpp"

namespace drumsync {

BeatClock::BeatClock(TimeSourcePtr timeSource)
    : timeSource_(std::move(timeSource))
{
    if (!timeSource_) {
        throw ConfigurationError("BeatClock requires a time source");
    }
}

void BeatClock::validate(double bpm, const TimeSignature& timeSignature) {
    if (!std::isfinite(bpm) || bpm <= 0.0) {
        throw ConfigurationError(fmt::format("BeatClock: bpm must be positive, got {}", bpm));
    }
    if (!timeSignature.isValid()) {
        throw ConfigurationError(fmt::format("BeatClock: invalid time signature {}", timeSignature.toString()));
    }
}

void BeatClock::start(double bpm, const TimeSignature& timeSignature) {
    startAtTime(bpm, timeSignature, timeSource_->now(), 0);
}

void BeatClock::startAtTime(double bpm, const TimeSignature& timeSignature, double startTime,
                            int64_t phaseOffsetBeats) {
    validate(bpm, timeSignature);
    bpm_ = bpm;
    beatsPerMeasure_ = timeSignature.beatsPerMeasure;
    referenceStartTime_ = startTime;
    phaseOffsetBeats_ = phaseOffsetBeats;
    running_ = true;
}

void BeatClock::stop() {
    running_ = false;
}

std::optional<double> BeatClock::currentPlaybackTime() const {
    if (!running_) {
        return std::nullopt;
    }
    return timeSource_->now() - referenceStartTime_;
}

std::optional<BeatProgress> BeatClock::currentBeatProgress() const {
    auto snap = snapshot();
    if (!snap) {
        return std::nullopt;
    }
    return BeatProgress{snap->total_beats, snap->getBeatInMeasure()};
}

std::optional<BeatSnapshot> BeatClock::snapshot() const {
    if (!running_) {
        return std::nullopt;
    }

    BeatSnapshot snap;
    snap.instant = timeSource_->now();
    snap.reference = referenceStartTime_;
    snap.elapsed = snap.instant - referenceStartTime_;
    snap.bpm = bpm_;
    snap.beats_per_measure = beatsPerMeasure_;
    snap.phase_offset_beats = phaseOffsetBeats_;
    snap.total_beats = snap.elapsed / getSecondsPerBeat() + static_cast<double>(phaseOffsetBeats_);
    return snap;
}

} // namespace drumsync
