#include "drumsync/PlaybackCoordinator.hpp"
#include "drumsync/Errors.hpp"
#include "drumsync/Log.hpp"
#include "drumsync/Util.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace drumsync {

namespace {

constexpr double SPEED_EPSILON = 0.0001;

} // namespace

PlaybackCoordinator::PlaybackCoordinator(TimeSourcePtr timeSource, AudioBackendPtr audioBackend,
                                         std::shared_ptr<Metronome> metronome, PlaybackConfig config,
                                         PracticeSettingsPtr settings)
    : timeSource_(std::move(timeSource))
    , config_(config)
    , settings_(settings ? std::move(settings) : std::make_shared<PracticeSettings>())
    , metronome_(std::move(metronome))
    , clock_(timeSource_)
{
    audio_ = std::make_unique<AudioTransportSync>(std::move(audioBackend), timeSource_, config_.loadTimeout);
    audio_->setVolume(config_.bgmVolume);
    audio_->setInterruptionHandler([this](bool interrupted) {
        handleInterruption(interrupted);
    });
    lastAppliedSpeed_ = settings_->getSpeed();
}

PlaybackCoordinator::~PlaybackCoordinator() {
    audio_->setInterruptionHandler(nullptr);
    stopTransport();
}

void PlaybackCoordinator::load(const Chart& chart) {
    load(chart, NoteSchedule::build(chart.notes));
}

void PlaybackCoordinator::load(const Chart& chart, NoteSchedulePtr schedule) {
    if (!std::isfinite(chart.bpm) || chart.bpm <= 0.0) {
        throw ConfigurationError(fmt::format("PlaybackCoordinator: bpm must be positive, got {}", chart.bpm));
    }
    if (!chart.timeSignature.isValid()) {
        throw ConfigurationError(fmt::format("PlaybackCoordinator: invalid time signature {}",
                                             chart.timeSignature.toString()));
    }
    if (!schedule || schedule->empty()) {
        throw ConfigurationError(fmt::format("PlaybackCoordinator: chart '{}' has no notes", chart.title));
    }

    stopTransport();
    chart_ = chart;
    schedule_ = std::move(schedule);

    if (!chart_->id.empty()) {
        settings_->loadAndApplySpeed(chart_->id);
    }

    const bool hasTrack = chart_->bgmPath && !chart_->bgmPath->empty();
    if (hasTrack && settings_->getSpeed() < config_.minimumBgmSpeed) {
        Log::warning("PlaybackCoordinator: BGM enabled, clamping speed to keep audio in sync");
        settings_->setSpeed(config_.minimumBgmSpeed);
    }
    lastAppliedSpeed_ = settings_->getSpeed();

    if (hasTrack) {
        audio_->setRate(lastAppliedSpeed_);
        audio_->attachTrack(*chart_->bgmPath);
    } else {
        audio_->detach();
        Log::info(fmt::format("PlaybackCoordinator: No BGM for '{}', metronome only", chart_->title));
    }

    resetState();
    state_.pausedElapsedSeconds = 0.0;
    state_.isPlaying = false;
    state_.phase = PlaybackPhase::Stopped;
    state_.bgmLoadError = audio_->getLoadError();
    lastStartMode_.reset();

    refreshTimingCaches();
    matcher_.configure(effectiveBpm(), timeSignature(), schedule_);

    Log::info(fmt::format("PlaybackCoordinator: Loaded '{}' ({} entries, {:.1f} BPM at {}, {:.2f}s)",
                          chart_->title, schedule_->size(), chart_->bpm, settings_->formattedSpeed(),
                          trackDuration_));
}

void PlaybackCoordinator::start() {
    if (!chart_) {
        throw ConfigurationError("PlaybackCoordinator: No chart loaded");
    }
    if (state_.isPlaying) {
        return;
    }

    pollAudio();

    const bool resuming = state_.pausedElapsedSeconds > 0.0;
    if (resuming) {
        double actualElapsed = state_.pausedElapsedSeconds;
        const auto bgmTime = audio_->currentTime();
        if (bgmTime && *bgmTime > 0.0) {
            actualElapsed = AudioTransportSync::timelineElapsed(*bgmTime, settings_->getSpeed(), bgmOffset_);
        }
        restoreFromElapsed(actualElapsed);
        state_.pausedElapsedSeconds = actualElapsed;
    } else {
        resetState();
        matcher_.resetConsumed();
    }

    const double bpm = effectiveBpm();
    const int64_t phaseOffset = resuming ? state_.totalBeatsElapsed : 0;
    double reference = 0.0;
    if (resuming || audio_->isReady()) {
        reference = timeSource_->now() + config_.setupLatencySeconds;
        clock_.startAtTime(bpm, timeSignature(), reference, phaseOffset);
    } else {
        clock_.start(bpm, timeSignature());
        reference = clock_.getReferenceStartTime();
    }

    lastStartMode_ = audio_->startPlayback(reference, bgmOffset_, state_.pausedElapsedSeconds,
                                           settings_->getSpeed());
    if (metronome_) {
        metronome_->start(bpm, timeSignature(), reference, phaseOffset);
    }
    matcher_.startListening(reference - state_.pausedElapsedSeconds);

    state_.isPlaying = true;
    state_.phase = PlaybackPhase::Playing;

    Log::info(fmt::format("PlaybackCoordinator: {} '{}' at {:.1f} BPM from {:.3f}s ({})",
                          resuming ? "Resumed" : "Started", chart_->title, bpm,
                          state_.pausedElapsedSeconds, startModeName(*lastStartMode_)));
}

void PlaybackCoordinator::pause() {
    if (!state_.isPlaying) {
        return;
    }

    if (auto playbackTime = clock_.currentPlaybackTime()) {
        state_.pausedElapsedSeconds += std::max(0.0, *playbackTime);
    }
    stopTransport();
    audio_->pause();

    state_.isPlaying = false;
    state_.phase = PlaybackPhase::Paused;
    state_.indicator.reset();
    state_.purpleBarPosition.reset();

    Log::info(fmt::format("PlaybackCoordinator: Paused at {:.3f}s (beat {})",
                          state_.pausedElapsedSeconds, state_.totalBeatsElapsed));
}

void PlaybackCoordinator::togglePlayback() {
    if (state_.isPlaying) {
        pause();
    } else {
        start();
    }
}

void PlaybackCoordinator::tick() {
    if (!state_.isPlaying || !chart_) {
        return;
    }

    pollAudio();
    if (!state_.isPlaying) {
        return;  // an interruption paused the run
    }

    if (trackDuration_ <= 0.0) {
        return;
    }
    const auto snapshot = clock_.snapshot();
    if (!snapshot) {
        return;
    }

    const double elapsed = state_.pausedElapsedSeconds + std::max(0.0, snapshot->elapsed);
    const auto totalBeats = static_cast<int64_t>(std::floor(elapsed / snapshot->getSecondsPerBeat()));
    if (state_.lastDiscreteBeat == totalBeats) {
        return;
    }
    state_.lastDiscreteBeat = totalBeats;

    updateDerivedState(totalBeats, elapsed);

    if (state_.playbackProgress >= 1.0) {
        complete();
    }
}

void PlaybackCoordinator::restart() {
    const bool wasPlaying = state_.isPlaying;

    stopTransport();
    audio_->stop();
    resetState();
    state_.pausedElapsedSeconds = 0.0;
    state_.isPlaying = false;
    state_.phase = PlaybackPhase::Stopped;
    matcher_.resetConsumed();

    Log::info(fmt::format("PlaybackCoordinator: Restarted '{}'", chart_ ? chart_->title : std::string()));

    if (wasPlaying) {
        start();
    }
}

void PlaybackCoordinator::skipToEnd() {
    stopTransport();
    audio_->stop();

    state_.playbackProgress = 1.0;
    state_.isPlaying = false;
    state_.phase = PlaybackPhase::Completed;
    state_.pausedElapsedSeconds = 0.0;
    state_.indicator.reset();
    state_.purpleBarPosition.reset();

    Log::info(fmt::format("PlaybackCoordinator: Skipped to end of '{}'", chart_ ? chart_->title : std::string()));
}

void PlaybackCoordinator::updateSpeed(double multiplier) {
    settings_->setSpeed(multiplier);
    if (!chart_) {
        lastAppliedSpeed_ = settings_->getSpeed();
        return;
    }

    const bool hasTrack = chart_->bgmPath && !chart_->bgmPath->empty();
    if (hasTrack && settings_->getSpeed() < config_.minimumBgmSpeed) {
        Log::warning("PlaybackCoordinator: BGM enabled, clamping speed to keep audio in sync");
        settings_->setSpeed(config_.minimumBgmSpeed);
    }

    const double previous = lastAppliedSpeed_;
    const double current = settings_->getSpeed();
    refreshTimingCaches();
    if (std::abs(previous - current) <= SPEED_EPSILON) {
        return;
    }
    lastAppliedSpeed_ = current;

    const double bpm = effectiveBpm();
    const double ratio = previous / current;
    matcher_.updateTempo(bpm);
    audio_->setRate(current);

    if (!state_.isPlaying) {
        state_.pausedElapsedSeconds *= ratio;
        if (trackDuration_ > 0.0) {
            state_.playbackProgress = std::min(state_.pausedElapsedSeconds / trackDuration_, 1.0);
        }
        return;
    }

    if (auto playbackTime = clock_.currentPlaybackTime()) {
        state_.pausedElapsedSeconds += std::max(0.0, *playbackTime);
    }
    state_.pausedElapsedSeconds *= ratio;
    restoreFromElapsed(state_.pausedElapsedSeconds);

    const int64_t beatOffset = state_.totalBeatsElapsed;
    const double reference = timeSource_->now() + config_.setupLatencySeconds;
    clock_.startAtTime(bpm, timeSignature(), reference, beatOffset);
    if (metronome_) {
        metronome_->start(bpm, timeSignature(), reference, beatOffset);
    }
    if (!audio_->rescheduleForSpeedChange(reference, bgmOffset_, state_.pausedElapsedSeconds)
        && audio_->isReady()) {
        Log::warning("PlaybackCoordinator: BGM could not be rescheduled after speed change");
    }
    matcher_.startListening(reference - state_.pausedElapsedSeconds);

    Log::info(fmt::format("PlaybackCoordinator: Live speed change to {} ({})",
                          settings_->formattedSpeed(), settings_->formattedEffectiveBpm(chart_->bpm)));
}

void PlaybackCoordinator::handleInterruption(bool interrupted) {
    if (interrupted) {
        if (state_.isPlaying) {
            Log::info("PlaybackCoordinator: Audio interrupted, pausing");
            pause();
        }
    } else {
        Log::info("PlaybackCoordinator: Audio interruption ended, waiting for the player to resume");
    }
}

void PlaybackCoordinator::cleanup() {
    if (chart_ && !chart_->id.empty()) {
        settings_->saveSpeed(settings_->getSpeed(), chart_->id);
    }
    stopTransport();
    audio_->detach();
    state_.isPlaying = false;
    if (state_.phase == PlaybackPhase::Playing) {
        state_.phase = PlaybackPhase::Paused;
    }
}

double PlaybackCoordinator::elapsedSeconds() const {
    const auto playbackTime = clock_.currentPlaybackTime();
    return state_.pausedElapsedSeconds + std::max(0.0, playbackTime.value_or(0.0));
}

double PlaybackCoordinator::effectiveBpm() const {
    if (!chart_) {
        return 0.0;
    }
    return settings_->effectiveBpm(chart_->bpm);
}

void PlaybackCoordinator::resetState() {
    state_.currentBeat = 0;
    state_.currentMeasureIndex = 0;
    state_.currentBeatPosition = 0.0;
    state_.totalBeatsElapsed = 0;
    state_.lastDiscreteBeat.reset();
    state_.activeBeatId.reset();
    state_.playbackProgress = 0.0;
    state_.indicator.reset();
    state_.purpleBarPosition.reset();
}

void PlaybackCoordinator::refreshTimingCaches() {
    if (!chart_) {
        return;
    }
    trackDuration_ = calculateTrackDuration();
    bgmOffset_ = calculateBgmOffset();
}

void PlaybackCoordinator::restoreFromElapsed(double elapsed) {
    const auto totalBeats = static_cast<int64_t>(std::floor(elapsed / secondsPerBeat()));
    updateDerivedState(totalBeats, elapsed);
    state_.lastDiscreteBeat = totalBeats;
}

void PlaybackCoordinator::updateDerivedState(int64_t totalBeats, double elapsed) {
    const int beatsPerMeasure = timeSignature().beatsPerMeasure;
    const auto beatWithinMeasure = totalBeats % beatsPerMeasure;

    state_.totalBeatsElapsed = totalBeats;
    state_.currentMeasureIndex = static_cast<int>(totalBeats / beatsPerMeasure);
    state_.currentBeatPosition = static_cast<double>(beatWithinMeasure) / beatsPerMeasure;
    state_.playbackProgress = trackDuration_ > 0.0 ? std::min(elapsed / trackDuration_, 1.0) : 0.0;

    const double timePosition = state_.currentMeasureIndex + state_.currentBeatPosition;
    state_.currentBeat = schedule_->closestIndexAtOrBefore(timePosition);
    state_.activeBeatId = schedule_->findActiveBeat(timePosition, config_.activeBeatTolerance);

    const IndicatorPosition indicator{state_.currentMeasureIndex, state_.currentBeatPosition};
    state_.indicator = indicator;
    state_.purpleBarPosition.reset();
    if (layout_) {
        try {
            state_.purpleBarPosition = layout_(indicator);
        } catch (const std::exception& e) {
            Log::error(fmt::format("PlaybackCoordinator: Exception in indicator layout: {}", e.what()));
        }
    }
}

void PlaybackCoordinator::stopTransport() {
    clock_.stop();
    if (metronome_) {
        metronome_->stop();
    }
    matcher_.stopListening();
}

void PlaybackCoordinator::complete() {
    stopTransport();
    audio_->stop();
    resetState();
    state_.pausedElapsedSeconds = 0.0;
    state_.isPlaying = false;
    state_.phase = PlaybackPhase::Completed;
    matcher_.resetConsumed();

    Log::info(fmt::format("PlaybackCoordinator: Completed '{}'", chart_->title));
}

void PlaybackCoordinator::pollAudio() {
    const bool wasReady = audio_->isReady();
    const bool changed = audio_->poll();
    state_.bgmLoadError = audio_->getLoadError();
    if (!changed) {
        return;
    }
    if (!wasReady && audio_->isReady() && state_.isPlaying
        && !audio_->joinInProgress(elapsedSeconds(), bgmOffset_, settings_->getSpeed())) {
        Log::info("PlaybackCoordinator: BGM loaded past the end of the track, it will play on the next run");
    }
}

double PlaybackCoordinator::calculateTrackDuration() const {
    const double secondsPerMeasure = Util::secondsPerMeasure(chart_->bpm, timeSignature());

    double baseDuration = 0.0;
    std::optional<double> authored;
    if (!chart_->duration.empty() && chart_->duration != "0:00") {
        authored = Util::parseDuration(chart_->duration);
    }
    if (authored) {
        baseDuration = *authored;
    } else {
        const int noteMeasures = std::max(1, schedule_->maxMeasureIndex() + 1);
        baseDuration = noteMeasures * secondsPerMeasure;
    }

    const double speed = settings_->getSpeed();
    return speed > 0.0 ? baseDuration / speed : baseDuration;
}

double PlaybackCoordinator::calculateBgmOffset() const {
    const auto first = schedule_->firstTimePosition();
    if (!first || *first <= 0.0) {
        return 0.0;
    }
    const double noteTimeSeconds = *first * Util::secondsPerMeasure(chart_->bpm, timeSignature());
    const double speed = settings_->getSpeed();
    return speed > 0.0 ? noteTimeSeconds / speed : noteTimeSeconds;
}

} // namespace drumsync
