#pragma once

#include <memory>
#include <optional>

#include "AudioTransportSync.hpp"
#include "BeatClock.hpp"
#include "InputMatcher.hpp"
#include "Metronome.hpp"
#include "NoteSchedule.hpp"
#include "PlaybackState.hpp"
#include "PracticeSettings.hpp"
#include "TimeSource.hpp"
#include "Types.hpp"

namespace drumsync {

/**
 * Drives one play session of a chart.
 *
 * Owns the BeatClock and the paused-elapsed accumulator and keeps the
 * metronome, the background track and the InputMatcher on the same
 * reference start time. UI state is recomputed from a single clock
 * snapshot on every tick().
 *
 * Elapsed song time is always pausedElapsedSeconds plus the running
 * clock's elapsed time (never negative), so it only moves forward across
 * pause and resume. The input origin is reference - pausedElapsedSeconds.
 *
 * Not thread-safe: every method must be called from the owning thread.
 */
class PlaybackCoordinator {
public:
    PlaybackCoordinator(TimeSourcePtr timeSource = SteadyTimeSource::shared(),
                        AudioBackendPtr audioBackend = nullptr,
                        std::shared_ptr<Metronome> metronome = nullptr,
                        PlaybackConfig config = {},
                        PracticeSettingsPtr settings = nullptr);
    ~PlaybackCoordinator();

    PlaybackCoordinator(const PlaybackCoordinator&) = delete;
    PlaybackCoordinator& operator=(const PlaybackCoordinator&) = delete;

    /**
     * Load a chart, building its schedule.
     *
     * @throws ConfigurationError for a non-positive bpm, an invalid time signature or no notes
     */
    void load(const Chart& chart);

    /**
     * Load a chart with a schedule built elsewhere and shared with other readers.
     *
     * @throws ConfigurationError for a non-positive bpm, an invalid time signature or an empty schedule
     */
    void load(const Chart& chart, NoteSchedulePtr schedule);

    [[nodiscard]] bool isLoaded() const { return chart_.has_value(); }

    /**
     * Start, or resume after pause().
     *
     * @throws ConfigurationError if no chart is loaded
     */
    void start();

    void pause();
    void togglePlayback();

    /**
     * Advance UI state from the clock. Call once per frame; cheap when the
     * discrete beat has not changed.
     */
    void tick();

    /**
     * Back to the top of the chart, continuing to play if playing.
     */
    void restart();

    void skipToEnd();

    /**
     * Change the practice speed, live if playing.
     */
    void updateSpeed(double multiplier);

    /**
     * Pause on an audio interruption. Playback does not resume by itself.
     */
    void handleInterruption(bool interrupted);

    /**
     * Save the practice speed for the chart and release the clock, audio and input.
     */
    void cleanup();

    void setIndicatorLayout(IndicatorLayout layout) { layout_ = std::move(layout); }

    [[nodiscard]] const PlaybackState& getState() const { return state_; }
    [[nodiscard]] bool isPlaying() const { return state_.isPlaying; }

    /**
     * Song time reached so far: pausedElapsedSeconds plus the live clock.
     */
    [[nodiscard]] double elapsedSeconds() const;

    [[nodiscard]] double effectiveBpm() const;
    [[nodiscard]] double getTrackDuration() const { return trackDuration_; }
    [[nodiscard]] double getBgmOffset() const { return bgmOffset_; }
    [[nodiscard]] std::optional<StartMode> getLastStartMode() const { return lastStartMode_; }

    [[nodiscard]] const BeatClock& getClock() const { return clock_; }
    [[nodiscard]] InputMatcher& getInputMatcher() { return matcher_; }
    [[nodiscard]] AudioTransportSync& getAudio() { return *audio_; }
    [[nodiscard]] const NoteSchedulePtr& getSchedule() const { return schedule_; }
    [[nodiscard]] const PracticeSettingsPtr& getSettings() const { return settings_; }
    [[nodiscard]] const PlaybackConfig& getConfig() const { return config_; }

private:
    void resetState();
    void refreshTimingCaches();
    void restoreFromElapsed(double elapsed);
    void updateDerivedState(int64_t totalBeats, double elapsed);
    void stopTransport();
    void complete();
    void pollAudio();

    [[nodiscard]] double calculateTrackDuration() const;
    [[nodiscard]] double calculateBgmOffset() const;
    [[nodiscard]] double secondsPerBeat() const { return 60.0 / effectiveBpm(); }
    [[nodiscard]] const TimeSignature& timeSignature() const { return chart_->timeSignature; }

    TimeSourcePtr timeSource_;
    PlaybackConfig config_;
    PracticeSettingsPtr settings_;
    std::shared_ptr<Metronome> metronome_;
    std::unique_ptr<AudioTransportSync> audio_;
    BeatClock clock_;
    InputMatcher matcher_;
    IndicatorLayout layout_;

    std::optional<Chart> chart_;
    NoteSchedulePtr schedule_;
    PlaybackState state_;
    double trackDuration_ = 0.0;
    double bgmOffset_ = 0.0;
    double lastAppliedSpeed_ = 1.0;
    std::optional<StartMode> lastStartMode_;
};

} // namespace drumsync
