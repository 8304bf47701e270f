#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "AudioPlayer.hpp"
#include "OneShot.hpp"
#include "TimeSource.hpp"

namespace drumsync {

/**
 * Outcome of an asynchronous track load.
 */
struct AudioLoadResult {
    enum class Status {
        Loaded,
        Failed,
        TimedOut,
        Cancelled
    };

    Status status = Status::Failed;
    AudioPlayerPtr player;
    std::string error;
};

enum class TransportState {
    Detached,       // no track attached, metronome only
    Loading,
    Ready,
    Failed          // load failed or timed out, metronome only
};

/**
 * How startPlayback() scheduled the track.
 */
enum class StartMode {
    MetronomeOnly,
    Fresh,
    ResumeFromPosition,
    ResumeDuringOffset
};

[[nodiscard]] const char* startModeName(StartMode mode) noexcept;

using InterruptionHandler = std::function<void(bool interrupted)>;

/**
 * Aligns a background-music player with the BeatClock.
 *
 * Reference times are in the TimeSource domain; the player schedules in its
 * own device-clock domain. scheduleStart() converts between them with
 * deviceTime = player.deviceCurrentTime() + (referenceTime - now).
 *
 * Tracks load on a worker pool. The result lands in a OneShot raced against
 * a load timeout, and the owning thread adopts it with poll(). Until then,
 * or after a failure, playback runs metronome-only.
 *
 * Apart from the load worker and the timer thread, all methods must be
 * called from the thread that owns the PlaybackCoordinator. The one exception
 * is notifyInterruption(), which only queues the event for the next poll().
 */
class AudioTransportSync {
public:
    static constexpr std::chrono::milliseconds DEFAULT_LOAD_TIMEOUT{2000};
    static constexpr double DEFAULT_VOLUME = 0.7;

    AudioTransportSync(AudioBackendPtr backend, TimeSourcePtr timeSource,
                       std::chrono::milliseconds loadTimeout = DEFAULT_LOAD_TIMEOUT);
    ~AudioTransportSync();

    AudioTransportSync(const AudioTransportSync&) = delete;
    AudioTransportSync& operator=(const AudioTransportSync&) = delete;

    /**
     * Start loading a track without blocking. Any earlier pending load is cancelled.
     */
    void attachTrack(const std::string& path);

    /**
     * Drop the player and any pending load.
     */
    void detach();

    /**
     * Hand queued interruptions to the handler, then adopt a finished load,
     * both on the calling thread.
     *
     * @return true if the load state changed
     */
    bool poll();

    /**
     * Block until the pending load resolves or the wait elapses, then poll().
     * Only tests should need this.
     *
     * @return true if a player is ready
     */
    bool awaitLoad(std::chrono::milliseconds maxWait);

    [[nodiscard]] TransportState getState() const { return state_; }
    [[nodiscard]] bool isReady() const { return state_ == TransportState::Ready && player_ != nullptr; }
    [[nodiscard]] const std::optional<std::string>& getLoadError() const { return loadError_; }
    [[nodiscard]] const AudioPlayerPtr& getPlayer() const { return player_; }
    [[nodiscard]] const std::optional<std::string>& getTrackPath() const { return trackPath_; }

    /**
     * Convert a TimeSource instant into the player's device clock.
     */
    [[nodiscard]] std::optional<double> toDeviceTime(double referenceTime) const;

    /**
     * Schedule playback at the device time matching referenceTime plus the lead-in.
     *
     * @return the scheduled device time, or std::nullopt without a ready player
     */
    std::optional<double> scheduleStart(double referenceTime, double bgmOffsetSeconds);

    /**
     * Start or resume the track for a run whose BeatClock reference is referenceTime.
     *
     * A resume with the file still at zero but pausedElapsedSeconds past the
     * lead-in seeks to (pausedElapsedSeconds - bgmOffsetSeconds) * speedMultiplier
     * first, the same position joinInProgress() would pick.
     */
    StartMode startPlayback(double referenceTime, double bgmOffsetSeconds, double pausedElapsedSeconds,
                            double speedMultiplier = 1.0);

    /**
     * Pause, then reschedule for a clock restarted at referenceTime after a
     * tempo change.
     */
    bool rescheduleForSpeedChange(double referenceTime, double bgmOffsetSeconds, double pausedElapsedSeconds);

    /**
     * Bring in a track whose load finished after the run started, lined up
     * with timeline position elapsedSeconds at the current instant.
     */
    bool joinInProgress(double elapsedSeconds, double bgmOffsetSeconds, double speedMultiplier);

    /**
     * Pause the track. Cancels a scheduled start that has not begun.
     */
    void pause();

    /**
     * Stop the track and seek to zero. Cancels a scheduled start; a load in
     * progress carries on so the next run can use it.
     */
    void stop();

    /**
     * Apply the practice speed as a playback rate, clamped to what the
     * player supports.
     *
     * @return the rate actually applied
     */
    double setRate(double speedMultiplier);

    void setVolume(double volume);

    /**
     * Position in the file, or std::nullopt without a ready player.
     */
    [[nodiscard]] std::optional<double> currentTime() const;

    /**
     * Song timeline position for a file position: bgmTime / speed + lead-in.
     */
    [[nodiscard]] static double timelineElapsed(double bgmTime, double speedMultiplier, double bgmOffsetSeconds);

    [[nodiscard]] static double remainingOffset(double bgmOffsetSeconds, double pausedElapsedSeconds);

    [[nodiscard]] std::optional<double> getScheduledDeviceTime() const { return scheduledDeviceTime_; }

    void setInterruptionHandler(InterruptionHandler handler);

    /**
     * Called by the platform layer, from any thread, when another app or a call
     * takes the audio device. The handler sees the event on the next poll().
     */
    void notifyInterruption(bool interrupted);

private:
    void deliverInterruptions();
    void cancelPending();
    void adopt(const AudioLoadResult& result);

    AudioBackendPtr backend_;
    TimeSourcePtr timeSource_;
    std::chrono::milliseconds loadTimeout_;

    asio::thread_pool loadPool_{1};
    asio::io_context timerContext_;
    asio::executor_work_guard<asio::io_context::executor_type> timerWork_;
    std::thread timerThread_;

    TransportState state_ = TransportState::Detached;
    AudioPlayerPtr player_;
    OneShotPtr<AudioLoadResult> pendingLoad_;
    std::optional<std::string> trackPath_;
    std::optional<std::string> loadError_;
    std::optional<double> scheduledDeviceTime_;
    double rate_ = 1.0;
    double volume_ = DEFAULT_VOLUME;

    InterruptionHandler interruptionHandler_;
    std::mutex interruptionMutex_;
    std::vector<bool> pendingInterruptions_;
};

} // namespace drumsync
