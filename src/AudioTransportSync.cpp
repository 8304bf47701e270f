#include "drumsync/AudioTransportSync.hpp"
#include "drumsync/Errors.hpp"
#include "drumsync/Log.hpp"
#include "drumsync/SafetyCurtain.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace drumsync {

const char* startModeName(StartMode mode) noexcept {
    switch (mode) {
        case StartMode::MetronomeOnly:      return "metronome_only";
        case StartMode::Fresh:              return "fresh";
        case StartMode::ResumeFromPosition: return "resume_from_position";
        case StartMode::ResumeDuringOffset: return "resume_during_offset";
    }
    return "metronome_only";
}

AudioTransportSync::AudioTransportSync(AudioBackendPtr backend, TimeSourcePtr timeSource,
                                       std::chrono::milliseconds loadTimeout)
    : backend_(std::move(backend))
    , timeSource_(std::move(timeSource))
    , loadTimeout_(loadTimeout)
    , timerWork_(asio::make_work_guard(timerContext_))
{
    if (!timeSource_) {
        throw ConfigurationError("AudioTransportSync requires a time source");
    }
    timerThread_ = std::thread([this] { timerContext_.run(); });
}

AudioTransportSync::~AudioTransportSync() {
    cancelPending();
    if (player_) {
        player_->stop();
    }
    loadPool_.join();
    timerWork_.reset();
    timerContext_.stop();
    if (timerThread_.joinable()) {
        timerThread_.join();
    }
}

void AudioTransportSync::attachTrack(const std::string& path) {
    cancelPending();
    if (player_) {
        player_->stop();
        player_.reset();
    }
    scheduledDeviceTime_.reset();
    loadError_.reset();
    trackPath_ = path;

    if (!backend_) {
        state_ = TransportState::Failed;
        loadError_ = "Failed to load BGM: no audio backend";
        Log::warning("AudioTransportSync: No audio backend, playing metronome-only");
        return;
    }

    auto cell = std::make_shared<OneShot<AudioLoadResult>>();
    AudioLoadResult timeoutResult;
    timeoutResult.status = AudioLoadResult::Status::TimedOut;
    timeoutResult.error = fmt::format("timed out after {} ms", loadTimeout_.count());
    auto awaiter = ConditionAwaiter<AudioLoadResult>::create(timerContext_, cell, loadTimeout_, timeoutResult);

    pendingLoad_ = cell;
    state_ = TransportState::Loading;
    Log::debug(fmt::format("AudioTransportSync: Loading {}", path));

    asio::post(loadPool_, [awaiter, backend = backend_, path] {
        AudioLoadResult result;
        try {
            result.player = backend->load(path);
            if (result.player) {
                result.status = AudioLoadResult::Status::Loaded;
            } else {
                result.status = AudioLoadResult::Status::Failed;
                result.error = "backend returned no player";
            }
        } catch (const std::exception& e) {
            result.status = AudioLoadResult::Status::Failed;
            result.error = e.what();
        }

        if (!awaiter->complete(std::move(result))) {
            Log::debug(fmt::format("AudioTransportSync: Discarding late load result for {}", path));
        }
    });
}

void AudioTransportSync::detach() {
    cancelPending();
    if (player_) {
        player_->stop();
        player_.reset();
    }
    scheduledDeviceTime_.reset();
    trackPath_.reset();
    loadError_.reset();
    state_ = TransportState::Detached;
}

void AudioTransportSync::cancelPending() {
    if (!pendingLoad_) {
        return;
    }
    AudioLoadResult cancelled;
    cancelled.status = AudioLoadResult::Status::Cancelled;
    pendingLoad_->complete(std::move(cancelled));
    pendingLoad_.reset();
    if (state_ == TransportState::Loading) {
        state_ = TransportState::Detached;
    }
}

bool AudioTransportSync::poll() {
    deliverInterruptions();
    if (!pendingLoad_) {
        return false;
    }
    auto result = pendingLoad_->tryGet();
    if (!result) {
        return false;
    }
    pendingLoad_.reset();
    adopt(*result);
    return true;
}

bool AudioTransportSync::awaitLoad(std::chrono::milliseconds maxWait) {
    if (pendingLoad_) {
        (void)pendingLoad_->waitFor(maxWait);
        poll();
    }
    return isReady();
}

void AudioTransportSync::adopt(const AudioLoadResult& result) {
    switch (result.status) {
        case AudioLoadResult::Status::Loaded:
            player_ = result.player;
            player_->setRate(rate_);
            player_->setVolume(volume_);
            state_ = TransportState::Ready;
            loadError_.reset();
            Log::info(fmt::format("AudioTransportSync: Loaded BGM ({:.1f}s)", player_->duration()));
            break;
        case AudioLoadResult::Status::Failed:
        case AudioLoadResult::Status::TimedOut:
            player_.reset();
            state_ = TransportState::Failed;
            loadError_ = fmt::format("Failed to load BGM: {}", result.error);
            Log::warning(fmt::format("AudioTransportSync: {}, playing metronome-only", *loadError_));
            break;
        case AudioLoadResult::Status::Cancelled:
            state_ = TransportState::Detached;
            break;
    }
}

std::optional<double> AudioTransportSync::toDeviceTime(double referenceTime) const {
    if (!isReady()) {
        return std::nullopt;
    }
    return player_->deviceCurrentTime() + (referenceTime - timeSource_->now());
}

std::optional<double> AudioTransportSync::scheduleStart(double referenceTime, double bgmOffsetSeconds) {
    auto deviceTime = toDeviceTime(referenceTime);
    if (!deviceTime) {
        return std::nullopt;
    }
    const double scheduled = *deviceTime + bgmOffsetSeconds;
    if (!player_->playAtTime(scheduled)) {
        Log::warning(fmt::format("AudioTransportSync: Player refused start at device time {:.3f}", scheduled));
        return std::nullopt;
    }
    scheduledDeviceTime_ = scheduled;
    return scheduled;
}

StartMode AudioTransportSync::startPlayback(double referenceTime, double bgmOffsetSeconds,
                                            double pausedElapsedSeconds, double speedMultiplier) {
    if (!isReady()) {
        return StartMode::MetronomeOnly;
    }

    if (player_->currentTime() > 0.0 && !player_->isPlaying()) {
        Log::debug(fmt::format("AudioTransportSync: Resuming BGM at {:.3f}s", player_->currentTime()));
        scheduleStart(referenceTime, 0.0);
        return StartMode::ResumeFromPosition;
    }

    if (pausedElapsedSeconds > bgmOffsetSeconds) {
        // Track arrived while paused past its lead-in and has never played.
        const double filePosition = (pausedElapsedSeconds - bgmOffsetSeconds) * speedMultiplier;
        if (filePosition >= player_->duration()) {
            Log::info("AudioTransportSync: Resume point is past the end of the track");
            return StartMode::MetronomeOnly;
        }
        player_->setCurrentTime(filePosition);
        Log::debug(fmt::format("AudioTransportSync: Resuming newly loaded BGM at {:.3f}s", filePosition));
        scheduleStart(referenceTime, 0.0);
        return StartMode::ResumeFromPosition;
    }

    player_->setCurrentTime(0.0);
    if (pausedElapsedSeconds > 0.0) {
        // Paused before the track's lead-in ended; only the rest of the lead-in remains.
        scheduleStart(referenceTime, remainingOffset(bgmOffsetSeconds, pausedElapsedSeconds));
        return StartMode::ResumeDuringOffset;
    }

    scheduleStart(referenceTime, bgmOffsetSeconds);
    return StartMode::Fresh;
}

bool AudioTransportSync::rescheduleForSpeedChange(double referenceTime, double bgmOffsetSeconds,
                                                  double pausedElapsedSeconds) {
    if (!isReady()) {
        return false;
    }
    player_->pause();
    const double remaining = remainingOffset(bgmOffsetSeconds, pausedElapsedSeconds);
    if (remaining > 0.0 && player_->currentTime() == 0.0) {
        return scheduleStart(referenceTime, remaining).has_value();
    }
    return scheduleStart(referenceTime, 0.0).has_value();
}

bool AudioTransportSync::joinInProgress(double elapsedSeconds, double bgmOffsetSeconds,
                                        double speedMultiplier) {
    if (!isReady()) {
        return false;
    }
    const double now = timeSource_->now();
    if (elapsedSeconds < bgmOffsetSeconds) {
        player_->setCurrentTime(0.0);
        return scheduleStart(now, bgmOffsetSeconds - elapsedSeconds).has_value();
    }

    const double filePosition = (elapsedSeconds - bgmOffsetSeconds) * speedMultiplier;
    if (filePosition >= player_->duration()) {
        return false;
    }
    player_->setCurrentTime(filePosition);
    Log::debug(fmt::format("AudioTransportSync: Joining run at {:.3f}s into the track", filePosition));
    return scheduleStart(now, 0.0).has_value();
}

void AudioTransportSync::pause() {
    scheduledDeviceTime_.reset();
    if (player_) {
        player_->pause();
    }
}

void AudioTransportSync::stop() {
    scheduledDeviceTime_.reset();
    if (player_) {
        player_->stop();
        player_->setCurrentTime(0.0);
    }
}

double AudioTransportSync::setRate(double speedMultiplier) {
    const double clamped = SafetyCurtain::sanitizeBgmRate(speedMultiplier);
    if (clamped != speedMultiplier) {
        Log::warning(fmt::format(
            "AudioTransportSync: BGM rate clamped from {}% to {}%, audio may drift from the metronome",
            static_cast<int>(speedMultiplier * 100), static_cast<int>(clamped * 100)));
    }
    rate_ = clamped;
    if (player_) {
        player_->setRate(rate_);
    }
    return rate_;
}

void AudioTransportSync::setVolume(double volume) {
    volume_ = SafetyCurtain::sanitizeVolume(volume);
    if (player_) {
        player_->setVolume(volume_);
    }
}

std::optional<double> AudioTransportSync::currentTime() const {
    if (!isReady()) {
        return std::nullopt;
    }
    return player_->currentTime();
}

double AudioTransportSync::timelineElapsed(double bgmTime, double speedMultiplier, double bgmOffsetSeconds) {
    if (speedMultiplier <= 0.0) {
        return bgmTime + bgmOffsetSeconds;
    }
    return bgmTime / speedMultiplier + bgmOffsetSeconds;
}

double AudioTransportSync::remainingOffset(double bgmOffsetSeconds, double pausedElapsedSeconds) {
    return std::max(0.0, bgmOffsetSeconds - pausedElapsedSeconds);
}

void AudioTransportSync::setInterruptionHandler(InterruptionHandler handler) {
    interruptionHandler_ = std::move(handler);
}

void AudioTransportSync::notifyInterruption(bool interrupted) {
    Log::info(fmt::format("AudioTransportSync: Audio interruption {}", interrupted ? "began" : "ended"));
    std::lock_guard<std::mutex> lock(interruptionMutex_);
    pendingInterruptions_.push_back(interrupted);
}

void AudioTransportSync::deliverInterruptions() {
    std::vector<bool> events;
    {
        std::lock_guard<std::mutex> lock(interruptionMutex_);
        events.swap(pendingInterruptions_);
    }
    if (!interruptionHandler_) {
        return;
    }
    for (bool interrupted : events) {
        try {
            interruptionHandler_(interrupted);
        } catch (const std::exception& e) {
            Log::error(fmt::format("AudioTransportSync: Exception in interruption handler: {}", e.what()));
        }
    }
}

} // namespace drumsync
