#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "BeatListener.hpp"
#include "TimeSource.hpp"
#include "Types.hpp"

namespace drumsync {

/**
 * Plays a click. Implementations wrap the platform audio output.
 */
class ClickSink {
public:
    virtual ~ClickSink() = default;
    virtual void playClick(double volume, bool accented) = 0;
};

using ClickSinkPtr = std::shared_ptr<ClickSink>;

/**
 * Audible beat ticker.
 *
 * Runs its own io_context thread. Beat k of a run is due at
 * reference + k * secondsPerBeat; each timer is armed for that absolute
 * deadline rather than relative to the previous beat, so scheduling
 * latency never accumulates. The coordinator starts it with the same
 * reference and phase offset as the BeatClock.
 *
 * Listeners are called on the metronome thread.
 */
class Metronome {
public:
    static constexpr double DEFAULT_VOLUME = 0.7;
    static constexpr double ACCENT_GAIN = 1.3;

    explicit Metronome(TimeSourcePtr timeSource = SteadyTimeSource::shared());
    ~Metronome();

    Metronome(const Metronome&) = delete;
    Metronome& operator=(const Metronome&) = delete;

    /**
     * Start clicking with the first beat at referenceTime.
     *
     * @throws ConfigurationError for a non-positive bpm or an invalid time signature
     */
    void start(double bpm, const TimeSignature& timeSignature, double referenceTime,
               int64_t phaseOffsetBeats = 0);

    /**
     * Stop clicking. Any beat already armed is discarded.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * A disabled metronome still notifies listeners but makes no sound.
     */
    void setEnabled(bool enabled) { enabled_.store(enabled); }
    [[nodiscard]] bool isEnabled() const { return enabled_.load(); }

    void setVolume(double volume);
    [[nodiscard]] double getVolume() const { return volume_.load(); }

    void setClickSink(ClickSinkPtr sink);

    [[nodiscard]] uint64_t getBeatsDelivered() const { return beatsDelivered_.load(); }

    /**
     * Play one accented click immediately.
     */
    void testClick();

    void addBeatListener(const BeatListenerPtr& listener);
    void addBeatListener(BeatCallback callback);
    void removeBeatListener(const BeatListenerPtr& listener);
    void clearListeners();

    [[nodiscard]] static double accentedVolume(double volume);

    /**
     * TimeSource instant at which beat k (counted from the reference) is due.
     */
    [[nodiscard]] static double beatDeadline(double referenceTime, double bpm, int64_t k) {
        return referenceTime + static_cast<double>(k) * (60.0 / bpm);
    }

private:
    struct Run {
        uint64_t generation = 0;
        double reference = 0.0;
        double bpm = 120.0;
        int beatsPerMeasure = 4;
        int64_t phaseOffset = 0;
    };

    void arm(const Run& run, int64_t k);
    void fire(const Run& run, int64_t k);
    void deliverBeat(const BeatEvent& beat);

    TimeSourcePtr timeSource_;

    asio::io_context ioContext_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    asio::steady_timer timer_;
    std::thread thread_;

    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> enabled_{true};
    std::atomic<double> volume_{DEFAULT_VOLUME};
    std::atomic<uint64_t> beatsDelivered_{0};

    std::mutex sinkMutex_;
    ClickSinkPtr sink_;

    mutable std::mutex listenersMutex_;
    std::vector<BeatListenerPtr> beatListeners_;
};

} // namespace drumsync
