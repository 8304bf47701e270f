#include "drumsync/Metronome.hpp"
#include "drumsync/Errors.hpp"
#include "drumsync/Log.hpp"
#include "drumsync/SafetyCurtain.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <fmt/format.h>

namespace drumsync {

Metronome::Metronome(TimeSourcePtr timeSource)
    : timeSource_(std::move(timeSource))
    , work_(asio::make_work_guard(ioContext_))
    , timer_(ioContext_)
{
    if (!timeSource_) {
        throw ConfigurationError("Metronome requires a time source");
    }
    thread_ = std::thread([this] { ioContext_.run(); });
}

Metronome::~Metronome() {
    stop();
    work_.reset();
    ioContext_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Metronome::start(double bpm, const TimeSignature& timeSignature, double referenceTime,
                      int64_t phaseOffsetBeats) {
    if (!std::isfinite(bpm) || bpm <= 0.0) {
        throw ConfigurationError(fmt::format("Metronome: bpm must be positive, got {}", bpm));
    }
    if (!timeSignature.isValid()) {
        throw ConfigurationError(fmt::format("Metronome: invalid time signature {}", timeSignature.toString()));
    }

    Run run;
    run.generation = generation_.fetch_add(1) + 1;
    run.reference = referenceTime;
    run.bpm = bpm;
    run.beatsPerMeasure = timeSignature.beatsPerMeasure;
    run.phaseOffset = phaseOffsetBeats;
    running_.store(true);

    asio::post(ioContext_, [this, run] {
        timer_.cancel();
        arm(run, 0);
    });
}

void Metronome::stop() {
    generation_.fetch_add(1);
    running_.store(false);
    asio::post(ioContext_, [this] {
        timer_.cancel();
    });
}

void Metronome::setVolume(double volume) {
    volume_.store(SafetyCurtain::sanitizeVolume(volume));
}

void Metronome::setClickSink(ClickSinkPtr sink) {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sink_ = std::move(sink);
}

void Metronome::testClick() {
    ClickSinkPtr sink;
    {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        sink = sink_;
    }
    if (sink) {
        sink->playClick(accentedVolume(volume_.load()), true);
    }
}

double Metronome::accentedVolume(double volume) {
    return std::min(1.0, SafetyCurtain::sanitizeVolume(volume) * ACCENT_GAIN);
}

void Metronome::arm(const Run& run, int64_t k) {
    if (run.generation != generation_.load()) {
        return;
    }

    const double deadline = beatDeadline(run.reference, run.bpm, k);
    const double delay = std::max(0.0, deadline - timeSource_->now());
    timer_.expires_after(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(delay)));

    timer_.async_wait([this, run, k](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        fire(run, k);
        arm(run, k + 1);
    });
}

void Metronome::fire(const Run& run, int64_t k) {
    if (run.generation != generation_.load()) {
        return;
    }

    BeatEvent beat;
    beat.beatNumber = run.phaseOffset + k;
    beat.beatInMeasure = static_cast<int>(beat.beatNumber % run.beatsPerMeasure);
    beat.accented = beat.beatInMeasure == 0;
    beat.scheduledTime = beatDeadline(run.reference, run.bpm, k);

    if (enabled_.load()) {
        ClickSinkPtr sink;
        {
            std::lock_guard<std::mutex> lock(sinkMutex_);
            sink = sink_;
        }
        if (sink) {
            const double volume = volume_.load();
            try {
                sink->playClick(beat.accented ? accentedVolume(volume) : volume, beat.accented);
            } catch (const std::exception& e) {
                Log::error(fmt::format("Metronome: Exception playing click: {}", e.what()));
            }
        }
    }

    beatsDelivered_.fetch_add(1);
    deliverBeat(beat);
}

void Metronome::addBeatListener(const BeatListenerPtr& listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    beatListeners_.push_back(listener);
}

void Metronome::addBeatListener(BeatCallback callback) {
    addBeatListener(std::make_shared<BeatListenerCallbacks>(std::move(callback)));
}

void Metronome::removeBeatListener(const BeatListenerPtr& listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    beatListeners_.erase(std::remove(beatListeners_.begin(), beatListeners_.end(), listener),
                         beatListeners_.end());
}

void Metronome::clearListeners() {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    beatListeners_.clear();
}

void Metronome::deliverBeat(const BeatEvent& beat) {
    std::vector<BeatListenerPtr> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = beatListeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener->onBeat(beat);
        } catch (const std::exception& e) {
            Log::error(fmt::format("Metronome: Exception in beat listener: {}", e.what()));
        }
    }
}

} // namespace drumsync
