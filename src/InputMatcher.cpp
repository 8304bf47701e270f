#include "drumsync/InputMatcher.hpp"
#include "drumsync/Errors.hpp"
#include "drumsync/Log.hpp"
#include "drumsync/Util.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace drumsync {

InputMatcher::InputMatcher(TimingWindows windows) {
    setTimingWindows(windows);
}

void InputMatcher::configure(double bpm, const TimeSignature& timeSignature, NoteSchedulePtr schedule) {
    if (!std::isfinite(bpm) || bpm <= 0.0) {
        throw ConfigurationError(fmt::format("InputMatcher: bpm must be positive, got {}", bpm));
    }
    if (!timeSignature.isValid()) {
        throw ConfigurationError(fmt::format("InputMatcher: invalid time signature {}", timeSignature.toString()));
    }
    if (!schedule) {
        throw ConfigurationError("InputMatcher: no note schedule");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bpm_ = bpm;
    timeSignature_ = timeSignature;
    schedule_ = std::move(schedule);
    consumed_.clear();
}

void InputMatcher::updateTempo(double bpm) {
    if (!std::isfinite(bpm) || bpm <= 0.0) {
        throw ConfigurationError(fmt::format("InputMatcher: bpm must be positive, got {}", bpm));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    bpm_ = bpm;
}

bool InputMatcher::isConfigured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schedule_ != nullptr;
}

void InputMatcher::setTimingWindows(const TimingWindows& windows) {
    if (!windows.isValid()) {
        throw ConfigurationError(fmt::format(
            "InputMatcher: timing windows must be ordered, got {}/{}/{}/{} ms",
            windows.perfectMs, windows.greatMs, windows.goodMs, windows.searchWindowMs));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    windows_ = windows;
}

TimingWindows InputMatcher::getTimingWindows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_;
}

void InputMatcher::startListening(double songStartTime) {
    std::lock_guard<std::mutex> lock(mutex_);
    songStartTime_ = songStartTime;
    listening_ = true;
}

bool InputMatcher::stopListening() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!listening_) {
        return false;
    }
    listening_ = false;
    return true;
}

bool InputMatcher::isListening() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listening_;
}

std::optional<double> InputMatcher::getSongStartTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!listening_) {
        return std::nullopt;
    }
    return songStartTime_;
}

std::optional<double> InputMatcher::timePositionAt(double timestamp) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!listening_) {
        return std::nullopt;
    }
    return (timestamp - songStartTime_) / Util::secondsPerMeasure(bpm_, timeSignature_);
}

std::optional<NoteMatchResult> InputMatcher::process(const InputHit& hit) {
    NoteMatchResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!listening_ || !schedule_) {
            return std::nullopt;
        }

        const double secondsPerMeasure = Util::secondsPerMeasure(bpm_, timeSignature_);
        const double hitPosition = (hit.timestamp - songStartTime_) / secondsPerMeasure;
        const double searchWindow = windows_.searchWindowMs / 1000.0 / secondsPerMeasure;

        result.hitInput = hit;
        result.measureNumber = Util::measureIndex(hitPosition) + 1;
        result.measureOffset = hitPosition - std::floor(hitPosition);

        auto match = schedule_->findNearestMatching(hit.drumType, hitPosition, searchWindow,
            [this](uint64_t beatId, DrumType drum) {
                return consumed_.count({beatId, drum}) > 0;
            });

        if (match) {
            const DrumBeat& beat = schedule_->at(*match);
            result.matchedNoteId = beat.id;
            const double noteTime = songStartTime_ + beat.timePosition * secondsPerMeasure;
            result.timingErrorMs = Util::timingErrorMs(hit.timestamp, noteTime);
            result.timingAccuracy = windows_.classify(result.timingErrorMs);
            if (result.timingAccuracy != TimingAccuracy::Miss) {
                consumed_.insert({beat.id, hit.drumType});
            }
        } else {
            result.timingAccuracy = TimingAccuracy::Miss;
        }
    }

    deliverHitReceived(hit);
    deliverNoteMatched(result);
    return result;
}

void InputMatcher::resetConsumed() {
    std::lock_guard<std::mutex> lock(mutex_);
    consumed_.clear();
}

size_t InputMatcher::consumedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumed_.size();
}

void InputMatcher::addInputListener(const InputListenerPtr& listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(listener);
}

void InputMatcher::addInputListener(NoteMatchCallback callback) {
    addInputListener(std::make_shared<InputListenerCallbacks>(std::move(callback)));
}

void InputMatcher::removeInputListener(const InputListenerPtr& listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void InputMatcher::clearListeners() {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.clear();
}

void InputMatcher::deliverHitReceived(const InputHit& hit) {
    std::vector<InputListenerPtr> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener->hitReceived(hit);
        } catch (const std::exception& e) {
            Log::error(fmt::format("InputMatcher: Exception delivering input hit: {}", e.what()));
        }
    }
}

void InputMatcher::deliverNoteMatched(const NoteMatchResult& result) {
    std::vector<InputListenerPtr> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener->noteMatched(result);
        } catch (const std::exception& e) {
            Log::error(fmt::format("InputMatcher: Exception delivering match result: {}", e.what()));
        }
    }
}

} // namespace drumsync
