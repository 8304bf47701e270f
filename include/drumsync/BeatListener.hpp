#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace drumsync {

/**
 * A metronome beat as it fires.
 */
struct BeatEvent {
    int64_t beatNumber = 0;         // continues across resume
    int beatInMeasure = 0;          // zero-based
    bool accented = false;          // first beat of the measure
    double scheduledTime = 0.0;     // TimeSource seconds the beat was due
};

class BeatListener {
public:
    virtual ~BeatListener() = default;
    virtual void onBeat(const BeatEvent& beat) = 0;
};

using BeatListenerPtr = std::shared_ptr<BeatListener>;
using BeatCallback = std::function<void(const BeatEvent&)>;

class BeatListenerCallbacks final : public BeatListener {
public:
    explicit BeatListenerCallbacks(BeatCallback callback)
        : callback_(std::move(callback))
    {
    }

    void onBeat(const BeatEvent& beat) override {
        if (callback_) {
            callback_(beat);
        }
    }

private:
    BeatCallback callback_;
};

} // namespace drumsync
