#pragma once

#include <functional>
#include <memory>

#include "NoteMatch.hpp"

namespace drumsync {

/**
 * Receives every accepted input event and its match result.
 */
class InputListener {
public:
    virtual ~InputListener() = default;
    virtual void hitReceived(const InputHit& hit) = 0;
    virtual void noteMatched(const NoteMatchResult& result) = 0;
};

using InputListenerPtr = std::shared_ptr<InputListener>;
using NoteMatchCallback = std::function<void(const NoteMatchResult&)>;
using InputHitCallback = std::function<void(const InputHit&)>;

class InputListenerCallbacks final : public InputListener {
public:
    explicit InputListenerCallbacks(NoteMatchCallback matched, InputHitCallback received = {})
        : matched_(std::move(matched))
        , received_(std::move(received))
    {
    }

    void hitReceived(const InputHit& hit) override {
        if (received_) {
            received_(hit);
        }
    }

    void noteMatched(const NoteMatchResult& result) override {
        if (matched_) {
            matched_(result);
        }
    }

private:
    NoteMatchCallback matched_;
    InputHitCallback received_;
};

} // namespace drumsync
