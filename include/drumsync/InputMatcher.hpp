#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "InputListener.hpp"
#include "NoteMatch.hpp"
#include "NoteSchedule.hpp"
#include "Types.hpp"

namespace drumsync {

/**
 * Matches live input against the shared NoteSchedule.
 *
 * Hit timestamps are converted into the same measure-relative coordinates
 * as the schedule using the song start time established by the
 * PlaybackCoordinator. Each (entry, drum) pair can be claimed by one hit only.
 *
 * process() may be called from an input thread; configuration and
 * listening state are guarded by a mutex and listeners are called without it.
 */
class InputMatcher {
public:
    explicit InputMatcher(TimingWindows windows = {});

    /**
     * Set tempo and the shared schedule to match against. Clears consumed notes.
     *
     * @throws ConfigurationError for a non-positive bpm, an invalid time signature or a null schedule
     */
    void configure(double bpm, const TimeSignature& timeSignature, NoteSchedulePtr schedule);

    /**
     * Change tempo mid-song, keeping the schedule and consumed notes.
     *
     * @throws ConfigurationError for a non-positive bpm
     */
    void updateTempo(double bpm);

    [[nodiscard]] bool isConfigured() const;

    /**
     * @throws ConfigurationError if the thresholds are not ordered perfect <= great <= good <= search
     */
    void setTimingWindows(const TimingWindows& windows);
    [[nodiscard]] TimingWindows getTimingWindows() const;

    /**
     * Begin accepting input. songStartTime is the time-source instant that
     * corresponds to time position 0.
     */
    void startListening(double songStartTime);

    /**
     * Stop accepting input. Safe to call when already stopped.
     *
     * @return true if this call changed the state
     */
    bool stopListening();

    [[nodiscard]] bool isListening() const;
    [[nodiscard]] std::optional<double> getSongStartTime() const;

    /**
     * Match one hit. Returns std::nullopt when not listening or not configured.
     * A hit with no same-drum note inside the search window is a Miss with
     * no matched note.
     */
    std::optional<NoteMatchResult> process(const InputHit& hit);

    /**
     * Time position of a time-source instant, relative to the current song start.
     */
    [[nodiscard]] std::optional<double> timePositionAt(double timestamp) const;

    /**
     * Forget which notes have been hit, e.g. on restart.
     */
    void resetConsumed();
    [[nodiscard]] size_t consumedCount() const;

    void addInputListener(const InputListenerPtr& listener);
    void addInputListener(NoteMatchCallback callback);
    void removeInputListener(const InputListenerPtr& listener);
    void clearListeners();

private:
    void deliverHitReceived(const InputHit& hit);
    void deliverNoteMatched(const NoteMatchResult& result);

    mutable std::mutex mutex_;
    TimingWindows windows_;
    double bpm_ = 120.0;
    TimeSignature timeSignature_;
    NoteSchedulePtr schedule_;
    bool listening_ = false;
    double songStartTime_ = 0.0;
    std::set<std::pair<uint64_t, DrumType>> consumed_;

    mutable std::mutex listenersMutex_;
    std::vector<InputListenerPtr> listeners_;
};

} // namespace drumsync
