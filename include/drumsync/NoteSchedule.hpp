#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

namespace drumsync {

/**
 * Notes that sound together, grouped into one schedule entry.
 */
struct DrumBeat {
    uint64_t id = 0;
    double timePosition = 0.0;      // (measureNumber - 1) + measureOffset
    DrumTypeSet drums;
    NoteInterval interval = NoteInterval::Quarter;

    [[nodiscard]] int getMeasureNumber() const;
    [[nodiscard]] double getMeasureOffset() const;
    [[nodiscard]] std::string toString() const;
};

class NoteSchedule;
using NoteSchedulePtr = std::shared_ptr<const NoteSchedule>;

/**
 * Immutable, time-ordered view over a chart's notes.
 *
 * Built once per chart and shared by the PlaybackCoordinator and the
 * InputMatcher. Entry ids come from a process-wide counter and are never
 * reused, so ids from an earlier build cannot collide with a rebuilt schedule.
 * Every lookup is a binary search.
 */
class NoteSchedule {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using ConsumedPredicate = std::function<bool(uint64_t beatId, DrumType drum)>;

    /**
     * Group notes by (measureNumber, measureOffset), compute time positions,
     * assign fresh ids and sort ascending. Offsets are compared at
     * millisecond-of-measure resolution.
     */
    [[nodiscard]] static NoteSchedulePtr build(const std::vector<Note>& notes);

    NoteSchedule(PrivateTag, std::vector<DrumBeat> beats, size_t noteCount)
        : beats_(std::move(beats)), noteCount_(noteCount) {}

    [[nodiscard]] size_t size() const { return beats_.size(); }
    [[nodiscard]] bool empty() const { return beats_.empty(); }
    [[nodiscard]] const DrumBeat& at(size_t index) const { return beats_.at(index); }
    [[nodiscard]] const std::vector<DrumBeat>& getBeats() const { return beats_; }

    auto begin() const { return beats_.begin(); }
    auto end() const { return beats_.end(); }

    /**
     * Greatest index whose time position is <= the query. Returns 0 when the
     * query precedes the first entry, and 0 for an empty schedule, so callers
     * must check empty() before indexing.
     */
    [[nodiscard]] size_t closestIndexAtOrBefore(double timePosition) const;

    /**
     * Entry within tolerance of the given position, preferring the closer
     * of the two neighbours around it.
     */
    [[nodiscard]] std::optional<uint64_t> findActiveBeat(double timePosition, double tolerance) const;

    /**
     * Closest entry containing the drum, no further than maxDistance away
     * and not yet consumed for that drum.
     *
     * @return index into the schedule
     */
    [[nodiscard]] std::optional<size_t> findNearestMatching(
        DrumType drum,
        double timePosition,
        double maxDistance,
        const ConsumedPredicate& isConsumed = {}
    ) const;

    [[nodiscard]] std::optional<size_t> indexOf(uint64_t beatId) const;

    /**
     * Highest zero-based measure index referenced by any entry, or -1 when empty.
     */
    [[nodiscard]] int maxMeasureIndex() const;

    [[nodiscard]] std::optional<double> firstTimePosition() const;

    /**
     * Total number of notes before grouping.
     */
    [[nodiscard]] size_t noteCount() const { return noteCount_; }

private:
    std::vector<DrumBeat> beats_;
    size_t noteCount_ = 0;
};

} // namespace drumsync
