#include "drumsync/NoteSchedule.hpp"
#include "drumsync/Util.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <map>
#include <utility>

#include <fmt/format.h>

namespace drumsync {

namespace {

std::atomic<uint64_t> nextBeatId{1};

} // namespace

int DrumBeat::getMeasureNumber() const {
    return Util::measureIndex(timePosition) + 1;
}

double DrumBeat::getMeasureOffset() const {
    return timePosition - std::floor(timePosition);
}

std::string DrumBeat::toString() const {
    std::string drumNames;
    for (DrumType drum : drums.toVector()) {
        if (!drumNames.empty()) {
            drumNames += ",";
        }
        drumNames += drumTypeName(drum);
    }
    return fmt::format("DrumBeat[id={}, position={:.3f}, drums={}, interval={}]",
                       id, timePosition, drumNames, noteIntervalName(interval));
}

NoteSchedulePtr NoteSchedule::build(const std::vector<Note>& notes) {
    // Keyed on (measure, offset in thousandths) so iteration is already time-ordered.
    std::map<std::pair<int, int>, DrumBeat> groups;

    for (const Note& note : notes) {
        const auto key = std::make_pair(note.measureNumber, Util::offsetKey(note.measureOffset));
        auto [it, inserted] = groups.try_emplace(key);
        DrumBeat& beat = it->second;
        if (inserted) {
            beat.timePosition = Util::timePosition(note.measureNumber, note.measureOffset);
            beat.interval = note.interval;
        }
        beat.drums.insert(note.drumType);
    }

    std::vector<DrumBeat> beats;
    beats.reserve(groups.size());
    for (auto& [key, beat] : groups) {
        beats.push_back(std::move(beat));
    }

    std::stable_sort(beats.begin(), beats.end(), [](const DrumBeat& a, const DrumBeat& b) {
        return a.timePosition < b.timePosition;
    });

    for (DrumBeat& beat : beats) {
        beat.id = nextBeatId.fetch_add(1);
    }

    return std::make_shared<const NoteSchedule>(PrivateTag{}, std::move(beats), notes.size());
}

size_t NoteSchedule::closestIndexAtOrBefore(double timePosition) const {
    if (beats_.empty()) {
        return 0;
    }

    auto it = std::upper_bound(beats_.begin(), beats_.end(), timePosition,
        [](double value, const DrumBeat& beat) {
            return value < beat.timePosition;
        });

    if (it == beats_.begin()) {
        return 0;
    }
    return static_cast<size_t>(std::distance(beats_.begin(), it)) - 1;
}

std::optional<uint64_t> NoteSchedule::findActiveBeat(double timePosition, double tolerance) const {
    if (beats_.empty()) {
        return std::nullopt;
    }

    const size_t index = closestIndexAtOrBefore(timePosition);
    std::optional<size_t> best;
    double bestDistance = tolerance;

    for (size_t candidate : {index, index + 1}) {
        if (candidate >= beats_.size()) {
            continue;
        }
        const double distance = std::abs(beats_[candidate].timePosition - timePosition);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = candidate;
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return beats_[*best].id;
}

std::optional<size_t> NoteSchedule::findNearestMatching(
    DrumType drum,
    double timePosition,
    double maxDistance,
    const ConsumedPredicate& isConsumed
) const {
    if (beats_.empty()) {
        return std::nullopt;
    }

    auto usable = [&](size_t i) {
        const DrumBeat& beat = beats_[i];
        return beat.drums.contains(drum) && !(isConsumed && isConsumed(beat.id, drum));
    };

    // Walk outward from the insertion point until both sides leave the window.
    const auto split = std::lower_bound(beats_.begin(), beats_.end(), timePosition,
        [](const DrumBeat& beat, double value) {
            return beat.timePosition < value;
        });
    const auto splitIndex = static_cast<size_t>(std::distance(beats_.begin(), split));

    std::optional<size_t> before;
    for (size_t i = splitIndex; i > 0; --i) {
        if (timePosition - beats_[i - 1].timePosition > maxDistance) {
            break;
        }
        if (usable(i - 1)) {
            before = i - 1;
            break;
        }
    }

    std::optional<size_t> after;
    for (size_t i = splitIndex; i < beats_.size(); ++i) {
        if (beats_[i].timePosition - timePosition > maxDistance) {
            break;
        }
        if (usable(i)) {
            after = i;
            break;
        }
    }

    if (before && after) {
        const double distanceBefore = timePosition - beats_[*before].timePosition;
        const double distanceAfter = beats_[*after].timePosition - timePosition;
        return distanceBefore <= distanceAfter ? before : after;
    }
    return before ? before : after;
}

std::optional<size_t> NoteSchedule::indexOf(uint64_t beatId) const {
    // Ids are assigned in sorted order, so they are ascending too.
    auto it = std::lower_bound(beats_.begin(), beats_.end(), beatId,
        [](const DrumBeat& beat, uint64_t id) {
            return beat.id < id;
        });
    if (it == beats_.end() || it->id != beatId) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(beats_.begin(), it));
}

int NoteSchedule::maxMeasureIndex() const {
    if (beats_.empty()) {
        return -1;
    }
    return Util::measureIndex(beats_.back().timePosition);
}

std::optional<double> NoteSchedule::firstTimePosition() const {
    if (beats_.empty()) {
        return std::nullopt;
    }
    return beats_.front().timePosition;
}

} // namespace drumsync
