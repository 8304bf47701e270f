#include "drumsync/ScoreTally.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace drumsync {

void ScoreTally::record(const NoteMatchResult& result) {
    counts_[static_cast<size_t>(result.timingAccuracy)]++;
    score_ += POINTS_PER_NOTE * scoreMultiplier(result.timingAccuracy);

    if (result.isHit()) {
        combo_++;
        maxCombo_ = std::max(maxCombo_, combo_);
    } else {
        combo_ = 0;
    }
}

void ScoreTally::reset() {
    counts_.fill(0);
    combo_ = 0;
    maxCombo_ = 0;
    score_ = 0.0;
}

int ScoreTally::getTotal() const {
    int total = 0;
    for (int count : counts_) {
        total += count;
    }
    return total;
}

double ScoreTally::getAccuracy() const {
    const int total = getTotal();
    if (total == 0) {
        return 0.0;
    }
    return score_ / (static_cast<double>(total) * POINTS_PER_NOTE);
}

std::string ScoreTally::toJson() const {
    return fmt::format(
        R"({{"perfect":{},"great":{},"good":{},"miss":{},"combo":{},"max_combo":{},"score":{},"accuracy":{:.4f}}})",
        getCount(TimingAccuracy::Perfect), getCount(TimingAccuracy::Great),
        getCount(TimingAccuracy::Good), getCount(TimingAccuracy::Miss),
        combo_, maxCombo_, getScore(), getAccuracy());
}

} // namespace drumsync
