#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "NoteMatch.hpp"

namespace drumsync {

/**
 * Running totals for one play-through.
 */
class ScoreTally {
public:
    static constexpr int POINTS_PER_NOTE = 100;

    void record(const NoteMatchResult& result);
    void reset();

    [[nodiscard]] int getCount(TimingAccuracy accuracy) const {
        return counts_[static_cast<size_t>(accuracy)];
    }
    [[nodiscard]] int getTotal() const;
    [[nodiscard]] int getCombo() const { return combo_; }
    [[nodiscard]] int getMaxCombo() const { return maxCombo_; }
    [[nodiscard]] int64_t getScore() const { return static_cast<int64_t>(score_); }

    /**
     * Weighted hit ratio in [0, 1], or 0 with nothing recorded.
     */
    [[nodiscard]] double getAccuracy() const;

    [[nodiscard]] std::string toJson() const;

private:
    std::array<int, 4> counts_{};
    int combo_ = 0;
    int maxCombo_ = 0;
    double score_ = 0.0;
};

} // namespace drumsync
