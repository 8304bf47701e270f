#pragma once

#include <array>
#include <string>

#include "SafetyCurtain.hpp"
#include "data/SettingsStore.hpp"

namespace drumsync {

/**
 * Practice speed multiplier and its per-chart persistence.
 *
 * Speeds are clamped to [0.25, 1.5]; 1.0 plays the chart at its authored tempo.
 * Without a SettingsStore, load and save fall back to the default and do nothing.
 */
class PracticeSettings {
public:
    static constexpr double MIN_SPEED = SafetyLimits::MIN_SPEED;
    static constexpr double MAX_SPEED = SafetyLimits::MAX_SPEED;
    static constexpr double DEFAULT_SPEED = SafetyLimits::DEFAULT_SPEED;
    static constexpr double SPEED_INCREMENT = SafetyLimits::SPEED_STEP;
    static constexpr std::array<double, 4> SPEED_PRESETS = {0.5, 0.75, 1.0, 1.25};

    explicit PracticeSettings(data::SettingsStorePtr store = nullptr);

    /**
     * Set the multiplier, clamped to range. Non-finite values are ignored.
     */
    void setSpeed(double speed);
    void resetSpeed() { setSpeed(DEFAULT_SPEED); }

    void increaseSpeed() { setSpeed(speedMultiplier_ + SPEED_INCREMENT); }
    void decreaseSpeed() { setSpeed(speedMultiplier_ - SPEED_INCREMENT); }

    [[nodiscard]] double getSpeed() const { return speedMultiplier_; }

    [[nodiscard]] double effectiveBpm(double baseBpm) const { return baseBpm * speedMultiplier_; }

    /**
     * "75%"
     */
    [[nodiscard]] std::string formattedSpeed() const;

    /**
     * "90 BPM"
     */
    [[nodiscard]] std::string formattedEffectiveBpm(double baseBpm) const;

    /**
     * Saved speed for a chart, or 1.0 if none is saved.
     */
    [[nodiscard]] double loadSpeed(const std::string& chartId) const;

    void saveSpeed(double speed, const std::string& chartId);
    void loadAndApplySpeed(const std::string& chartId);
    void clearAllSavedSpeeds();

    [[nodiscard]] const data::SettingsStorePtr& getStore() const { return store_; }

private:
    data::SettingsStorePtr store_;
    double speedMultiplier_ = DEFAULT_SPEED;
};

using PracticeSettingsPtr = std::shared_ptr<PracticeSettings>;

} // namespace drumsync
