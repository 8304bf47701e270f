#include "drumsync/PracticeSettings.hpp"
#include "drumsync/Log.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace drumsync {

PracticeSettings::PracticeSettings(data::SettingsStorePtr store)
    : store_(std::move(store))
{
}

void PracticeSettings::setSpeed(double speed) {
    if (!std::isfinite(speed)) {
        Log::warning("PracticeSettings: Invalid speed value (non-finite), ignoring");
        return;
    }

    // Snap values within rounding error of the step grid.
    const double stepped = std::round(speed / SPEED_INCREMENT) * SPEED_INCREMENT;
    const double snapped = std::abs(stepped - speed) < 1e-9 ? stepped : speed;
    speedMultiplier_ = std::clamp(snapped, MIN_SPEED, MAX_SPEED);
    Log::debug(fmt::format("PracticeSettings: Speed set to {}", formattedSpeed()));
}

std::string PracticeSettings::formattedSpeed() const {
    return fmt::format("{}%", static_cast<int>(std::lround(speedMultiplier_ * 100.0)));
}

std::string PracticeSettings::formattedEffectiveBpm(double baseBpm) const {
    return fmt::format("{} BPM", static_cast<int>(effectiveBpm(baseBpm)));
}

double PracticeSettings::loadSpeed(const std::string& chartId) const {
    if (!store_) {
        return DEFAULT_SPEED;
    }
    try {
        return store_->loadSpeed(chartId).value_or(DEFAULT_SPEED);
    } catch (const data::SettingsError& e) {
        Log::warning(fmt::format("PracticeSettings: Cannot load speed for {}: {}", chartId, e.what()));
        return DEFAULT_SPEED;
    }
}

void PracticeSettings::saveSpeed(double speed, const std::string& chartId) {
    if (!store_) {
        return;
    }
    try {
        store_->saveSpeed(chartId, speed);
        Log::debug(fmt::format("PracticeSettings: Saved speed {}% for chart {}",
                               static_cast<int>(std::lround(speed * 100.0)), chartId));
    } catch (const data::SettingsError& e) {
        Log::warning(fmt::format("PracticeSettings: Cannot save speed for {}: {}", chartId, e.what()));
    }
}

void PracticeSettings::loadAndApplySpeed(const std::string& chartId) {
    setSpeed(loadSpeed(chartId));
}

void PracticeSettings::clearAllSavedSpeeds() {
    if (!store_) {
        return;
    }
    try {
        store_->clearSpeeds();
        Log::debug("PracticeSettings: Cleared all saved speed settings");
    } catch (const data::SettingsError& e) {
        Log::warning(fmt::format("PracticeSettings: Cannot clear saved speeds: {}", e.what()));
    }
}

} // namespace drumsync
