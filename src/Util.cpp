#include "drumsync/Util.hpp"

#include <charconv>
#include <chrono>

namespace drumsync {

std::optional<double> Util::parseDuration(std::string_view text) noexcept {
    const auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    const auto minutesText = text.substr(0, colon);
    const auto secondsText = text.substr(colon + 1);

    int minutes = 0;
    int seconds = 0;
    auto [minutesEnd, minutesErr] = std::from_chars(
        minutesText.data(), minutesText.data() + minutesText.size(), minutes);
    auto [secondsEnd, secondsErr] = std::from_chars(
        secondsText.data(), secondsText.data() + secondsText.size(), seconds);

    if (minutesErr != std::errc{} || secondsErr != std::errc{}) {
        return std::nullopt;
    }
    if (minutesEnd != minutesText.data() + minutesText.size() ||
        secondsEnd != secondsText.data() + secondsText.size()) {
        return std::nullopt;
    }
    if (minutes < 0 || seconds < 0 || seconds >= 60) {
        return std::nullopt;
    }
    return static_cast<double>(minutes * 60 + seconds);
}

std::string Util::formatDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    const auto total = static_cast<int64_t>(seconds);
    return fmt::format("{}:{:02}", total / 60, total % 60);
}

int64_t Util::wallClockMs() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace drumsync
