#include "drumsync/Types.hpp"

#include <charconv>
#include <fmt/format.h>

namespace drumsync {

std::string_view drumTypeName(DrumType type) noexcept {
    switch (type) {
        case DrumType::Kick:       return "kick";
        case DrumType::Snare:      return "snare";
        case DrumType::HiHat:      return "hiHat";
        case DrumType::HiHatPedal: return "hiHatPedal";
        case DrumType::Crash:      return "crash";
        case DrumType::Ride:       return "ride";
        case DrumType::Tom1:       return "tom1";
        case DrumType::Tom2:       return "tom2";
        case DrumType::Tom3:       return "tom3";
        case DrumType::Cowbell:    return "cowbell";
    }
    return "unknown";
}

std::optional<DrumType> drumTypeFromName(std::string_view name) noexcept {
    for (DrumType type : ALL_DRUM_TYPES) {
        if (drumTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string_view drumTypeDisplayName(DrumType type) noexcept {
    switch (type) {
        case DrumType::Kick:       return "Kick";
        case DrumType::Snare:      return "Snare";
        case DrumType::HiHat:      return "Hi-Hat";
        case DrumType::HiHatPedal: return "Hi-Hat Pedal";
        case DrumType::Crash:      return "Crash";
        case DrumType::Ride:       return "Ride";
        case DrumType::Tom1:       return "High Tom";
        case DrumType::Tom2:       return "Mid Tom";
        case DrumType::Tom3:       return "Floor Tom";
        case DrumType::Cowbell:    return "Cowbell";
    }
    return "Unknown";
}

std::vector<DrumType> DrumTypeSet::toVector() const {
    std::vector<DrumType> result;
    result.reserve(static_cast<size_t>(size()));
    for (DrumType type : ALL_DRUM_TYPES) {
        if (contains(type)) {
            result.push_back(type);
        }
    }
    return result;
}

std::string_view noteIntervalName(NoteInterval interval) noexcept {
    switch (interval) {
        case NoteInterval::Full:         return "full";
        case NoteInterval::Half:         return "half";
        case NoteInterval::Quarter:      return "quarter";
        case NoteInterval::Eighth:       return "eighth";
        case NoteInterval::Sixteenth:    return "sixteenth";
        case NoteInterval::ThirtySecond: return "thirtysecond";
        case NoteInterval::SixtyFourth:  return "sixtyfourth";
    }
    return "quarter";
}

NoteInterval noteIntervalForSubdivision(int positionsPerMeasure) noexcept {
    switch (positionsPerMeasure) {
        case 1:  return NoteInterval::Full;
        case 2:  return NoteInterval::Half;
        case 4:  return NoteInterval::Quarter;
        case 8:  return NoteInterval::Eighth;
        case 16: return NoteInterval::Sixteenth;
        case 32: return NoteInterval::ThirtySecond;
        case 64: return NoteInterval::SixtyFourth;
        default: return NoteInterval::Quarter;
    }
}

std::string TimeSignature::toString() const {
    return fmt::format("{}/{}", beatsPerMeasure, noteValue);
}

std::optional<TimeSignature> TimeSignature::parse(std::string_view text) {
    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    TimeSignature result;
    const auto top = text.substr(0, slash);
    const auto bottom = text.substr(slash + 1);
    auto [topEnd, topErr] = std::from_chars(top.data(), top.data() + top.size(), result.beatsPerMeasure);
    auto [bottomEnd, bottomErr] = std::from_chars(bottom.data(), bottom.data() + bottom.size(), result.noteValue);
    if (topErr != std::errc{} || bottomErr != std::errc{} ||
        topEnd != top.data() + top.size() || bottomEnd != bottom.data() + bottom.size()) {
        return std::nullopt;
    }
    if (!result.isValid()) {
        return std::nullopt;
    }
    return result;
}

std::string_view difficultyName(Difficulty difficulty) noexcept {
    switch (difficulty) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
        case Difficulty::Expert: return "expert";
    }
    return "medium";
}

Difficulty difficultyForLevel(int level) noexcept {
    if (level >= 0 && level <= 30) return Difficulty::Easy;
    if (level >= 31 && level <= 50) return Difficulty::Medium;
    if (level >= 51 && level <= 70) return Difficulty::Hard;
    if (level >= 71 && level <= 100) return Difficulty::Expert;
    return Difficulty::Medium;
}

} // namespace drumsync
