#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drumsync {

/**
 * Library version information.
 */
struct Version {
    static constexpr int MAJOR = 0;
    static constexpr int MINOR = 1;
    static constexpr int PATCH = 0;
    static constexpr const char* STRING = "0.1.0";
};

/**
 * The drum pieces a chart can address.
 */
enum class DrumType : uint8_t {
    Kick,
    Snare,
    HiHat,
    HiHatPedal,
    Crash,
    Ride,
    Tom1,
    Tom2,
    Tom3,
    Cowbell
};

inline constexpr std::array<DrumType, 10> ALL_DRUM_TYPES = {
    DrumType::Kick, DrumType::Snare, DrumType::HiHat, DrumType::HiHatPedal, DrumType::Crash,
    DrumType::Ride, DrumType::Tom1, DrumType::Tom2, DrumType::Tom3, DrumType::Cowbell
};

/**
 * Stable identifier for a drum, used in persisted settings and JSON output.
 */
[[nodiscard]] std::string_view drumTypeName(DrumType type) noexcept;
[[nodiscard]] std::optional<DrumType> drumTypeFromName(std::string_view name) noexcept;

/**
 * Human-readable drum label ("Hi-Hat Pedal").
 */
[[nodiscard]] std::string_view drumTypeDisplayName(DrumType type) noexcept;

/**
 * Small value set of drum types, one bit per drum.
 */
class DrumTypeSet {
public:
    constexpr DrumTypeSet() = default;

    constexpr void insert(DrumType type) noexcept { bits_ |= bit(type); }

    [[nodiscard]] constexpr bool contains(DrumType type) const noexcept { return (bits_ & bit(type)) != 0; }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] int size() const noexcept { return std::popcount(bits_); }
    [[nodiscard]] constexpr uint16_t bits() const noexcept { return bits_; }

    [[nodiscard]] std::vector<DrumType> toVector() const;

    bool operator==(const DrumTypeSet&) const = default;

private:
    static constexpr uint16_t bit(DrumType type) noexcept {
        return static_cast<uint16_t>(1u << static_cast<unsigned>(type));
    }

    uint16_t bits_ = 0;
};

/**
 * Written note duration.
 */
enum class NoteInterval : uint8_t {
    Full,
    Half,
    Quarter,
    Eighth,
    Sixteenth,
    ThirtySecond,
    SixtyFourth
};

[[nodiscard]] std::string_view noteIntervalName(NoteInterval interval) noexcept;

/**
 * Interval implied by the number of slots a measure is divided into.
 * Unusual subdivisions fall back to quarter notes.
 */
[[nodiscard]] NoteInterval noteIntervalForSubdivision(int positionsPerMeasure) noexcept;

struct TimeSignature {
    int beatsPerMeasure = 4;
    int noteValue = 4;

    [[nodiscard]] bool isValid() const noexcept { return beatsPerMeasure > 0 && noteValue > 0; }
    [[nodiscard]] std::string toString() const;

    /**
     * Parse "n/d", e.g. "6/8".
     */
    [[nodiscard]] static std::optional<TimeSignature> parse(std::string_view text);

    bool operator==(const TimeSignature&) const = default;
};

inline constexpr std::array<TimeSignature, 8> COMMON_TIME_SIGNATURES = {{
    {4, 4}, {3, 4}, {2, 4}, {6, 8}, {5, 4}, {7, 8}, {9, 8}, {12, 8}
}};

/**
 * A single authored note.
 * measureNumber is 1-based and measureOffset is the fraction of the measure in [0, 1).
 */
struct Note {
    int measureNumber = 1;
    double measureOffset = 0.0;
    NoteInterval interval = NoteInterval::Quarter;
    DrumType drumType = DrumType::Kick;
};

enum class Difficulty : uint8_t {
    Easy,
    Medium,
    Hard,
    Expert
};

[[nodiscard]] std::string_view difficultyName(Difficulty difficulty) noexcept;

/**
 * Map a 0-100 chart level onto a difficulty band. Out-of-range levels are Medium.
 */
[[nodiscard]] Difficulty difficultyForLevel(int level) noexcept;

/**
 * Read-only chart data handed to the timing core.
 */
struct Chart {
    std::string id;
    std::string title;
    std::string artist;
    double bpm = 120.0;
    TimeSignature timeSignature;
    std::string duration;                 // authored "m:ss", may be empty
    int level = 50;
    Difficulty difficulty = Difficulty::Medium;
    std::optional<std::string> bgmPath;
    std::optional<std::string> previewPath;
    std::optional<std::string> imagePath;
    std::vector<Note> notes;
};

} // namespace drumsync
