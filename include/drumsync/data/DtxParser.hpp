#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../Types.hpp"

namespace drumsync::data {

class DtxParseError : public std::runtime_error {
public:
    enum class Kind {
        FileNotFound,
        MissingTitle,
        MissingArtist,
        MissingBpm,
        MissingLevel,
        InvalidBpm,
        InvalidLevel
    };

    DtxParseError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind)
    {
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/**
 * One chip from a "#mmmLL: ..." line, before lane mapping.
 */
struct DtxChip {
    int measure = 0;                // zero-based as written
    std::string lane;               // two hex digits, e.g. "13"
    std::string value;              // two-character chip id, never "00"
    int position = 0;
    int positions = 1;              // slots in this line

    [[nodiscard]] double getMeasureOffset() const {
        return positions > 0 ? static_cast<double>(position) / positions : 0.0;
    }
};

/**
 * Reads DTXMania chart text.
 *
 * Header fields (#TITLE:, #ARTIST:, #BPM:, #DLEVEL:, #PREVIEW:, #PREIMAGE:,
 * #STAGEFILE:) fill the chart metadata. Note lines "#mmmLL: pairs" split
 * the measure evenly between the two-character chips on the line; "00"
 * is a rest. Measures become 1-based. Lanes without a drum (BGM 01,
 * BPM change 08, left bass 1C) and unknown lanes are dropped. Charts are
 * always 4/4.
 */
class DtxParser {
public:
    /**
     * @throws DtxParseError if a required header is missing or BPM/DLEVEL is not a number
     */
    [[nodiscard]] static Chart parse(std::string_view text, const std::string& chartId = {});

    /**
     * Parse a file. The chart id is the file name without its extension.
     *
     * @throws DtxParseError if the file cannot be read or does not parse
     */
    [[nodiscard]] static Chart parseFile(const std::string& path);

    /**
     * Split one note line into its chips. Returns nothing for lines that
     * are not note lines or whose chip list has an odd length.
     */
    [[nodiscard]] static std::vector<DtxChip> parseNoteLine(std::string_view line);

    [[nodiscard]] static bool isNoteLine(std::string_view line);

    [[nodiscard]] static std::optional<DrumType> drumForLane(std::string_view lane);

private:
    DtxParser() = delete;
};

} // namespace drumsync::data
