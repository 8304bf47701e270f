#include "drumsync/data/DtxParser.hpp"
#include "drumsync/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

namespace drumsync::data {

namespace {

struct Header {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<double> bpm;
    std::optional<int> level;
    std::optional<std::string> preview;
    std::optional<std::string> previewImage;
    std::optional<std::string> stageFile;
};

std::string_view trim(std::string_view text) {
    const auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!text.empty() && isSpace(text.front())) text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back())) text.remove_suffix(1);
    return text;
}

bool isUpperHex(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'A' && c <= 'F');
}

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

/**
 * Value after "#KEY:", or nothing if the line has a different key.
 */
std::optional<std::string_view> headerValue(std::string_view line, std::string_view key) {
    if (line.size() < key.size() + 2 || line[0] != '#') {
        return std::nullopt;
    }
    if (line.substr(1, key.size()) != key || line[key.size() + 1] != ':') {
        return std::nullopt;
    }
    return trim(line.substr(key.size() + 2));
}

void processHeaderLine(std::string_view line, Header& header) {
    if (auto value = headerValue(line, "TITLE")) {
        header.title = std::string(*value);
    } else if (auto value = headerValue(line, "ARTIST")) {
        header.artist = std::string(*value);
    } else if (auto value = headerValue(line, "BPM")) {
        header.bpm = parseNumber<double>(*value);
        if (!header.bpm) {
            throw DtxParseError(DtxParseError::Kind::InvalidBpm,
                                fmt::format("DtxParser: Invalid BPM '{}'", *value));
        }
    } else if (auto value = headerValue(line, "DLEVEL")) {
        header.level = parseNumber<int>(*value);
        if (!header.level) {
            throw DtxParseError(DtxParseError::Kind::InvalidLevel,
                                fmt::format("DtxParser: Invalid difficulty level '{}'", *value));
        }
    } else if (auto value = headerValue(line, "PREVIEW")) {
        header.preview = std::string(*value);
    } else if (auto value = headerValue(line, "PREIMAGE")) {
        header.previewImage = std::string(*value);
    } else if (auto value = headerValue(line, "STAGEFILE")) {
        header.stageFile = std::string(*value);
    }
}

void requireField(bool present, DtxParseError::Kind kind, const char* field) {
    if (!present) {
        throw DtxParseError(kind, fmt::format("DtxParser: Missing required field {}", field));
    }
}

} // namespace

bool DtxParser::isNoteLine(std::string_view line) {
    // #mmmLL: with a three-digit measure and a two-hex-digit lane
    if (line.size() < 7 || line[0] != '#' || line[6] != ':') {
        return false;
    }
    for (size_t i = 1; i <= 3; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            return false;
        }
    }
    return isUpperHex(line[4]) && isUpperHex(line[5]);
}

std::vector<DtxChip> DtxParser::parseNoteLine(std::string_view line) {
    std::vector<DtxChip> chips;
    if (!isNoteLine(line)) {
        return chips;
    }

    const auto measure = parseNumber<int>(line.substr(1, 3));
    std::string chipText;
    for (char c : trim(line.substr(7))) {
        if (c != '_' && c != ' ' && c != '\t') {
            chipText += c;
        }
    }
    if (!measure || chipText.empty() || chipText.size() % 2 != 0) {
        return chips;
    }

    const int positions = static_cast<int>(chipText.size() / 2);
    for (int i = 0; i < positions; ++i) {
        std::string value = chipText.substr(static_cast<size_t>(i) * 2, 2);
        if (value == "00") {
            continue;
        }
        DtxChip chip;
        chip.measure = *measure;
        chip.lane = std::string(line.substr(4, 2));
        chip.value = std::move(value);
        chip.position = i;
        chip.positions = positions;
        chips.push_back(std::move(chip));
    }
    return chips;
}

std::optional<DrumType> DtxParser::drumForLane(std::string_view lane) {
    std::string upper(lane);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "1A" || upper == "16") return DrumType::Crash;
    if (upper == "18" || upper == "11") return DrumType::HiHat;
    if (upper == "1B") return DrumType::HiHatPedal;
    if (upper == "12") return DrumType::Snare;
    if (upper == "14") return DrumType::Tom1;
    if (upper == "13") return DrumType::Kick;
    if (upper == "15") return DrumType::Tom2;
    if (upper == "17") return DrumType::Tom3;
    if (upper == "19") return DrumType::Ride;
    return std::nullopt;
}

Chart DtxParser::parse(std::string_view text, const std::string& chartId) {
    Header header;
    Chart chart;
    chart.id = chartId;
    size_t skipped = 0;

    while (!text.empty()) {
        const auto newline = text.find('\n');
        const std::string_view line = trim(text.substr(0, newline));
        text = newline == std::string_view::npos ? std::string_view() : text.substr(newline + 1);

        if (isNoteLine(line)) {
            for (const auto& chip : parseNoteLine(line)) {
                const auto drum = drumForLane(chip.lane);
                if (!drum) {
                    ++skipped;
                    continue;
                }
                Note note;
                note.measureNumber = chip.measure + 1;
                note.measureOffset = chip.getMeasureOffset();
                note.interval = noteIntervalForSubdivision(chip.positions);
                note.drumType = *drum;
                chart.notes.push_back(note);
            }
        } else {
            processHeaderLine(line, header);
        }
    }

    requireField(header.title.has_value(), DtxParseError::Kind::MissingTitle, "TITLE");
    requireField(header.artist.has_value(), DtxParseError::Kind::MissingArtist, "ARTIST");
    requireField(header.bpm.has_value(), DtxParseError::Kind::MissingBpm, "BPM");
    requireField(header.level.has_value(), DtxParseError::Kind::MissingLevel, "DLEVEL");

    chart.title = *header.title;
    chart.artist = *header.artist;
    chart.bpm = *header.bpm;
    chart.level = *header.level;
    chart.difficulty = difficultyForLevel(chart.level);
    chart.timeSignature = TimeSignature{4, 4};
    chart.previewPath = header.preview;
    chart.imagePath = header.previewImage ? header.previewImage : header.stageFile;

    Log::debug(fmt::format("DtxParser: Parsed '{}' by {} ({} notes, {} non-drum chips)",
                           chart.title, chart.artist, chart.notes.size(), skipped));
    return chart;
}

Chart DtxParser::parseFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw DtxParseError(DtxParseError::Kind::FileNotFound,
                            fmt::format("DtxParser: Cannot open {}", path));
    }
    std::ostringstream content;
    content << file.rdbuf();
    return parse(content.str(), std::filesystem::path(path).stem().string());
}

} // namespace drumsync::data
