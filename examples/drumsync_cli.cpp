/**
 * drumsync CLI - Command-Line Interface
 *
 * - JSONL output by default, --human for readable text
 * - --schema for agent introspection
 *
 * Usage:
 *   drumsync_cli --schema                   # Output API schema as JSON
 *   drumsync_cli --parse song.dtx           # Parse a chart and print a summary
 *   drumsync_cli --simulate song.dtx        # Play the chart against scripted hits
 *   drumsync_cli --help                     # Show help
 */

#include <algorithm>
#include <array>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <drumsync/DrumSync.hpp>

namespace {

constexpr double FRAME_SECONDS = 1.0 / 60.0;

// Offsets applied to successive scripted hits, in milliseconds.
constexpr std::array<double, 8> HIT_JITTER_MS = {0.0, 12.0, -20.0, 35.0, -48.0, 75.0, -140.0, 5.0};

struct Options {
    bool showSchema = false;
    bool humanReadable = false;
    bool verbose = false;
    std::optional<std::string> parsePath;
    std::optional<std::string> simulatePath;
    std::optional<double> speed;
    std::optional<drumsync::TimingWindows> windows;
    std::optional<std::string> settingsPath;
};

void printHelp() {
    std::cout << R"(
drumsync CLI v)" << drumsync::Version::STRING << R"(

Usage:
  drumsync_cli [OPTIONS]

Options:
  --schema                   Output API schema as JSON
  --parse <file.dtx>         Parse a DTX chart and print its summary
  --simulate <file.dtx>      Play the chart on a simulated clock against scripted hits (JSONL)
  --speed <multiplier>       Practice speed, 0.25 to 1.5
  --windows <p,g,good[,s]>   Timing thresholds in ms (default 25,50,100,200)
  --settings <db>            SQLite settings database for saved speeds
  --human                    Output in human-readable format
  --verbose                  Include debug log entries
  --help, -h                 Show this help message

Examples:
  drumsync_cli --schema
  drumsync_cli --parse song.dtx --human
  drumsync_cli --simulate song.dtx --speed 0.75 --windows 20,50,100

)" << std::endl;
}

std::optional<drumsync::TimingWindows> parseWindows(const std::string& text) {
    std::vector<double> values;
    size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const std::string part = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        try {
            values.push_back(std::stod(part));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (values.size() < 3 || values.size() > 4) {
        return std::nullopt;
    }

    drumsync::TimingWindows windows;
    windows.perfectMs = values[0];
    windows.greatMs = values[1];
    windows.goodMs = values[2];
    if (values.size() == 4) {
        windows.searchWindowMs = values[3];
    }
    if (!windows.isValid()) {
        return std::nullopt;
    }
    return windows;
}

void emitError(const std::string& message, bool humanReadable) {
    if (humanReadable) {
        std::cerr << "ERROR: " << message << std::endl;
    } else {
        std::cerr << fmt::format(R"({{"event":"error","timestamp_ms":{},"message":"{}"}})",
                                 drumsync::Util::wallClockMs(), drumsync::jsonEscape(message))
                  << std::endl;
    }
}

int runParse(const Options& options) {
    const auto chart = drumsync::data::DtxParser::parseFile(*options.parsePath);
    const auto schedule = drumsync::NoteSchedule::build(chart.notes);

    if (options.humanReadable) {
        std::cout << fmt::format("{} - {}", chart.title, chart.artist) << std::endl;
        std::cout << fmt::format("  {:.1f} BPM, {}, level {} ({})", chart.bpm,
                                 chart.timeSignature.toString(), chart.level,
                                 drumsync::difficultyName(chart.difficulty)) << std::endl;
        std::cout << fmt::format("  {} notes in {} entries over {} measures", chart.notes.size(),
                                 schedule->size(), schedule->maxMeasureIndex() + 1) << std::endl;
        return 0;
    }

    std::cout << fmt::format(
        R"({{"event":"chart","id":"{}","title":"{}","artist":"{}","bpm":{:.2f},"time_signature":"{}","level":{},"difficulty":"{}","notes":{},"entries":{},"measures":{}}})",
        drumsync::jsonEscape(chart.id), drumsync::jsonEscape(chart.title), drumsync::jsonEscape(chart.artist),
        chart.bpm, chart.timeSignature.toString(), chart.level, drumsync::difficultyName(chart.difficulty),
        chart.notes.size(), schedule->size(), schedule->maxMeasureIndex() + 1) << std::endl;
    return 0;
}

/**
 * Scripted hits for every note, offset by a repeating jitter pattern.
 */
std::vector<drumsync::InputHit> scriptHits(const drumsync::NoteSchedule& schedule, double origin,
                                           double secondsPerMeasure) {
    std::vector<drumsync::InputHit> hits;
    size_t n = 0;
    for (const auto& beat : schedule) {
        for (auto drum : beat.drums.toVector()) {
            drumsync::InputHit hit;
            hit.drumType = drum;
            hit.timestamp = origin + beat.timePosition * secondsPerMeasure
                          + HIT_JITTER_MS[n % HIT_JITTER_MS.size()] / 1000.0;
            hit.velocity = 0.8;
            hits.push_back(hit);
            ++n;
        }
    }
    std::stable_sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        return a.timestamp < b.timestamp;
    });
    return hits;
}

int runSimulate(const Options& options) {
    auto chart = drumsync::data::DtxParser::parseFile(*options.simulatePath);

    auto store = options.settingsPath ? drumsync::data::SettingsStore::open(*options.settingsPath) : nullptr;
    auto settings = std::make_shared<drumsync::PracticeSettings>(store);
    auto timeSource = std::make_shared<drumsync::ManualTimeSource>(0.0);

    drumsync::PlaybackCoordinator coordinator(timeSource, nullptr, nullptr, {}, settings);
    if (options.windows) {
        coordinator.getInputMatcher().setTimingWindows(*options.windows);
    }

    drumsync::ScoreTally tally;
    const bool human = options.humanReadable;
    coordinator.getInputMatcher().addInputListener([&tally, human](const drumsync::NoteMatchResult& result) {
        tally.record(result);
        if (human) {
            std::cout << fmt::format("[HIT] {:<8} {:>8.1f} ms  {}", drumsync::drumTypeName(result.hitInput.drumType),
                                     result.timingErrorMs, drumsync::timingAccuracyName(result.timingAccuracy))
                      << std::endl;
        } else {
            std::cout << fmt::format(R"({{"event":"note_match","result":{}}})", result.toJson()) << std::endl;
        }
    });

    coordinator.load(chart);
    if (options.speed) {
        coordinator.updateSpeed(*options.speed);
    }
    coordinator.start();

    const auto origin = coordinator.getInputMatcher().getSongStartTime().value_or(0.0);
    const double secondsPerMeasure = drumsync::Util::secondsPerMeasure(coordinator.effectiveBpm(), chart.timeSignature);
    const auto hits = scriptHits(*coordinator.getSchedule(), origin, secondsPerMeasure);

    if (human) {
        std::cout << fmt::format("Playing '{}' at {} ({:.1f}s)", chart.title,
                                 settings->formattedEffectiveBpm(chart.bpm), coordinator.getTrackDuration())
                  << std::endl;
    } else {
        std::cout << fmt::format(R"({{"event":"started","title":"{}","bpm":{:.2f},"duration":{:.3f}}})",
                                 drumsync::jsonEscape(chart.title), coordinator.effectiveBpm(),
                                 coordinator.getTrackDuration()) << std::endl;
    }

    size_t nextHit = 0;
    int64_t lastBeat = -1;
    const double deadline = coordinator.getTrackDuration() + 5.0;
    while (coordinator.isPlaying() && timeSource->now() < deadline) {
        timeSource->advance(FRAME_SECONDS);
        while (nextHit < hits.size() && hits[nextHit].timestamp <= timeSource->now()) {
            if (!coordinator.getInputMatcher().process(hits[nextHit])) {
                drumsync::Log::debug("drumsync_cli: Hit arrived while not listening");
            }
            ++nextHit;
        }

        coordinator.tick();
        const auto& state = coordinator.getState();
        if (state.isPlaying && state.totalBeatsElapsed != lastBeat) {
            lastBeat = state.totalBeatsElapsed;
            if (!human) {
                std::cout << fmt::format(R"({{"event":"beat","time":{:.3f},"state":{}}})",
                                         timeSource->now(), state.toJson()) << std::endl;
            }
        }
    }

    coordinator.cleanup();

    if (human) {
        std::cout << fmt::format("Done: score {} | perfect {} great {} good {} miss {} | max combo {}",
                                 tally.getScore(),
                                 tally.getCount(drumsync::TimingAccuracy::Perfect),
                                 tally.getCount(drumsync::TimingAccuracy::Great),
                                 tally.getCount(drumsync::TimingAccuracy::Good),
                                 tally.getCount(drumsync::TimingAccuracy::Miss),
                                 tally.getMaxCombo()) << std::endl;
    } else {
        std::cout << fmt::format(R"({{"event":"completed","phase":"{}","score":{}}})",
                                 drumsync::playbackPhaseName(coordinator.getState().phase), tally.toJson())
                  << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        const bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "--schema") == 0) {
            options.showSchema = true;
        } else if (std::strcmp(argv[i], "--parse") == 0 && hasValue) {
            options.parsePath = argv[++i];
        } else if (std::strcmp(argv[i], "--simulate") == 0 && hasValue) {
            options.simulatePath = argv[++i];
        } else if (std::strcmp(argv[i], "--speed") == 0 && hasValue) {
            try {
                options.speed = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid speed: " << argv[i] << std::endl;
                return 1;
            }
        } else if (std::strcmp(argv[i], "--windows") == 0 && hasValue) {
            options.windows = parseWindows(argv[++i]);
            if (!options.windows) {
                std::cerr << "Invalid timing windows: " << argv[i] << std::endl;
                return 1;
            }
        } else if (std::strcmp(argv[i], "--settings") == 0 && hasValue) {
            options.settingsPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            options.humanReadable = false;
        } else if (std::strcmp(argv[i], "--human") == 0) {
            options.humanReadable = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printHelp();
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            printHelp();
            return 1;
        }
    }

    drumsync::Log::setJsonOutput(!options.humanReadable);
    drumsync::Log::setMinimumLevel(options.verbose ? drumsync::LogLevel::Debug : drumsync::LogLevel::Warning);

    if (options.showSchema) {
        std::cout << drumsync::describe_api_json() << std::endl;
        return 0;
    }

    try {
        if (options.parsePath) {
            return runParse(options);
        }
        if (options.simulatePath) {
            return runSimulate(options);
        }
    } catch (const drumsync::data::DtxParseError& e) {
        emitError(e.what(), options.humanReadable);
        return 2;
    } catch (const drumsync::data::SettingsError& e) {
        emitError(e.what(), options.humanReadable);
        return 2;
    } catch (const drumsync::ConfigurationError& e) {
        emitError(e.what(), options.humanReadable);
        return 2;
    }

    // Default: show help
    printHelp();
    return 0;
}
