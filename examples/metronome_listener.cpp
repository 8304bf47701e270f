/**
 * drumsync Example - Metronome Listener
 *
 * This example demonstrates how to:
 * 1. Start a drift-free Metronome on the steady clock
 * 2. Listen for beat events and check them against a BeatClock
 * 3. Stop cleanly on Ctrl+C
 *
 * Usage: metronome_listener [bpm] [beats-per-measure]
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <fmt/format.h>

#include <drumsync/DrumSync.hpp>

std::atomic<bool> running{true};

void signalHandler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    const double bpm = drumsync::SafetyCurtain::sanitizeMetronomeBpm(argc > 1 ? std::atof(argv[1]) : 120.0);
    drumsync::TimeSignature timeSignature;
    if (argc > 2) {
        timeSignature.beatsPerMeasure = drumsync::SafetyCurtain::clampInt(std::atoi(argv[2]), 1, 16);
    }

    std::cout << "drumsync v" << drumsync::Version::STRING << std::endl;
    std::cout << "==============================" << std::endl;
    std::cout << fmt::format("Metronome at {:.1f} BPM in {}. Press Ctrl+C to exit.", bpm,
                             timeSignature.toString()) << std::endl;
    std::cout << std::endl;

    std::signal(SIGINT, signalHandler);

    auto timeSource = drumsync::SteadyTimeSource::shared();
    drumsync::BeatClock clock(timeSource);
    drumsync::Metronome metronome(timeSource);

    // Beats fire on the metronome thread
    const int beatsPerMeasure = timeSignature.beatsPerMeasure;
    metronome.addBeatListener([&timeSource, beatsPerMeasure](const drumsync::BeatEvent& beat) {
        const double lateMs = (timeSource->now() - beat.scheduledTime) * 1000.0;
        std::cout << fmt::format("[BEAT] {:5d} | {}/{} {} | late {:5.2f} ms",
                                 beat.beatNumber, beat.beatInMeasure + 1, beatsPerMeasure,
                                 beat.accented ? "*" : " ", lateMs) << std::endl;
    });

    const double reference = timeSource->now() + 0.05;
    clock.startAtTime(bpm, timeSignature, reference);
    metronome.start(bpm, timeSignature, reference);

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Cleanup
    const auto progress = clock.currentBeatProgress();
    metronome.stop();
    clock.stop();

    std::cout << std::endl;
    if (progress) {
        std::cout << fmt::format("Stopped after {:.2f} beats ({} delivered).", progress->totalBeats,
                                 metronome.getBeatsDelivered()) << std::endl;
    }
    std::cout << "Goodbye!" << std::endl;
    return 0;
}
