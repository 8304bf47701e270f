/**
 * @file test_metronome.cpp
 * @brief Unit tests for Metronome beat scheduling and delivery
 */

#include <catch2/catch_all.hpp>
#include <drumsync/Errors.hpp>
#include <drumsync/Metronome.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace drumsync;
using namespace std::chrono_literals;

namespace {

/**
 * Collects the first beats a metronome delivers.
 */
class BeatRecorder {
public:
    explicit BeatRecorder(size_t capacity) : capacity_(capacity) {}

    void record(const BeatEvent& beat) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (beats_.size() < capacity_) {
            beats_.push_back(beat);
        }
    }

    bool waitForBeats(size_t count, std::chrono::milliseconds maxWait) const {
        const auto deadline = std::chrono::steady_clock::now() + maxWait;
        while (std::chrono::steady_clock::now() < deadline) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (beats_.size() >= count) {
                    return true;
                }
            }
            std::this_thread::sleep_for(1ms);
        }
        return false;
    }

    std::vector<BeatEvent> beats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return beats_;
    }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<BeatEvent> beats_;
};

class RecordingClickSink : public ClickSink {
public:
    void playClick(double volume, bool accented) override {
        std::lock_guard<std::mutex> lock(mutex);
        clicks.push_back({volume, accented});
    }

    struct Click {
        double volume;
        bool accented;
    };

    std::mutex mutex;
    std::vector<Click> clicks;
};

} // namespace

TEST_CASE("Metronome validation", "[Metronome]") {
    CHECK_THROWS_AS(Metronome(nullptr), ConfigurationError);

    Metronome metronome(std::make_shared<ManualTimeSource>());
    CHECK_THROWS_AS(metronome.start(0.0, TimeSignature{}, 0.0), ConfigurationError);
    CHECK_THROWS_AS(metronome.start(120.0, TimeSignature{0, 4}, 0.0), ConfigurationError);
    CHECK_FALSE(metronome.isRunning());
}

TEST_CASE("Metronome deadlines are absolute", "[Metronome]") {
    CHECK(Metronome::beatDeadline(10.0, 120.0, 0) == 10.0);
    CHECK(Metronome::beatDeadline(10.0, 120.0, 3) == Catch::Approx(11.5));
    CHECK(Metronome::beatDeadline(10.0, 90.0, 1000) == Catch::Approx(10.0 + 1000 * (60.0 / 90.0)));
}

TEST_CASE("Metronome volume", "[Metronome]") {
    Metronome metronome(std::make_shared<ManualTimeSource>());
    CHECK(metronome.getVolume() == Catch::Approx(Metronome::DEFAULT_VOLUME));

    metronome.setVolume(2.0);
    CHECK(metronome.getVolume() == 1.0);
    metronome.setVolume(0.5);
    CHECK(metronome.getVolume() == 0.5);

    CHECK(Metronome::accentedVolume(0.5) == Catch::Approx(0.65));
    CHECK(Metronome::accentedVolume(0.9) == 1.0);

    auto sink = std::make_shared<RecordingClickSink>();
    metronome.setClickSink(sink);
    metronome.testClick();
    REQUIRE(sink->clicks.size() == 1);
    CHECK(sink->clicks[0].accented);
    CHECK(sink->clicks[0].volume == Catch::Approx(0.65));
}

TEST_CASE("Metronome delivers beats from the reference", "[Metronome]") {
    // The reference is far in the past so every deadline is already due.
    auto time = std::make_shared<ManualTimeSource>(1000.0);
    Metronome metronome(time);
    auto recorder = std::make_shared<BeatRecorder>(8);
    metronome.addBeatListener([recorder](const BeatEvent& beat) { recorder->record(beat); });

    SECTION("Fresh run counts from zero with the downbeat accented") {
        auto sink = std::make_shared<RecordingClickSink>();
        metronome.setClickSink(sink);
        metronome.start(120.0, TimeSignature{4, 4}, 0.0);
        REQUIRE(recorder->waitForBeats(5, 2000ms));
        metronome.stop();

        const auto beats = recorder->beats();
        CHECK(beats[0].beatNumber == 0);
        CHECK(beats[0].accented);
        CHECK(beats[1].beatInMeasure == 1);
        CHECK_FALSE(beats[1].accented);
        CHECK(beats[4].beatNumber == 4);
        CHECK(beats[4].accented);
        CHECK(beats[3].scheduledTime == Catch::Approx(1.5));

        std::lock_guard<std::mutex> lock(sink->mutex);
        REQUIRE(sink->clicks.size() >= 2);
        CHECK(sink->clicks[0].accented);
        CHECK(sink->clicks[0].volume == Catch::Approx(Metronome::accentedVolume(Metronome::DEFAULT_VOLUME)));
        CHECK(sink->clicks[1].volume == Catch::Approx(Metronome::DEFAULT_VOLUME));
    }

    SECTION("Resumed run continues from the phase offset") {
        metronome.start(120.0, TimeSignature{4, 4}, 0.0, 7);
        REQUIRE(recorder->waitForBeats(2, 2000ms));
        metronome.stop();

        const auto beats = recorder->beats();
        CHECK(beats[0].beatNumber == 7);
        CHECK(beats[0].beatInMeasure == 3);
        CHECK_FALSE(beats[0].accented);
        CHECK(beats[1].beatNumber == 8);
        CHECK(beats[1].accented);
        CHECK(beats[0].scheduledTime == 0.0);
    }

    SECTION("Disabled metronome is silent but still reports beats") {
        auto sink = std::make_shared<RecordingClickSink>();
        metronome.setClickSink(sink);
        metronome.setEnabled(false);
        metronome.start(120.0, TimeSignature{3, 4}, 0.0);
        REQUIRE(recorder->waitForBeats(4, 2000ms));
        metronome.stop();

        CHECK(recorder->beats()[3].accented);
        std::lock_guard<std::mutex> lock(sink->mutex);
        CHECK(sink->clicks.empty());
    }
}

TEST_CASE("Metronome waits for future beats and stops cleanly", "[Metronome]") {
    std::mutex latenessMutex;
    std::vector<double> lateness;

    auto time = SteadyTimeSource::shared();
    Metronome metronome(time);
    auto recorder = std::make_shared<BeatRecorder>(64);
    metronome.addBeatListener([&, recorder](const BeatEvent& beat) {
        {
            std::lock_guard<std::mutex> lock(latenessMutex);
            lateness.push_back(time->now() - beat.scheduledTime);
        }
        recorder->record(beat);
    });

    // 1200 BPM: a beat every 50 ms
    const double reference = time->now() + 0.05;
    metronome.start(1200.0, TimeSignature{}, reference);
    CHECK(metronome.isRunning());

    REQUIRE(recorder->waitForBeats(3, 2000ms));
    metronome.stop();
    CHECK_FALSE(metronome.isRunning());

    const auto beats = recorder->beats();
    CHECK(beats[0].beatNumber == 0);
    CHECK(beats[0].scheduledTime == Catch::Approx(reference));
    CHECK(beats[2].scheduledTime == Catch::Approx(reference + 0.1));

    std::this_thread::sleep_for(20ms);
    const size_t afterStop = recorder->beats().size();
    std::this_thread::sleep_for(150ms);
    CHECK(recorder->beats().size() == afterStop);
    CHECK(metronome.getBeatsDelivered() == afterStop);

    std::lock_guard<std::mutex> lock(latenessMutex);
    for (double late : lateness) {
        // Never ahead of the deadline
        CHECK(late >= -0.001);
    }
}
