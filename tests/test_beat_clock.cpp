/**
 * @file test_beat_clock.cpp
 * @brief Unit tests for BeatClock and BeatSnapshot
 */

#include <catch2/catch_all.hpp>
#include <drumsync/BeatClock.hpp>
#include <drumsync/Errors.hpp>
#include <limits>
#include <memory>

using namespace drumsync;

TEST_CASE("BeatClock construction", "[BeatClock]") {
    CHECK_THROWS_AS(BeatClock(nullptr), ConfigurationError);

    BeatClock clock(std::make_shared<ManualTimeSource>());
    CHECK_FALSE(clock.isRunning());
    CHECK_FALSE(clock.currentPlaybackTime().has_value());
    CHECK_FALSE(clock.currentBeatProgress().has_value());
    CHECK_FALSE(clock.snapshot().has_value());
}

TEST_CASE("BeatClock rejects bad tempo", "[BeatClock]") {
    BeatClock clock(std::make_shared<ManualTimeSource>());

    CHECK_THROWS_AS(clock.start(0.0, TimeSignature{}), ConfigurationError);
    CHECK_THROWS_AS(clock.start(-90.0, TimeSignature{}), ConfigurationError);
    CHECK_THROWS_AS(clock.start(std::numeric_limits<double>::quiet_NaN(), TimeSignature{}), ConfigurationError);
    CHECK_THROWS_AS(clock.startAtTime(120.0, TimeSignature{0, 4}, 0.0), ConfigurationError);
    CHECK_FALSE(clock.isRunning());
}

TEST_CASE("BeatClock progress at 120 BPM", "[BeatClock]") {
    auto time = std::make_shared<ManualTimeSource>(10.0);
    BeatClock clock(time);
    clock.start(120.0, TimeSignature{4, 4});

    CHECK(clock.getReferenceStartTime() == 10.0);
    CHECK(clock.getSecondsPerBeat() == Catch::Approx(0.5));

    SECTION("At the reference") {
        auto progress = clock.currentBeatProgress();
        REQUIRE(progress.has_value());
        CHECK(progress->totalBeats == Catch::Approx(0.0));
        CHECK(progress->beatInMeasure == 0);
    }

    SECTION("Mid-measure") {
        time->advance(1.25);
        auto progress = clock.currentBeatProgress();
        REQUIRE(progress.has_value());
        CHECK(progress->totalBeats == Catch::Approx(2.5));
        CHECK(progress->beatInMeasure == 2);
        CHECK(clock.currentPlaybackTime().value_or(0.0) == Catch::Approx(1.25));
    }

    SECTION("Wraps into the next measure") {
        time->advance(2.5);
        auto progress = clock.currentBeatProgress();
        REQUIRE(progress.has_value());
        CHECK(progress->totalBeats == Catch::Approx(5.0));
        CHECK(progress->beatInMeasure == 1);
    }

    SECTION("Stop keeps the reference") {
        time->advance(1.0);
        clock.stop();
        CHECK_FALSE(clock.isRunning());
        CHECK_FALSE(clock.currentBeatProgress().has_value());
        CHECK(clock.getReferenceStartTime() == 10.0);
    }
}

TEST_CASE("BeatClock scheduled start and phase offset", "[BeatClock]") {
    auto time = std::make_shared<ManualTimeSource>(100.0);
    BeatClock clock(time);

    SECTION("Future reference reads negative during the lead-in") {
        clock.startAtTime(120.0, TimeSignature{}, 100.05);
        auto elapsed = clock.currentPlaybackTime();
        REQUIRE(elapsed.has_value());
        CHECK(*elapsed == Catch::Approx(-0.05));

        auto snap = clock.snapshot();
        REQUIRE(snap.has_value());
        CHECK(snap->isInLeadIn());
        CHECK(snap->getDiscreteBeat() == -1);
        CHECK(snap->getBeatInMeasure() == 3);
    }

    SECTION("Resumed run continues the beat count") {
        clock.startAtTime(120.0, TimeSignature{}, 100.5, 7);
        time->set(100.5);
        auto progress = clock.currentBeatProgress();
        REQUIRE(progress.has_value());
        CHECK(progress->totalBeats == Catch::Approx(7.0));
        CHECK(progress->beatInMeasure == 3);

        time->advance(0.5);
        progress = clock.currentBeatProgress();
        REQUIRE(progress.has_value());
        CHECK(progress->totalBeats == Catch::Approx(8.0));
        CHECK(progress->beatInMeasure == 0);
    }
}

TEST_CASE("BeatSnapshot is derived from one instant", "[BeatClock]") {
    auto time = std::make_shared<ManualTimeSource>(0.0);
    BeatClock clock(time);
    clock.start(120.0, TimeSignature{3, 4});
    time->set(1.5);

    auto snap = clock.snapshot();
    REQUIRE(snap.has_value());
    CHECK(snap->instant == 1.5);
    CHECK(snap->elapsed == 1.5);
    CHECK(snap->beats_per_measure == 3);
    CHECK(snap->total_beats == Catch::Approx(3.0));
    CHECK(snap->getSecondsPerMeasure() == Catch::Approx(1.5));
    CHECK(snap->getBeatInMeasure() == 0);
    CHECK(snap->getBeatPhase() == Catch::Approx(0.0).margin(1e-9));

    // Moving time afterwards does not change a snapshot already taken
    time->advance(0.3);
    CHECK(snap->total_beats == Catch::Approx(3.0));
}

TEST_CASE("SteadyTimeSource is monotonic", "[TimeSource]") {
    auto source = SteadyTimeSource::shared();
    REQUIRE(source != nullptr);
    CHECK(source == SteadyTimeSource::shared());

    const double first = source->now();
    const double second = source->now();
    CHECK(second >= first);
}
