/**
 * @file test_note_schedule.cpp
 * @brief Unit tests for NoteSchedule grouping and lookups
 */

#include <catch2/catch_all.hpp>
#include <drumsync/NoteSchedule.hpp>
#include <cstddef>
#include <type_traits>
#include <vector>

using namespace drumsync;

namespace {

Note makeNote(int measure, double offset, DrumType drum, NoteInterval interval = NoteInterval::Quarter) {
    Note note;
    note.measureNumber = measure;
    note.measureOffset = offset;
    note.drumType = drum;
    note.interval = interval;
    return note;
}

} // namespace

TEST_CASE("NoteSchedule::build groups simultaneous notes", "[NoteSchedule]") {
    const std::vector<Note> notes = {
        makeNote(2, 0.0, DrumType::Snare),
        makeNote(1, 0.5, DrumType::HiHat, NoteInterval::Eighth),
        makeNote(1, 0.0, DrumType::Kick),
        makeNote(1, 0.0, DrumType::Crash),
        makeNote(1, 0.5, DrumType::Snare, NoteInterval::Eighth),
        makeNote(1, 0.5004, DrumType::Kick, NoteInterval::Eighth),
    };

    auto schedule = NoteSchedule::build(notes);
    REQUIRE(schedule->size() == 3);
    CHECK(schedule->noteCount() == 6);

    SECTION("Entries are time-ordered") {
        CHECK(schedule->at(0).timePosition == 0.0);
        CHECK(schedule->at(1).timePosition == Catch::Approx(0.5));
        CHECK(schedule->at(2).timePosition == Catch::Approx(1.0));
    }

    SECTION("Offsets within a millisecond of measure share an entry") {
        const auto& beat = schedule->at(1);
        CHECK(beat.drums.size() == 3);
        CHECK(beat.drums.contains(DrumType::HiHat));
        CHECK(beat.drums.contains(DrumType::Snare));
        CHECK(beat.drums.contains(DrumType::Kick));
        CHECK(beat.interval == NoteInterval::Eighth);
    }

    SECTION("Measure accessors") {
        CHECK(schedule->at(2).getMeasureNumber() == 2);
        CHECK(schedule->at(1).getMeasureNumber() == 1);
        CHECK(schedule->at(1).getMeasureOffset() == Catch::Approx(0.5));
        CHECK(schedule->maxMeasureIndex() == 1);
        CHECK(schedule->firstTimePosition().value_or(-1.0) == 0.0);
    }

    SECTION("Ids are ascending and resolvable") {
        CHECK(schedule->at(0).id < schedule->at(1).id);
        CHECK(schedule->at(1).id < schedule->at(2).id);
        CHECK(schedule->indexOf(schedule->at(2).id) == 2u);
        CHECK_FALSE(schedule->indexOf(0).has_value());
    }
}

TEST_CASE("NoteSchedule ids are never reused", "[NoteSchedule]") {
    const std::vector<Note> notes = {makeNote(1, 0.0, DrumType::Kick)};
    auto first = NoteSchedule::build(notes);
    auto second = NoteSchedule::build(notes);

    REQUIRE(first->size() == 1);
    REQUIRE(second->size() == 1);
    CHECK(first->at(0).id != second->at(0).id);
    CHECK_FALSE(second->indexOf(first->at(0).id).has_value());
}

TEST_CASE("NoteSchedule is only handed out by build", "[NoteSchedule]") {
    STATIC_REQUIRE_FALSE(std::is_constructible_v<NoteSchedule, std::vector<DrumBeat>, size_t>);

    auto schedule = NoteSchedule::build({makeNote(1, 0.0, DrumType::Kick)});
    CHECK(schedule.use_count() == 1);
    auto shared = schedule;
    CHECK(shared.use_count() == 2);
    CHECK(shared->size() == 1);
}

TEST_CASE("NoteSchedule::closestIndexAtOrBefore", "[NoteSchedule]") {
    // Time positions 0, 0.25, 1.0 and 1.5
    auto schedule = NoteSchedule::build({
        makeNote(1, 0.0, DrumType::Kick),
        makeNote(1, 0.25, DrumType::Snare),
        makeNote(2, 0.0, DrumType::Kick),
        makeNote(2, 0.5, DrumType::Snare),
    });
    REQUIRE(schedule->size() == 4);

    CHECK(schedule->closestIndexAtOrBefore(0.9) == 1);
    CHECK(schedule->closestIndexAtOrBefore(1.0) == 2);
    CHECK(schedule->closestIndexAtOrBefore(0.25) == 1);
    CHECK(schedule->closestIndexAtOrBefore(-1.0) == 0);
    CHECK(schedule->closestIndexAtOrBefore(10.0) == 3);

    SECTION("Empty schedule") {
        auto empty = NoteSchedule::build({});
        CHECK(empty->empty());
        CHECK(empty->closestIndexAtOrBefore(3.0) == 0);
        CHECK(empty->maxMeasureIndex() == -1);
        CHECK_FALSE(empty->firstTimePosition().has_value());
        CHECK_FALSE(empty->findActiveBeat(0.0, 0.05).has_value());
    }
}

TEST_CASE("NoteSchedule::findActiveBeat", "[NoteSchedule]") {
    auto schedule = NoteSchedule::build({
        makeNote(1, 0.0, DrumType::Kick),
        makeNote(1, 0.25, DrumType::Snare),
        makeNote(1, 0.5, DrumType::Kick),
    });

    CHECK(schedule->findActiveBeat(0.25, 0.05) == schedule->at(1).id);
    CHECK(schedule->findActiveBeat(0.23, 0.05) == schedule->at(1).id);
    CHECK(schedule->findActiveBeat(0.27, 0.05) == schedule->at(1).id);
    CHECK(schedule->findActiveBeat(0.49, 0.05) == schedule->at(2).id);
    CHECK_FALSE(schedule->findActiveBeat(0.375, 0.05).has_value());
}

TEST_CASE("NoteSchedule::findNearestMatching", "[NoteSchedule]") {
    auto schedule = NoteSchedule::build({
        makeNote(1, 0.0, DrumType::Kick),
        makeNote(1, 0.25, DrumType::Snare),
        makeNote(1, 0.5, DrumType::Kick),
        makeNote(1, 0.75, DrumType::Snare),
    });

    SECTION("Picks the closest entry with the drum") {
        CHECK(schedule->findNearestMatching(DrumType::Kick, 0.1, 0.3) == 0u);
        CHECK(schedule->findNearestMatching(DrumType::Kick, 0.4, 0.3) == 2u);
        CHECK(schedule->findNearestMatching(DrumType::Snare, 0.5, 0.3) == 1u);
    }

    SECTION("Respects the search distance") {
        CHECK_FALSE(schedule->findNearestMatching(DrumType::Kick, 0.25, 0.1).has_value());
        CHECK_FALSE(schedule->findNearestMatching(DrumType::HiHat, 0.25, 1.0).has_value());
    }

    SECTION("Skips consumed pairs") {
        const uint64_t firstKick = schedule->at(0).id;
        auto consumed = [firstKick](uint64_t id, DrumType drum) {
            return id == firstKick && drum == DrumType::Kick;
        };
        CHECK(schedule->findNearestMatching(DrumType::Kick, 0.1, 0.5, consumed) == 2u);
        CHECK_FALSE(schedule->findNearestMatching(DrumType::Kick, 0.1, 0.2, consumed).has_value());
    }
}
