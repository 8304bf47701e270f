/**
 * @file test_input_mapper.cpp
 * @brief Unit tests for keyboard and MIDI input mapping
 */

#include <catch2/catch_all.hpp>
#include <drumsync/Errors.hpp>
#include <drumsync/InputMapper.hpp>
#include <array>
#include <cstdint>

using namespace drumsync;

TEST_CASE("InputMapper defaults", "[InputMapper]") {
    InputMapper mapper;

    SECTION("Keyboard layout") {
        CHECK(mapper.drumForKey("space") == DrumType::Kick);
        CHECK(mapper.drumForKey("f") == DrumType::Snare);
        CHECK(mapper.drumForKey("semicolon") == DrumType::Ride);
        CHECK_FALSE(mapper.drumForKey("q").has_value());
    }

    SECTION("Key names are case-insensitive and accept the literal characters") {
        CHECK(mapper.drumForKey("F") == DrumType::Snare);
        CHECK(mapper.drumForKey("SPACE") == DrumType::Kick);
        CHECK(mapper.drumForKey(" ") == DrumType::Kick);
        CHECK(mapper.drumForKey(";") == DrumType::Ride);
    }

    SECTION("General MIDI percussion notes") {
        CHECK(mapper.drumForMidiNote(36) == DrumType::Kick);
        CHECK(mapper.drumForMidiNote(38) == DrumType::Snare);
        CHECK(mapper.drumForMidiNote(42) == DrumType::HiHat);
        CHECK(mapper.drumForMidiNote(44) == DrumType::HiHatPedal);
        CHECK(mapper.drumForMidiNote(49) == DrumType::Crash);
        CHECK_FALSE(mapper.drumForMidiNote(60).has_value());
    }
}

TEST_CASE("InputMapper rebinding", "[InputMapper]") {
    InputMapper mapper;

    SECTION("A drum keeps one key") {
        mapper.setKeyBinding(DrumType::Snare, "A");
        CHECK(mapper.drumForKey("a") == DrumType::Snare);
        CHECK_FALSE(mapper.drumForKey("f").has_value());
        CHECK(mapper.keyForDrum(DrumType::Snare) == "a");
    }

    SECTION("Taking another drum's key unbinds it") {
        mapper.setKeyBinding(DrumType::Snare, "space");
        CHECK(mapper.drumForKey("space") == DrumType::Snare);
        CHECK_FALSE(mapper.keyForDrum(DrumType::Kick).has_value());
    }

    SECTION("MIDI notes follow the same rules") {
        mapper.setMidiBinding(DrumType::Kick, 35);
        CHECK(mapper.drumForMidiNote(35) == DrumType::Kick);
        CHECK_FALSE(mapper.drumForMidiNote(36).has_value());
        CHECK(mapper.midiNoteForDrum(DrumType::Kick) == 35);

        CHECK_THROWS_AS(mapper.setMidiBinding(DrumType::Kick, 128), ConfigurationError);
        CHECK_THROWS_AS(mapper.setMidiBinding(DrumType::Kick, -1), ConfigurationError);
    }

    SECTION("Removing and resetting") {
        mapper.removeBindings(DrumType::HiHat);
        CHECK_FALSE(mapper.keyForDrum(DrumType::HiHat).has_value());
        CHECK_FALSE(mapper.midiNoteForDrum(DrumType::HiHat).has_value());

        mapper.resetToDefaults();
        CHECK(mapper.getKeyMappings() == InputMapper::defaultKeyMappings());
        CHECK(mapper.getMidiMappings() == InputMapper::defaultMidiMappings());
    }

    SECTION("Replacing the whole map") {
        mapper.setKeyMappings({{"Z", DrumType::Kick}, {"x", DrumType::Snare}});
        CHECK(mapper.getKeyMappings().size() == 2);
        CHECK(mapper.drumForKey("z") == DrumType::Kick);
        CHECK_FALSE(mapper.drumForKey("space").has_value());
    }
}

TEST_CASE("InputMapper produces hits", "[InputMapper]") {
    InputMapper mapper;

    SECTION("Key press") {
        auto hit = mapper.hitFromKey("f", 12.5);
        REQUIRE(hit.has_value());
        CHECK(hit->drumType == DrumType::Snare);
        CHECK(hit->timestamp == 12.5);
        CHECK(hit->velocity == 1.0);

        auto soft = mapper.hitFromKey("f", 12.5, 0.0);
        REQUIRE(soft.has_value());
        CHECK(soft->velocity == Catch::Approx(InputMapper::MIN_KEY_VELOCITY));

        CHECK_FALSE(mapper.hitFromKey("q", 12.5).has_value());
    }

    SECTION("MIDI note-on on any channel") {
        const std::array<uint8_t, 3> noteOn = {0x99, 38, 127};
        auto hit = mapper.hitFromMidi(noteOn, 3.0);
        REQUIRE(hit.has_value());
        CHECK(hit->drumType == DrumType::Snare);
        CHECK(hit->velocity == Catch::Approx(1.0));

        const std::array<uint8_t, 3> quiet = {0x90, 36, 64};
        auto kick = mapper.hitFromMidi(quiet, 3.0);
        REQUIRE(kick.has_value());
        CHECK(kick->velocity == Catch::Approx(64.0 / 127.0));
    }

    SECTION("Messages that are not hits") {
        const std::array<uint8_t, 3> zeroVelocity = {0x90, 38, 0};
        const std::array<uint8_t, 3> noteOff = {0x80, 38, 100};
        const std::array<uint8_t, 3> controlChange = {0xB0, 4, 127};
        const std::array<uint8_t, 3> unmapped = {0x90, 60, 100};
        const std::array<uint8_t, 2> truncated = {0x90, 38};

        CHECK_FALSE(mapper.hitFromMidi(zeroVelocity, 0.0).has_value());
        CHECK_FALSE(mapper.hitFromMidi(noteOff, 0.0).has_value());
        CHECK_FALSE(mapper.hitFromMidi(controlChange, 0.0).has_value());
        CHECK_FALSE(mapper.hitFromMidi(unmapped, 0.0).has_value());
        CHECK_FALSE(mapper.hitFromMidi(truncated, 0.0).has_value());
    }
}
