#include "drumsync/InputMapper.hpp"
#include "drumsync/Errors.hpp"
#include "drumsync/SafetyCurtain.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace drumsync {

InputMapper::InputMapper()
    : keyMappings_(defaultKeyMappings())
    , midiMappings_(defaultMidiMappings())
{
}

InputMapper::KeyMap InputMapper::defaultKeyMappings() {
    return {
        {"space", DrumType::Kick},
        {"f", DrumType::Snare},
        {"j", DrumType::HiHat},
        {"d", DrumType::Tom1},
        {"k", DrumType::Tom2},
        {"s", DrumType::Tom3},
        {"l", DrumType::Crash},
        {"semicolon", DrumType::Ride},
        {"g", DrumType::Cowbell},
    };
}

InputMapper::MidiMap InputMapper::defaultMidiMappings() {
    // General MIDI percussion map
    return {
        {36, DrumType::Kick},
        {38, DrumType::Snare},
        {42, DrumType::HiHat},
        {44, DrumType::HiHatPedal},
        {48, DrumType::Tom1},
        {47, DrumType::Tom2},
        {45, DrumType::Tom3},
        {49, DrumType::Crash},
        {51, DrumType::Ride},
        {56, DrumType::Cowbell},
    };
}

std::string InputMapper::normalizeKey(const std::string& key) {
    std::string result = key;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (result == " ") {
        return "space";
    }
    if (result == ";") {
        return "semicolon";
    }
    return result;
}

void InputMapper::setKeyBinding(DrumType drum, const std::string& key) {
    const std::string normalized = normalizeKey(key);
    std::erase_if(keyMappings_, [drum](const auto& entry) { return entry.second == drum; });
    keyMappings_[normalized] = drum;
}

void InputMapper::setMidiBinding(DrumType drum, int note) {
    if (note < SafetyLimits::MIN_MIDI_VALUE || note > SafetyLimits::MAX_MIDI_VALUE) {
        throw ConfigurationError(fmt::format("InputMapper: MIDI note {} out of range", note));
    }
    std::erase_if(midiMappings_, [drum](const auto& entry) { return entry.second == drum; });
    midiMappings_[note] = drum;
}

void InputMapper::removeBindings(DrumType drum) {
    std::erase_if(keyMappings_, [drum](const auto& entry) { return entry.second == drum; });
    std::erase_if(midiMappings_, [drum](const auto& entry) { return entry.second == drum; });
}

void InputMapper::resetToDefaults() {
    keyMappings_ = defaultKeyMappings();
    midiMappings_ = defaultMidiMappings();
}

void InputMapper::setKeyMappings(const KeyMap& mappings) {
    keyMappings_.clear();
    for (const auto& [key, drum] : mappings) {
        setKeyBinding(drum, key);
    }
}

void InputMapper::setMidiMappings(const MidiMap& mappings) {
    midiMappings_.clear();
    for (const auto& [note, drum] : mappings) {
        setMidiBinding(drum, note);
    }
}

std::optional<DrumType> InputMapper::drumForKey(const std::string& key) const {
    auto it = keyMappings_.find(normalizeKey(key));
    if (it == keyMappings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DrumType> InputMapper::drumForMidiNote(int note) const {
    auto it = midiMappings_.find(note);
    if (it == midiMappings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> InputMapper::keyForDrum(DrumType drum) const {
    for (const auto& [key, mapped] : keyMappings_) {
        if (mapped == drum) {
            return key;
        }
    }
    return std::nullopt;
}

std::optional<int> InputMapper::midiNoteForDrum(DrumType drum) const {
    for (const auto& [note, mapped] : midiMappings_) {
        if (mapped == drum) {
            return note;
        }
    }
    return std::nullopt;
}

std::optional<InputHit> InputMapper::hitFromKey(const std::string& key, double timestamp, double velocity) const {
    auto drum = drumForKey(key);
    if (!drum) {
        return std::nullopt;
    }
    return InputHit{*drum, timestamp,
                    SafetyCurtain::clampSafe(velocity, MIN_KEY_VELOCITY, 1.0, 1.0)};
}

std::optional<InputHit> InputMapper::hitFromMidi(std::span<const uint8_t> message, double timestamp) const {
    if (message.size() < 3) {
        return std::nullopt;
    }
    const uint8_t status = message[0];
    const uint8_t note = message[1];
    const uint8_t velocity = message[2];

    // Note-on with velocity 0 is a note-off by convention.
    if ((status & MIDI_STATUS_MASK) != MIDI_NOTE_ON || velocity == 0) {
        return std::nullopt;
    }

    auto drum = drumForMidiNote(note);
    if (!drum) {
        return std::nullopt;
    }
    return InputHit{*drum, timestamp, static_cast<double>(velocity) / 127.0};
}

} // namespace drumsync
