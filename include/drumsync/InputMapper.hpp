#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>

#include "NoteMatch.hpp"
#include "Types.hpp"

namespace drumsync {

/**
 * Translates keyboard keys and MIDI notes into drum hits.
 *
 * Each drum has at most one key and at most one MIDI note. Binding a drum
 * removes both its previous binding and any other drum bound to the same
 * key or note. Key names are case-insensitive ("space", "f", "semicolon").
 */
class InputMapper {
public:
    using KeyMap = std::map<std::string, DrumType>;
    using MidiMap = std::map<int, DrumType>;

    static constexpr uint8_t MIDI_NOTE_ON = 0x90;
    static constexpr uint8_t MIDI_STATUS_MASK = 0xF0;
    static constexpr double MIN_KEY_VELOCITY = 0.1;

    InputMapper();

    [[nodiscard]] static KeyMap defaultKeyMappings();
    [[nodiscard]] static MidiMap defaultMidiMappings();

    void setKeyBinding(DrumType drum, const std::string& key);

    /**
     * @throws ConfigurationError if note is outside 0..127
     */
    void setMidiBinding(DrumType drum, int note);

    void removeBindings(DrumType drum);
    void resetToDefaults();

    /**
     * Replace all bindings, e.g. with a persisted set.
     */
    void setKeyMappings(const KeyMap& mappings);
    void setMidiMappings(const MidiMap& mappings);

    [[nodiscard]] const KeyMap& getKeyMappings() const { return keyMappings_; }
    [[nodiscard]] const MidiMap& getMidiMappings() const { return midiMappings_; }

    [[nodiscard]] std::optional<DrumType> drumForKey(const std::string& key) const;
    [[nodiscard]] std::optional<DrumType> drumForMidiNote(int note) const;
    [[nodiscard]] std::optional<std::string> keyForDrum(DrumType drum) const;
    [[nodiscard]] std::optional<int> midiNoteForDrum(DrumType drum) const;

    /**
     * Hit for a key press. Velocity is clamped to [0.1, 1.0].
     */
    [[nodiscard]] std::optional<InputHit> hitFromKey(const std::string& key, double timestamp,
                                                     double velocity = 1.0) const;

    /**
     * Hit for a raw MIDI message. Only note-on with a non-zero velocity
     * on any channel produces a hit; velocity is normalised to /127.
     */
    [[nodiscard]] std::optional<InputHit> hitFromMidi(std::span<const uint8_t> message, double timestamp) const;

private:
    [[nodiscard]] static std::string normalizeKey(const std::string& key);

    KeyMap keyMappings_;
    MidiMap midiMappings_;
};

} // namespace drumsync
