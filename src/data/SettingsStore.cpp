#include "drumsync/data/SettingsStore.hpp"
#include "drumsync/Log.hpp"
#include "drumsync/SafetyCurtain.hpp"

#include <charconv>

#include <fmt/format.h>

namespace drumsync::data {

namespace {

constexpr const char* KIND_KEY = "key";
constexpr const char* KIND_MIDI = "midi";

constexpr const char* SCHEMA_SPEED =
    "CREATE TABLE IF NOT EXISTS practice_speed ("
    "chart_id TEXT PRIMARY KEY, "
    "speed REAL NOT NULL)";

constexpr const char* SCHEMA_MAPPING =
    "CREATE TABLE IF NOT EXISTS input_mapping ("
    "kind TEXT NOT NULL, "
    "input TEXT NOT NULL, "
    "drum TEXT NOT NULL, "
    "PRIMARY KEY (kind, input))";

std::optional<int> parseMidiNote(const std::string& text) {
    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end ||
        value < SafetyLimits::MIN_MIDI_VALUE || value > SafetyLimits::MAX_MIDI_VALUE) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::shared_ptr<SettingsStore> SettingsStore::open(const std::string& path) {
    auto store = std::make_shared<SettingsStore>(PrivateTag{});
    store->initialize(path);
    return store;
}

std::shared_ptr<SettingsStore> SettingsStore::openMemory() {
    return open(":memory:");
}

void SettingsStore::initialize(const std::string& path) {
    if (!connection_.open(path)) {
        throw SettingsError(fmt::format("SettingsStore: Cannot open {}: {}", path, connection_.lastError()));
    }
    exec(SCHEMA_SPEED);
    exec(SCHEMA_MAPPING);
    Log::debug(fmt::format("SettingsStore: Opened {}", path));
}

void SettingsStore::exec(const std::string& sql, const std::vector<SqlValue>& params) {
    if (!connection_.execute(sql, params)) {
        throw SettingsError(fmt::format("SettingsStore: {} ({})", connection_.lastError(), sql));
    }
}

std::optional<double> SettingsStore::loadSpeed(const std::string& chartId) {
    auto rows = connection_.query("SELECT speed FROM practice_speed WHERE chart_id = ?", {chartId});
    if (rows.empty() || rows.front().isNull(0)) {
        return std::nullopt;
    }
    return rows.front().getDouble(0);
}

void SettingsStore::saveSpeed(const std::string& chartId, double speed) {
    exec("INSERT INTO practice_speed (chart_id, speed) VALUES (?, ?) "
         "ON CONFLICT(chart_id) DO UPDATE SET speed = excluded.speed",
         {chartId, speed});
}

void SettingsStore::clearSpeeds() {
    exec("DELETE FROM practice_speed");
}

void SettingsStore::saveMappings(const InputMapper& mapper) {
    if (!connection_.beginTransaction()) {
        throw SettingsError(fmt::format("SettingsStore: {}", connection_.lastError()));
    }
    try {
        exec("DELETE FROM input_mapping");
        for (const auto& [key, drum] : mapper.getKeyMappings()) {
            exec("INSERT INTO input_mapping (kind, input, drum) VALUES (?, ?, ?)",
                 {std::string(KIND_KEY), key, std::string(drumTypeName(drum))});
        }
        for (const auto& [note, drum] : mapper.getMidiMappings()) {
            exec("INSERT INTO input_mapping (kind, input, drum) VALUES (?, ?, ?)",
                 {std::string(KIND_MIDI), std::to_string(note), std::string(drumTypeName(drum))});
        }
    } catch (const SettingsError&) {
        if (!connection_.rollback()) {
            Log::error(fmt::format("SettingsStore: Rollback failed: {}", connection_.lastError()));
        }
        throw;
    }
    if (!connection_.commit()) {
        throw SettingsError(fmt::format("SettingsStore: {}", connection_.lastError()));
    }
}

bool SettingsStore::loadMappings(InputMapper& mapper) {
    auto rows = connection_.query("SELECT kind, input, drum FROM input_mapping");
    if (rows.empty()) {
        return false;
    }

    InputMapper::KeyMap keys;
    InputMapper::MidiMap notes;
    for (const auto& row : rows) {
        const std::string kind = row.getString(0);
        const std::string input = row.getString(1);
        const auto drum = drumTypeFromName(row.getString(2));
        if (!drum) {
            Log::warning(fmt::format("SettingsStore: Skipping mapping {} -> unknown drum '{}'",
                                     input, row.getString(2)));
            continue;
        }
        if (kind == KIND_KEY) {
            keys[input] = *drum;
        } else if (kind == KIND_MIDI) {
            auto note = parseMidiNote(input);
            if (note) {
                notes[*note] = *drum;
            } else {
                Log::warning(fmt::format("SettingsStore: Skipping invalid MIDI note '{}'", input));
            }
        }
    }

    if (!keys.empty()) {
        mapper.setKeyMappings(keys);
    }
    if (!notes.empty()) {
        mapper.setMidiMappings(notes);
    }
    return true;
}

} // namespace drumsync::data
