#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../InputMapper.hpp"
#include "SQLiteConnection.hpp"

namespace drumsync::data {

/**
 * The settings database could not be opened or a statement failed.
 */
class SettingsError : public std::runtime_error {
public:
    explicit SettingsError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * Persists user configuration in SQLite:
 *
 *   practice_speed(chart_id TEXT PRIMARY KEY, speed REAL)
 *   input_mapping(kind TEXT, input TEXT, drum TEXT, PRIMARY KEY(kind, input))
 *
 * kind is "key" or "midi"; MIDI notes are stored as their decimal text.
 * Not thread-safe; use from the owning thread.
 */
class SettingsStore {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * Open or create a settings database file.
     *
     * @throws SettingsError if the file cannot be opened or the schema cannot be created
     */
    static std::shared_ptr<SettingsStore> open(const std::string& path);

    /**
     * Open a private in-memory database.
     */
    static std::shared_ptr<SettingsStore> openMemory();

    explicit SettingsStore(PrivateTag) {}

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    [[nodiscard]] std::optional<double> loadSpeed(const std::string& chartId);

    /**
     * @throws SettingsError on a failed write
     */
    void saveSpeed(const std::string& chartId, double speed);

    /**
     * Remove every saved practice speed.
     */
    void clearSpeeds();

    /**
     * Replace the stored mappings with the mapper's current bindings.
     *
     * @throws SettingsError on a failed write; the previous mappings are kept
     */
    void saveMappings(const InputMapper& mapper);

    /**
     * Apply stored mappings to the mapper. Rows naming an unknown drum are
     * skipped with a warning. A kind with no stored rows leaves the mapper's
     * bindings for that kind untouched.
     *
     * @return true if anything was stored
     */
    bool loadMappings(InputMapper& mapper);

    [[nodiscard]] const std::string& getPath() const { return connection_.getPath(); }

private:
    void initialize(const std::string& path);
    void exec(const std::string& sql, const std::vector<SqlValue>& params = {});

    SQLiteConnection connection_;
};

using SettingsStorePtr = std::shared_ptr<SettingsStore>;

} // namespace drumsync::data
