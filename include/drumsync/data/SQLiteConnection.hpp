#pragma once

/**
 * SQLiteConnection - SQLite database wrapper
 *
 * Thin C++ wrapper over SQLite3 used by SettingsStore to persist
 * practice speeds and input mappings.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace drumsync::data {

/**
 * Represents a value in a SQLite result row or a bound parameter
 */
using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

/**
 * A single row from a query result
 */
class SqlRow {
public:
    SqlRow() = default;
    explicit SqlRow(std::vector<SqlValue> values)
        : values_(std::move(values)) {}

    const SqlValue& operator[](size_t index) const { return values_.at(index); }
    size_t size() const { return values_.size(); }

    bool isNull(size_t index) const;

    /**
     * Typed accessors. A REAL column read with getInt() is truncated and an
     * INTEGER column read with getDouble() is widened; anything else yields
     * the type's zero value.
     */
    int64_t getInt(size_t index) const;
    double getDouble(size_t index) const;
    std::string getString(size_t index) const;

private:
    std::vector<SqlValue> values_;
};

using SqlResult = std::vector<SqlRow>;

/**
 * SQLite database connection
 */
class SQLiteConnection {
public:
    SQLiteConnection();
    ~SQLiteConnection();

    // Non-copyable, movable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * Open (creating if needed) a database file
     * @return true if successful
     */
    bool open(const std::string& path);

    /**
     * Open an in-memory database
     */
    bool openMemory() { return open(":memory:"); }

    void close();
    bool isOpen() const;

    /**
     * Execute a statement with ? placeholders, discarding any rows
     * @return true if successful
     */
    bool execute(const std::string& sql, const std::vector<SqlValue>& params = {});

    /**
     * Execute a query with ? placeholders
     * @return Query results; empty on error, check lastError()
     */
    SqlResult query(const std::string& sql, const std::vector<SqlValue>& params = {});

    std::string lastError() const;

    /**
     * Number of rows affected by the last statement
     */
    int changesCount() const;

    bool beginTransaction();
    bool commit();
    bool rollback();

    const std::string& getPath() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
};

} // namespace drumsync::data
