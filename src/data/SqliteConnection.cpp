#include "drumsync/data/SQLiteConnection.hpp"

#include <sqlite3.h>

#include <type_traits>

namespace drumsync::data {

// =============================================================================
// Implementation struct
// =============================================================================

struct SQLiteConnection::Impl {
    sqlite3* db = nullptr;
    std::string error;

    ~Impl() {
        if (db) {
            sqlite3_close(db);
        }
    }
};

namespace {

/**
 * Owns a prepared statement for the duration of one call.
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    bool bind(const std::vector<SqlValue>& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            const int idx = static_cast<int>(i + 1);
            const int rc = std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    return sqlite3_bind_null(stmt_, idx);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return sqlite3_bind_int64(stmt_, idx, arg);
                } else if constexpr (std::is_same_v<T, double>) {
                    return sqlite3_bind_double(stmt_, idx, arg);
                } else {
                    return sqlite3_bind_text(stmt_, idx, arg.c_str(), -1, SQLITE_TRANSIENT);
                }
            }, params[i]);
            if (rc != SQLITE_OK) {
                return false;
            }
        }
        return true;
    }

    SqlRow currentRow() const {
        const int colCount = sqlite3_column_count(stmt_);
        std::vector<SqlValue> values;
        values.reserve(static_cast<size_t>(colCount));

        for (int i = 0; i < colCount; ++i) {
            switch (sqlite3_column_type(stmt_, i)) {
                case SQLITE_INTEGER:
                    values.emplace_back(static_cast<int64_t>(sqlite3_column_int64(stmt_, i)));
                    break;
                case SQLITE_FLOAT:
                    values.emplace_back(sqlite3_column_double(stmt_, i));
                    break;
                case SQLITE_TEXT: {
                    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                    values.emplace_back(std::string(text ? text : ""));
                    break;
                }
                default:
                    values.emplace_back(nullptr);
                    break;
            }
        }
        return SqlRow(std::move(values));
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

} // namespace

// =============================================================================
// SqlRow implementation
// =============================================================================

bool SqlRow::isNull(size_t index) const {
    if (index >= values_.size()) return true;
    return std::holds_alternative<std::nullptr_t>(values_[index]);
}

int64_t SqlRow::getInt(size_t index) const {
    if (index >= values_.size()) return 0;
    if (auto* val = std::get_if<int64_t>(&values_[index])) {
        return *val;
    }
    if (auto* val = std::get_if<double>(&values_[index])) {
        return static_cast<int64_t>(*val);
    }
    return 0;
}

double SqlRow::getDouble(size_t index) const {
    if (index >= values_.size()) return 0.0;
    if (auto* val = std::get_if<double>(&values_[index])) {
        return *val;
    }
    if (auto* val = std::get_if<int64_t>(&values_[index])) {
        return static_cast<double>(*val);
    }
    return 0.0;
}

std::string SqlRow::getString(size_t index) const {
    if (index >= values_.size()) return "";
    if (auto* val = std::get_if<std::string>(&values_[index])) {
        return *val;
    }
    return "";
}

// =============================================================================
// SQLiteConnection implementation
// =============================================================================

SQLiteConnection::SQLiteConnection() : impl_(std::make_unique<Impl>()) {}

SQLiteConnection::~SQLiteConnection() = default;

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : impl_(std::move(other.impl_)), path_(std::move(other.path_)) {}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        impl_ = std::move(other.impl_);
        path_ = std::move(other.path_);
    }
    return *this;
}

bool SQLiteConnection::open(const std::string& path) {
    close();
    impl_ = std::make_unique<Impl>();

    const int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->error = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        if (impl_->db) {
            sqlite3_close(impl_->db);
        }
        impl_->db = nullptr;
        return false;
    }

    path_ = path;
    return true;
}

void SQLiteConnection::close() {
    if (impl_ && impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
    path_.clear();
}

bool SQLiteConnection::isOpen() const {
    return impl_ && impl_->db != nullptr;
}

bool SQLiteConnection::execute(const std::string& sql, const std::vector<SqlValue>& params) {
    if (!isOpen()) return false;

    Statement stmt(impl_->db, sql);
    if (!stmt.ok() || !stmt.bind(params)) {
        impl_->error = sqlite3_errmsg(impl_->db);
        return false;
    }

    int rc = sqlite3_step(stmt.get());
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        impl_->error = sqlite3_errmsg(impl_->db);
        return false;
    }
    return true;
}

SqlResult SQLiteConnection::query(const std::string& sql, const std::vector<SqlValue>& params) {
    SqlResult result;
    if (!isOpen()) return result;

    Statement stmt(impl_->db, sql);
    if (!stmt.ok() || !stmt.bind(params)) {
        impl_->error = sqlite3_errmsg(impl_->db);
        return result;
    }

    int rc = sqlite3_step(stmt.get());
    while (rc == SQLITE_ROW) {
        result.push_back(stmt.currentRow());
        rc = sqlite3_step(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        impl_->error = sqlite3_errmsg(impl_->db);
        result.clear();
    }
    return result;
}

std::string SQLiteConnection::lastError() const {
    if (!impl_) return "Database not open";
    if (!impl_->error.empty()) return impl_->error;
    if (!isOpen()) return "Database not open";
    return sqlite3_errmsg(impl_->db);
}

int SQLiteConnection::changesCount() const {
    if (!isOpen()) return 0;
    return sqlite3_changes(impl_->db);
}

bool SQLiteConnection::beginTransaction() {
    return execute("BEGIN TRANSACTION");
}

bool SQLiteConnection::commit() {
    return execute("COMMIT");
}

bool SQLiteConnection::rollback() {
    return execute("ROLLBACK");
}

} // namespace drumsync::data
