#include "beacon/core/storage/sqlite.hpp"

#include <sqlite3.h>

namespace beacon::core::storage {
namespace {

std::string describe(sqlite3* db, int rc, std::string_view context) {
    std::string message{context};
    message += ": ";
    message += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return message;
}

int to_flags(OpenMode mode) {
    switch (mode) {
        case OpenMode::ReadOnly:        return SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
        case OpenMode::ReadWrite:       return SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
        case OpenMode::ReadWriteCreate: return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    }
    return SQLITE_OPEN_READONLY;
}

}  // namespace

SqliteError::SqliteError(int code, const std::string& what)
    : std::runtime_error(what), code_(code) {
}

void Database::Closer::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

Database::Database(const std::filesystem::path& path, OpenMode mode)
    : path_(path) {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &db, to_flags(mode), nullptr);
    handle_.reset(db);
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, describe(db, rc, "cannot open database " + path.string()));
    }
}

Database::~Database() = default;

void Database::execute(std::string_view sql) {
    char* err_msg = nullptr;
    const std::string statement{sql};
    const int rc = sqlite3_exec(handle(), statement.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        throw SqliteError(rc, "exec failed: " + message);
    }
}

void Database::set_busy_timeout(int milliseconds) {
    const int rc = sqlite3_busy_timeout(handle(), milliseconds);
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, describe(handle(), rc, "cannot set busy timeout"));
    }
}

std::size_t Database::rows_affected() const noexcept {
    return static_cast<std::size_t>(sqlite3_changes(handle()));
}

void Statement::Finalizer::operator()(sqlite3_stmt* stmt) const noexcept {
    sqlite3_finalize(stmt);
}

Statement::Statement(Database& db, std::string_view sql)
    : db_(db) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db.handle(), sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    handle_.reset(stmt);
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, describe(db.handle(), rc, "cannot prepare statement"));
    }
}

Statement::~Statement() = default;

Statement& Statement::bind(int index, std::int64_t value) {
    const int rc = sqlite3_bind_int64(handle_.get(), index, value);
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, describe(db_.handle(), rc, "bind failed"));
    }
    return *this;
}

Statement& Statement::bind(int index, std::string_view value) {
    const int rc = sqlite3_bind_text(handle_.get(), index, value.data(), static_cast<int>(value.size()),
                                     SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, describe(db_.handle(), rc, "bind failed"));
    }
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    if (!value) {
        return bind_null(index);
    }
    return bind(index, std::string_view{*value});
}

Statement& Statement::bind_null(int index) {
    const int rc = sqlite3_bind_null(handle_.get(), index);
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, describe(db_.handle(), rc, "bind failed"));
    }
    return *this;
}

bool Statement::step() {
    const int rc = sqlite3_step(handle_.get());
    switch (rc) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            throw SqliteError(rc, describe(db_.handle(), rc, "step failed"));
    }
}

void Statement::execute() {
    while (step()) {
    }
    reset();
}

void Statement::reset() {
    sqlite3_reset(handle_.get());
    sqlite3_clear_bindings(handle_.get());
}

std::int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(handle_.get(), index);
}

std::optional<std::string> Statement::column_text(int index) const {
    if (sqlite3_column_type(handle_.get(), index) == SQLITE_NULL) {
        return std::nullopt;
    }
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(handle_.get(), index));
    const int size = sqlite3_column_bytes(handle_.get(), index);
    return std::string{text, static_cast<std::size_t>(size)};
}

Transaction::Transaction(Database& db)
    : db_(db) {
    db_.execute("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    // A failed ROLLBACK leaves nothing to undo: SQLite has already aborted the
    // transaction, and closing the connection discards it in any case.
    if (!finished_ && sqlite3_get_autocommit(db_.handle()) == 0) {
        sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit() {
    db_.execute("COMMIT");
    finished_ = true;
}

}  // namespace beacon::core::storage
