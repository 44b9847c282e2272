#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace beacon::core::storage {

class SqliteError : public std::runtime_error {
public:
    SqliteError(int code, const std::string& what);

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

enum class OpenMode {
    ReadOnly,
    ReadWrite,
    ReadWriteCreate
};

/**
 * @brief Owning handle to one SQLite connection.
 */
class Database {
public:
    Database(const std::filesystem::path& path, OpenMode mode);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] sqlite3* handle() const noexcept { return handle_.get(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    void execute(std::string_view sql);
    void set_busy_timeout(int milliseconds);
    [[nodiscard]] std::size_t rows_affected() const noexcept;

private:
    struct Closer {
        void operator()(sqlite3* db) const noexcept;
    };

    std::filesystem::path path_;
    std::unique_ptr<sqlite3, Closer> handle_;
};

class Statement {
public:
    Statement(Database& db, std::string_view sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, std::string_view value);
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind_null(int index);

    // true while a row is available, false once the statement is done.
    bool step();
    void execute();
    void reset();

    [[nodiscard]] std::int64_t column_int64(int index) const;
    [[nodiscard]] std::optional<std::string> column_text(int index) const;

private:
    struct Finalizer {
        void operator()(sqlite3_stmt* stmt) const noexcept;
    };

    Database& db_;
    std::unique_ptr<sqlite3_stmt, Finalizer> handle_;
};

/**
 * @brief BEGIN IMMEDIATE ... COMMIT. Rolls back on destruction unless committed.
 */
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool finished_{false};
};

}  // namespace beacon::core::storage
