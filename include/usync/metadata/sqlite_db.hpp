#pragma once

#include "usync/core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace usync {
namespace metadata {

/**
 * @brief Owning wrapper around one prepared statement
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    void bind(int index, const std::string& value);
    void bind(int index, int value);
    void bind(int index, std::int64_t value);
    void bind(int index, std::uint64_t value);
    void bind(int index, std::uint32_t value);
    void bind(int index, bool value);

    /// SQLITE_ROW, SQLITE_DONE or an error code.
    int step();
    void reset();

    std::string column_text(int column) const;
    std::int64_t column_int64(int column) const;
    std::uint64_t column_u64(int column) const { return static_cast<std::uint64_t>(column_int64(column)); }
    std::uint32_t column_u32(int column) const { return static_cast<std::uint32_t>(column_int64(column)); }

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief RAII sqlite3 connection configured for durable commits
 *
 * Opening failures throw std::runtime_error; every other call reports
 * through Result.
 */
class SqliteDb {
public:
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    Result<void> exec(const std::string& sql);
    Result<Statement> prepare(const std::string& sql);

    /// Map a sqlite return code to a usync error.
    Error translate(int rc, const std::string& context) const;

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

/**
 * @brief BEGIN IMMEDIATE transaction, rolled back unless committed
 */
class Transaction {
public:
    explicit Transaction(SqliteDb& db) : db_(db) {}
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result<void> begin();
    Result<void> commit();

private:
    SqliteDb& db_;
    bool active_ = false;
};

} // namespace metadata
} // namespace usync
