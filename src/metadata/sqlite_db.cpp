#include "usync/metadata/sqlite_db.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace usync::metadata {

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int index, int value) {
    sqlite3_bind_int(stmt_, index, value);
}

void Statement::bind(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind(int index, std::uint64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind(int index, std::uint32_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind(int index, bool value) {
    sqlite3_bind_int(stmt_, index, value ? 1 : 0);
}

int Statement::step() {
    return sqlite3_step(stmt_);
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    const int size = sqlite3_column_bytes(stmt_, column);
    return text ? std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size)) : std::string();
}

std::int64_t Statement::column_int64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    const int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw std::runtime_error("Failed to open " + path_ + ": " + message);
    }
    try {
        configure();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<void> SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        return Err<void>(translate(rc, message));
    }
    return Ok();
}

Result<Statement> SqliteDb::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Err<Statement>(translate(rc, "prepare"));
    }
    return Result<Statement>(OkValue<Statement>(Statement(db_, stmt)));
}

Error SqliteDb::translate(int rc, const std::string& context) const {
    const std::string message = context + ": " + (db_ ? sqlite3_errmsg(db_) : "no connection");
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Error{ErrorCode::StorageBusy, message};
        case SQLITE_CONSTRAINT:
            return Error{ErrorCode::Validation, message};
        default:
            return Error{ErrorCode::Storage, message};
    }
}

void SqliteDb::configure() {
    // WAL lets readers proceed while a writer holds the lock
    const char* pragmas[] = {
        "PRAGMA journal_mode=WAL;",
        "PRAGMA synchronous=FULL;",
        "PRAGMA foreign_keys=ON;",
        "PRAGMA temp_store=MEMORY;",
    };
    for (const char* pragma : pragmas) {
        auto result = exec(pragma);
        if (result.is_error()) {
            throw std::runtime_error("Failed to configure " + path_ + ": " + result.error().message);
        }
    }
    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        throw std::runtime_error("Failed to set busy timeout on " + path_);
    }
}

Transaction::~Transaction() {
    if (!active_) {
        return;
    }
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("Rollback on {} failed: {}", db_.path(), err ? err : "unknown");
    }
    sqlite3_free(err);
}

Result<void> Transaction::begin() {
    auto result = db_.exec("BEGIN IMMEDIATE;");
    if (result.is_ok()) {
        active_ = true;
    }
    return result;
}

Result<void> Transaction::commit() {
    auto result = db_.exec("COMMIT;");
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

} // namespace usync::metadata
