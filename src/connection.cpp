/**
 * @file connection.cpp
 * @brief Implementation of Connection class
 */

#include "omnireader/connection.hpp"
#include "omnireader/statement.hpp"
#include "omnireader/transaction.hpp"

#include <spdlog/spdlog.h>

namespace omnireader {

void throwForResult(int result, const std::string& message, const std::string& sql) {
    if ((result & 0xFF) == SQLITE_CONSTRAINT) {
        throw ConstraintException(message, result);
    }
    throw QueryException(message, sql, result);
}

Connection::Connection(const std::string& dbPath, const ConnectionOptions& options)
    : dbPath_(dbPath)
{
    int flags = SQLITE_OPEN_FULLMUTEX;

    if (options.readOnly) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE;
        if (options.createIfNotExists) {
            flags |= SQLITE_OPEN_CREATE;
        }
    }

    int result = sqlite3_open_v2(dbPath.c_str(), &db_, flags, nullptr);

    if (result != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw ConnectionException("Failed to open database '" + dbPath + "': " + error, result);
    }

    try {
        applyOptions(options);
    } catch (const DatabaseException&) {
        close();
        throw;
    }

    spdlog::debug("Opened database '{}' (SQLite {})", dbPath_, sqlite3_libversion());
}

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&& other) noexcept
    : db_(other.db_)
    , dbPath_(std::move(other.dbPath_))
{
    other.db_ = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        dbPath_ = std::move(other.dbPath_);
        other.db_ = nullptr;
    }
    return *this;
}

std::unique_ptr<Connection> Connection::open(const std::string& dbPath,
                                             const ConnectionOptions& options) {
    return std::make_unique<Connection>(dbPath, options);
}

std::unique_ptr<Connection> Connection::inMemory(const ConnectionOptions& options) {
    return open(":memory:", options);
}

void Connection::applyOptions(const ConnectionOptions& options) {
    if (options.extendedResultCodes) {
        sqlite3_extended_result_codes(db_, 1);
    }

    sqlite3_busy_timeout(db_, options.busyTimeoutMs);

    if (options.enableForeignKeys) {
        execute("PRAGMA foreign_keys = ON");
    }

    // journal_mode cannot change on a read-only connection
    if (options.enableWAL && !options.readOnly) {
        execute("PRAGMA journal_mode = WAL");
    }
}

void Connection::close() {
    if (db_) {
        // Statements still alive keep the handle open until they are finalized
        int result = sqlite3_close_v2(db_);
        if (result != SQLITE_OK) {
            spdlog::warn("Closing database '{}' returned {}: {}",
                         dbPath_, result, sqlite3_errstr(result));
        }
        db_ = nullptr;
    }
}

void Connection::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errstr(result);
        sqlite3_free(errMsg);
        throwForResult(result, error, sql);
    }
}

Statement Connection::prepare(const std::string& sql) {
    return Statement(*this, sql);
}

Transaction Connection::beginTransaction() {
    return Transaction(*this);
}

Transaction Connection::beginTransaction(TransactionType type) {
    return Transaction(*this, type);
}

int Connection::changes() const {
    return sqlite3_changes(db_);
}

bool Connection::tableExists(const std::string& tableName) {
    auto stmt = prepare(
        "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
    stmt.bind(1, tableName);
    return stmt.step();
}

bool Connection::foreignKeysEnabled() {
    auto stmt = prepare("PRAGMA foreign_keys");
    return stmt.step() && stmt.columnInt(0) == 1;
}

} // namespace omnireader
