/**
 * @file connection.hpp
 * @brief RAII wrapper around the SQLite connection backing the library
 *
 * The connection is opened in the constructor and closed in the
 * destructor, so an exception thrown half-way through opening a store
 * never leaks the handle. Connections are non-copyable (a copy would
 * double-close the handle) but moveable.
 *
 * Connection itself does no locking. LibraryStore owns exactly one
 * Connection and serializes every access to it.
 */

#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace omnireader {

/**
 * @brief Configuration options for a database connection
 *
 *   ConnectionOptions opts;
 *   opts.busyTimeoutMs = 10000;
 *   auto conn = Connection::open("library.db", opts);
 */
struct ConnectionOptions {
    // Write-Ahead Logging; ignored by SQLite for in-memory databases
    bool enableWAL = true;

    // How long SQLite waits on a lock held by another connection
    int busyTimeoutMs = 5000;

    // Required for ON DELETE CASCADE (off by default in SQLite)
    bool enableForeignKeys = true;

    bool readOnly = false;

    bool createIfNotExists = true;

    // Report UNIQUE / FOREIGNKEY / CHECK as distinct result codes
    bool extendedResultCodes = true;
};

class Statement;
class Transaction;
enum class TransactionType;

/**
 * @brief RAII wrapper for a SQLite database connection
 */
class Connection {
public:
    /**
     * @brief Open a database connection
     * @param dbPath Path to database file, or ":memory:" for an in-memory DB
     * @param options Connection configuration
     * @throws ConnectionException if opening fails
     */
    explicit Connection(const std::string& dbPath,
                        const ConnectionOptions& options = ConnectionOptions{});

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    static std::unique_ptr<Connection> open(
        const std::string& dbPath,
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Create a private in-memory database, used by tests
     */
    static std::unique_ptr<Connection> inMemory(
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Execute one or more SQL statements without results
     * @throws ConstraintException on a constraint violation
     * @throws QueryException for any other failure
     */
    void execute(const std::string& sql);

    /**
     * @brief Compile a statement with ? placeholders
     * @throws QueryException if the SQL does not compile
     */
    Statement prepare(const std::string& sql);

    /**
     * @brief Begin a transaction, rolled back unless committed
     */
    Transaction beginTransaction();
    Transaction beginTransaction(TransactionType type);

    /**
     * @brief Number of rows changed by the last INSERT/UPDATE/DELETE
     */
    int changes() const;

    bool tableExists(const std::string& tableName);

    /**
     * @brief Whether PRAGMA foreign_keys is in effect on this connection
     */
    bool foreignKeysEnabled();

    sqlite3* handle() const { return db_; }

    const std::string& path() const { return dbPath_; }

    bool isOpen() const { return db_ != nullptr; }

private:
    void applyOptions(const ConnectionOptions& options);
    void close();

    sqlite3* db_ = nullptr;
    std::string dbPath_;
};

/**
 * @brief Throw the exception matching a failed SQLite result code
 *
 * Constraint failures are recognized by their primary code so that the
 * extended UNIQUE / FOREIGNKEY / CHECK codes map to ConstraintException.
 */
[[noreturn]] void throwForResult(int result, const std::string& message,
                                 const std::string& sql);

} // namespace omnireader
