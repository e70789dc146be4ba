/**
 * @file transaction.cpp
 * @brief Implementation of Transaction class
 */

#include "omnireader/transaction.hpp"
#include "omnireader/connection.hpp"

#include <spdlog/spdlog.h>

namespace omnireader {

Transaction::Transaction(Connection& conn, TransactionType type)
    : conn_(&conn)
{
    std::string sql;
    switch (type) {
        case TransactionType::Deferred:
            sql = "BEGIN DEFERRED TRANSACTION";
            break;
        case TransactionType::Immediate:
            sql = "BEGIN IMMEDIATE TRANSACTION";
            break;
        case TransactionType::Exclusive:
            sql = "BEGIN EXCLUSIVE TRANSACTION";
            break;
    }

    try {
        conn_->execute(sql);
    } catch (const DatabaseException& e) {
        active_ = false;
        throw TransactionException("Failed to begin transaction: " + e.message(), e.errorCode());
    }
}

Transaction::~Transaction() {
    if (active_ && conn_) {
        rollbackQuietly();
    }
}

Transaction::Transaction(Transaction&& other) noexcept
    : conn_(other.conn_)
    , active_(other.active_)
{
    other.conn_ = nullptr;
    other.active_ = false;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (active_ && conn_) {
            rollbackQuietly();
        }

        conn_ = other.conn_;
        active_ = other.active_;
        other.conn_ = nullptr;
        other.active_ = false;
    }
    return *this;
}

void Transaction::rollbackQuietly() noexcept {
    active_ = false;
    try {
        conn_->execute("ROLLBACK");
    } catch (const DatabaseException& e) {
        // SQLite may already have rolled back on its own (e.g. SQLITE_FULL)
        spdlog::error("Rollback on '{}' failed: {}", conn_->path(), e.what());
    }
}

void Transaction::commit() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }

    try {
        conn_->execute("COMMIT");
        active_ = false;
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to commit: " + e.message(), e.errorCode());
    }
}

void Transaction::rollback() {
    if (!active_) {
        throw TransactionException("Transaction already ended");
    }

    try {
        conn_->execute("ROLLBACK");
        active_ = false;
    } catch (const DatabaseException& e) {
        throw TransactionException("Failed to rollback: " + e.message(), e.errorCode());
    }
}

} // namespace omnireader
