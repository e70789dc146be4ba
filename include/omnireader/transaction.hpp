/**
 * @file transaction.hpp
 * @brief Scoped transactions for multi-statement store operations
 *
 * A Transaction begins in its constructor and rolls back in its
 * destructor unless commit() was reached:
 *
 *   auto txn = conn.beginTransaction(TransactionType::Immediate);
 *   if (!books.existsByPath(book.filePath)) {
 *       books.insert(book);
 *   }
 *   txn.commit();
 *
 * An exception anywhere between BEGIN and COMMIT leaves the database
 * exactly as it was.
 */

#pragma once

#include <string>
#include <type_traits>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace omnireader {

class Connection;

/**
 * @brief SQLite locking strategy for BEGIN
 */
enum class TransactionType {
    Deferred,   // Lock on first access
    Immediate,  // Take the write lock up front
    Exclusive
};

/**
 * @brief RAII guard for a database transaction
 */
class Transaction {
public:
    /**
     * @throws TransactionException if BEGIN fails
     */
    explicit Transaction(Connection& conn,
                         TransactionType type = TransactionType::Deferred);

    /**
     * @brief Rolls back if still active; never throws
     */
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    /**
     * @throws TransactionException if COMMIT fails or the transaction ended
     */
    void commit();

    /**
     * @throws TransactionException if ROLLBACK fails or the transaction ended
     */
    void rollback();

    bool isActive() const { return active_; }

private:
    void rollbackQuietly() noexcept;

    Connection* conn_;
    bool active_ = true;
};

/**
 * @brief Run func inside a transaction, committing when it returns
 *
 *   bool inserted = withTransaction(conn, TransactionType::Immediate, [&] {
 *       ...
 *       return true;
 *   });
 */
template<typename Func>
auto withTransaction(Connection& conn, TransactionType type, Func&& func) -> decltype(func()) {
    Transaction txn(conn, type);
    if constexpr (std::is_void_v<decltype(func())>) {
        func();
        txn.commit();
    } else {
        auto result = func();
        txn.commit();
        return result;
    }
}

} // namespace omnireader
