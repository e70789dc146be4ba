/**
 * @file repository.hpp
 * @brief Base class for per-table data access
 *
 * Each entity table has one repository that owns its SQL. The base class
 * provides the lookups every table shares (by primary key, delete,
 * count); subclasses add their own queries and implement the
 * row <-> entity mapping.
 *
 * Repositories hold a reference to a Connection and do no locking of
 * their own. They are used by LibraryStore with its mutex held.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "connection.hpp"
#include "statement.hpp"

namespace omnireader {

/**
 * @brief Type-safe repository over a table with a TEXT primary key
 *
 *   class BookRepository : public Repository<Book> {
 *   public:
 *       explicit BookRepository(Connection& conn)
 *           : Repository(conn, "books", "id", "id, title, ...") {}
 *
 *   protected:
 *       Book fromRow(Statement& stmt) override { ... }
 *       void bindForInsert(Statement& stmt, const Book& book) override { ... }
 *   };
 */
template<typename T>
class Repository {
public:
    /**
     * @param columns Comma-separated column list; fromRow() reads columns
     *                in this order
     */
    Repository(Connection& conn, std::string tableName,
               std::string keyColumn, std::string columns)
        : conn_(conn)
        , tableName_(std::move(tableName))
        , keyColumn_(std::move(keyColumn))
        , columns_(std::move(columns)) {}

    virtual ~Repository() = default;

    std::optional<T> findById(const std::string& id) {
        auto stmt = conn_.prepare(
            "SELECT " + columns_ + " FROM " + tableName_ + " WHERE " + keyColumn_ + " = ?");
        stmt.bind(1, id);
        if (stmt.step()) {
            return fromRow(stmt);
        }
        return std::nullopt;
    }

    /**
     * @return true if a row was deleted
     */
    bool deleteById(const std::string& id) {
        auto stmt = conn_.prepare(
            "DELETE FROM " + tableName_ + " WHERE " + keyColumn_ + " = ?");
        stmt.bind(1, id);
        stmt.execute();
        return conn_.changes() > 0;
    }

    int64_t count() {
        auto stmt = conn_.prepare("SELECT COUNT(*) FROM " + tableName_);
        stmt.step();
        return stmt.columnInt64(0);
    }

protected:
    /**
     * @brief Run a prepared SELECT over columns_ and map every row
     */
    std::vector<T> collect(Statement& stmt) {
        std::vector<T> results;
        while (stmt.step()) {
            results.push_back(fromRow(stmt));
        }
        return results;
    }

    /**
     * @brief Start of a SELECT over this repository's columns
     */
    std::string selectClause() const {
        return "SELECT " + columns_ + " FROM " + tableName_;
    }

    virtual T fromRow(Statement& stmt) = 0;

    /**
     * @brief Bind every column of columns_ (1-based, same order)
     */
    virtual void bindForInsert(Statement& stmt, const T& entity) = 0;

    Connection& conn_;
    std::string tableName_;
    std::string keyColumn_;
    std::string columns_;
};

} // namespace omnireader
