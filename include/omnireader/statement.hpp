/**
 * @file statement.hpp
 * @brief Prepared statement with type-safe parameter binding
 *
 * Every value that reaches SQL goes through a bound parameter, never
 * through string concatenation. Binders return *this so calls chain:
 *
 *   auto stmt = conn.prepare("INSERT INTO books (id, title) VALUES (?, ?)");
 *   stmt.bind(1, book.id).bind(2, book.title).execute();
 *
 * Optional entity fields bind as NULL when empty and read back through
 * the columnOptional* accessors.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace omnireader {

class Connection;

/**
 * @brief Sentinel for binding SQL NULL
 */
struct NullValue {};
static constexpr NullValue null{};

using Blob = std::vector<uint8_t>;

/**
 * @brief RAII wrapper for a prepared statement
 *
 * Only step or bind while the parent Connection is open. A connection
 * closed under a live statement stays open until the statement is finalized.
 */
class Statement {
public:
    /**
     * @throws QueryException if the SQL does not compile
     */
    Statement(Connection& conn, const std::string& sql);

    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // ========== Parameter Binding ==========
    // Parameters are 1-indexed (SQLite convention)

    Statement& bind(int index, int value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, uint32_t value);
    Statement& bind(int index, double value);

    /**
     * @brief Bind a string value
     *
     * The text is copied (SQLITE_TRANSIENT), so the source may go away
     * before the statement runs.
     */
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);

    Statement& bind(int index, const Blob& value);

    Statement& bind(int index, NullValue);

    /**
     * @brief Bind an optional value, NULL when empty
     */
    template<typename T>
    Statement& bind(int index, const std::optional<T>& value) {
        if (!value) {
            return bind(index, null);
        }
        return bind(index, *value);
    }

    /**
     * @brief Bind a parameter by name (":book_id", "@percent", ...)
     */
    template<typename T>
    Statement& bind(const std::string& name, const T& value) {
        int index = sqlite3_bind_parameter_index(stmt_, name.c_str());
        if (index == 0) {
            throw QueryException("Unknown parameter name: " + name, sql_);
        }
        return bind(index, value);
    }

    // ========== Execution ==========

    /**
     * @brief Run a statement that returns no rows
     * @throws ConstraintException on a constraint violation
     * @throws QueryException for any other failure
     */
    void execute();

    /**
     * @brief Step to the next result row
     * @return true if a row is available, false when done
     */
    bool step();

    // ========== Column Access ==========
    // Columns are 0-indexed (SQLite convention)

    bool isNull(int index) const;

    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    uint32_t columnUInt32(int index) const;
    double columnDouble(int index) const;
    std::string columnString(int index) const;
    Blob columnBlob(int index) const;

    std::optional<int64_t> columnOptionalInt64(int index) const;
    std::optional<std::string> columnOptionalString(int index) const;
    std::optional<Blob> columnOptionalBlob(int index) const;

    const std::string& sql() const { return sql_; }

private:
    void checkResult(int result, const std::string& operation);
    void finalize();

    sqlite3_stmt* stmt_ = nullptr;
    Connection* conn_;
    std::string sql_;
};

} // namespace omnireader
