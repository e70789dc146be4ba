/**
 * @file schema.hpp
 * @brief Library schema creation and startup validation
 *
 * The schema is created with CREATE ... IF NOT EXISTS, so running
 * initializeSchema() against an existing library changes nothing. There
 * are no versioned migrations.
 *
 * After initialization the store checks the live schema against what the
 * repositories expect. A library file edited by hand, or created by an
 * incompatible build, is reported as a SchemaException at open time
 * instead of as odd query failures later.
 */

#pragma once

#include <string>
#include <vector>
#include "connection.hpp"

namespace omnireader {

/**
 * @brief Create the books / annotations / reading_positions tables and
 *        the annotation index if they are missing
 * @throws DatabaseException if any statement fails (nothing is applied)
 */
void initializeSchema(Connection& conn);

/**
 * @brief Declarative checks against sqlite_master and table pragmas
 *
 *   SchemaValidator validator;
 *   validator.requireTable("books")
 *            .requireColumn("books", "file_path", "TEXT")
 *            .requireNotNull("books", "file_path")
 *            .requireCascade("annotations", "book_id", "books");
 *   validator.validateOrThrow(conn);
 */
class SchemaValidator {
public:
    struct ValidationError {
        std::string type;     // "missing_table", "missing_column", ...
        std::string message;
    };

    SchemaValidator& requireTable(const std::string& tableName);

    /**
     * @param expectedType Declared SQLite type, or empty for any
     */
    SchemaValidator& requireColumn(const std::string& tableName,
                                   const std::string& columnName,
                                   const std::string& expectedType = "");

    SchemaValidator& requireNotNull(const std::string& tableName,
                                    const std::string& columnName);

    SchemaValidator& requireIndex(const std::string& tableName,
                                  const std::string& indexName);

    /**
     * @brief Require column to reference parentTable with ON DELETE CASCADE
     */
    SchemaValidator& requireCascade(const std::string& tableName,
                                    const std::string& columnName,
                                    const std::string& parentTable);

    std::vector<ValidationError> validate(Connection& conn) const;

    /**
     * @throws SchemaException listing every validation error
     */
    void validateOrThrow(Connection& conn) const;

private:
    struct ColumnRequirement {
        std::string tableName;
        std::string columnName;
        std::string expectedType;
        bool requireNotNull = false;
    };

    struct IndexRequirement {
        std::string tableName;
        std::string indexName;
    };

    struct CascadeRequirement {
        std::string tableName;
        std::string columnName;
        std::string parentTable;
    };

    std::vector<std::string> tables_;
    std::vector<ColumnRequirement> columns_;
    std::vector<IndexRequirement> indexes_;
    std::vector<CascadeRequirement> cascades_;
};

/**
 * @brief Validator describing the schema initializeSchema() creates
 */
SchemaValidator librarySchemaValidator();

} // namespace omnireader
