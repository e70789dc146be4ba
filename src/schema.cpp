/**
 * @file schema.cpp
 * @brief Implementation of schema initialization and SchemaValidator
 */

#include "omnireader/schema.hpp"
#include "omnireader/statement.hpp"
#include "omnireader/transaction.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

namespace omnireader {

namespace {

const char* const kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS books (
        id TEXT PRIMARY KEY NOT NULL,
        title TEXT NOT NULL CHECK (length(title) > 0),
        author TEXT,
        file_path TEXT NOT NULL UNIQUE,
        file_type TEXT NOT NULL,
        cover_data BLOB,
        added_at INTEGER NOT NULL,
        last_read_at INTEGER,
        total_pages INTEGER NOT NULL DEFAULT 0 CHECK (total_pages >= 0)
    );

    CREATE TABLE IF NOT EXISTS annotations (
        id TEXT PRIMARY KEY NOT NULL,
        book_id TEXT NOT NULL REFERENCES books(id) ON DELETE CASCADE,
        annotation_type TEXT NOT NULL,
        start_percent REAL NOT NULL CHECK (start_percent BETWEEN 0.0 AND 100.0),
        end_percent REAL NOT NULL CHECK (end_percent BETWEEN 0.0 AND 100.0),
        page_number INTEGER NOT NULL CHECK (page_number >= 0),
        color TEXT NOT NULL,
        selected_text TEXT,
        note_text TEXT,
        created_at INTEGER NOT NULL,
        CHECK (end_percent >= start_percent)
    );

    CREATE TABLE IF NOT EXISTS reading_positions (
        book_id TEXT PRIMARY KEY NOT NULL REFERENCES books(id) ON DELETE CASCADE,
        percent REAL NOT NULL CHECK (percent BETWEEN 0.0 AND 100.0),
        page_number INTEGER NOT NULL CHECK (page_number >= 0),
        updated_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_annotations_book_id ON annotations(book_id);
)";

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

void initializeSchema(Connection& conn) {
    withTransaction(conn, TransactionType::Immediate, [&conn] {
        conn.execute(kSchemaSql);
    });
    spdlog::debug("Schema ready on '{}'", conn.path());
}

// ========== SchemaValidator ==========

SchemaValidator& SchemaValidator::requireTable(const std::string& tableName) {
    tables_.push_back(tableName);
    return *this;
}

SchemaValidator& SchemaValidator::requireColumn(const std::string& tableName,
                                                const std::string& columnName,
                                                const std::string& expectedType) {
    columns_.push_back({tableName, columnName, expectedType, false});
    return *this;
}

SchemaValidator& SchemaValidator::requireNotNull(const std::string& tableName,
                                                 const std::string& columnName) {
    for (auto& req : columns_) {
        if (req.tableName == tableName && req.columnName == columnName) {
            req.requireNotNull = true;
            return *this;
        }
    }
    columns_.push_back({tableName, columnName, "", true});
    return *this;
}

SchemaValidator& SchemaValidator::requireIndex(const std::string& tableName,
                                               const std::string& indexName) {
    indexes_.push_back({tableName, indexName});
    return *this;
}

SchemaValidator& SchemaValidator::requireCascade(const std::string& tableName,
                                                 const std::string& columnName,
                                                 const std::string& parentTable) {
    cascades_.push_back({tableName, columnName, parentTable});
    return *this;
}

std::vector<SchemaValidator::ValidationError> SchemaValidator::validate(Connection& conn) const {
    std::vector<ValidationError> errors;

    for (const auto& table : tables_) {
        if (!conn.tableExists(table)) {
            errors.push_back({
                "missing_table",
                "Required table '" + table + "' does not exist"
            });
        }
    }

    for (const auto& req : columns_) {
        auto stmt = conn.prepare("PRAGMA table_info(" + req.tableName + ")");

        bool found = false;
        while (stmt.step()) {
            if (stmt.columnString(1) != req.columnName) {
                continue;
            }
            found = true;

            if (!req.expectedType.empty()) {
                std::string actual = stmt.columnString(2);
                if (toUpper(actual).find(toUpper(req.expectedType)) == std::string::npos) {
                    errors.push_back({
                        "wrong_type",
                        "Column '" + req.tableName + "." + req.columnName +
                        "' has type '" + actual + "', expected '" + req.expectedType + "'"
                    });
                }
            }

            if (req.requireNotNull && stmt.columnInt(3) == 0) {
                errors.push_back({
                    "nullable",
                    "Column '" + req.tableName + "." + req.columnName +
                    "' should be NOT NULL"
                });
            }
            break;
        }

        if (!found) {
            errors.push_back({
                "missing_column",
                "Required column '" + req.tableName + "." + req.columnName +
                "' does not exist"
            });
        }
    }

    for (const auto& req : indexes_) {
        auto stmt = conn.prepare(
            "SELECT 1 FROM sqlite_master WHERE type='index' AND tbl_name=? AND name=?");
        stmt.bind(1, req.tableName).bind(2, req.indexName);
        if (!stmt.step()) {
            errors.push_back({
                "missing_index",
                "Required index '" + req.indexName + "' on table '" +
                req.tableName + "' does not exist"
            });
        }
    }

    for (const auto& req : cascades_) {
        // Columns: id, seq, table, from, to, on_update, on_delete, match
        auto stmt = conn.prepare("PRAGMA foreign_key_list(" + req.tableName + ")");

        bool found = false;
        while (stmt.step()) {
            if (stmt.columnString(2) == req.parentTable &&
                stmt.columnString(3) == req.columnName &&
                toUpper(stmt.columnString(6)) == "CASCADE") {
                found = true;
                break;
            }
        }

        if (!found) {
            errors.push_back({
                "missing_cascade",
                "Column '" + req.tableName + "." + req.columnName +
                "' must reference '" + req.parentTable + "' with ON DELETE CASCADE"
            });
        }
    }

    return errors;
}

void SchemaValidator::validateOrThrow(Connection& conn) const {
    auto errors = validate(conn);
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Schema validation failed with " << errors.size() << " error(s):\n";
        for (const auto& error : errors) {
            oss << "  - " << error.message << "\n";
        }
        throw SchemaException(oss.str());
    }
}

SchemaValidator librarySchemaValidator() {
    SchemaValidator validator;

    validator.requireTable("books")
             .requireColumn("books", "id", "TEXT")
             .requireColumn("books", "title", "TEXT")
             .requireColumn("books", "author", "TEXT")
             .requireColumn("books", "file_path", "TEXT")
             .requireColumn("books", "file_type", "TEXT")
             .requireColumn("books", "cover_data", "BLOB")
             .requireColumn("books", "added_at", "INTEGER")
             .requireColumn("books", "last_read_at", "INTEGER")
             .requireColumn("books", "total_pages", "INTEGER")
             .requireNotNull("books", "title")
             .requireNotNull("books", "file_path")
             .requireNotNull("books", "file_type");

    validator.requireTable("annotations")
             .requireColumn("annotations", "id", "TEXT")
             .requireColumn("annotations", "book_id", "TEXT")
             .requireColumn("annotations", "annotation_type", "TEXT")
             .requireColumn("annotations", "start_percent", "REAL")
             .requireColumn("annotations", "end_percent", "REAL")
             .requireColumn("annotations", "page_number", "INTEGER")
             .requireColumn("annotations", "color", "TEXT")
             .requireColumn("annotations", "selected_text", "TEXT")
             .requireColumn("annotations", "note_text", "TEXT")
             .requireColumn("annotations", "created_at", "INTEGER")
             .requireNotNull("annotations", "book_id")
             .requireIndex("annotations", "idx_annotations_book_id")
             .requireCascade("annotations", "book_id", "books");

    validator.requireTable("reading_positions")
             .requireColumn("reading_positions", "book_id", "TEXT")
             .requireColumn("reading_positions", "percent", "REAL")
             .requireColumn("reading_positions", "page_number", "INTEGER")
             .requireColumn("reading_positions", "updated_at", "INTEGER")
             .requireCascade("reading_positions", "book_id", "books");

    return validator;
}

} // namespace omnireader
