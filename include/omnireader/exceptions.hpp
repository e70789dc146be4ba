/**
 * @file exceptions.hpp
 * @brief Error taxonomy shared by the entities, the store and ingestion
 *
 * Every failure raised by this library derives from OmniReaderException
 * and carries one ErrorKind from a closed set:
 *
 *   Database           - any SQLite failure (open, query, constraint, ...)
 *   FileNotFound       - a book path handed to ingestion does not exist
 *   UnsupportedFormat  - the file extension is not a known BookType
 *   ParseError         - surfaced from an external metadata parser
 *   IoError            - filesystem failure outside the store
 *
 * Callers can catch OmniReaderException and switch on kind(), or catch a
 * concrete type when they care about a specific failure. A lookup that
 * finds nothing is not an error; those return std::optional.
 */

#pragma once

#include <exception>
#include <string>
#include <sqlite3.h>

namespace omnireader {

/**
 * @brief Closed set of failure kinds
 */
enum class ErrorKind {
    Database,
    FileNotFound,
    UnsupportedFormat,
    ParseError,
    IoError
};

/**
 * @brief Human-readable label for an error kind
 */
inline const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Database:          return "Database error";
        case ErrorKind::FileNotFound:      return "File not found";
        case ErrorKind::UnsupportedFormat: return "Unsupported format";
        case ErrorKind::ParseError:        return "Parse error";
        case ErrorKind::IoError:           return "IO error";
    }
    return "Unknown error";
}

/**
 * @brief Base exception for everything this library throws
 */
class OmniReaderException : public std::exception {
public:
    OmniReaderException(ErrorKind kind, std::string message)
        : kind_(kind)
        , message_(std::move(message))
        , fullMessage_(std::string(toString(kind)) + ": " + message_)
    {}

    const char* what() const noexcept override {
        return fullMessage_.c_str();
    }

    ErrorKind kind() const noexcept {
        return kind_;
    }

    const std::string& message() const noexcept {
        return message_;
    }

protected:
    ErrorKind kind_;
    std::string message_;
    std::string fullMessage_;
};

/**
 * @brief Base exception for all storage errors
 *
 * Carries the SQLite result code (extended when the connection enables
 * extended result codes). Subclasses narrow down where it failed.
 */
class DatabaseException : public OmniReaderException {
public:
    explicit DatabaseException(std::string message, int errorCode = 0)
        : OmniReaderException(ErrorKind::Database, std::move(message))
        , errorCode_(errorCode)
    {
        if (errorCode_ != 0) {
            fullMessage_ += " (SQLite error code: " + std::to_string(errorCode_) + ")";
        }
    }

    int errorCode() const noexcept {
        return errorCode_;
    }

    /**
     * @brief Primary result code with the extended bits stripped
     */
    int primaryCode() const noexcept {
        return errorCode_ & 0xFF;
    }

private:
    int errorCode_;
};

/**
 * @brief Thrown when the database file cannot be opened
 */
class ConnectionException : public DatabaseException {
public:
    explicit ConnectionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Connection error: " + message, errorCode) {}
};

/**
 * @brief Thrown when a statement fails to prepare or execute
 */
class QueryException : public DatabaseException {
public:
    QueryException(const std::string& message, const std::string& sql, int errorCode = 0)
        : DatabaseException("Query error: " + message, errorCode)
        , sql_(sql)
    {
        fullMessage_ += "\nSQL: " + sql_;
    }

    const std::string& sql() const noexcept {
        return sql_;
    }

private:
    std::string sql_;
};

/**
 * @brief Thrown on UNIQUE, FOREIGN KEY, CHECK or NOT NULL violations
 */
class ConstraintException : public DatabaseException {
public:
    explicit ConstraintException(const std::string& message, int errorCode = 0)
        : DatabaseException("Constraint violation: " + message, errorCode) {}

    bool isUnique() const noexcept {
        return errorCode() == SQLITE_CONSTRAINT_UNIQUE
            || errorCode() == SQLITE_CONSTRAINT_PRIMARYKEY;
    }

    bool isForeignKey() const noexcept {
        return errorCode() == SQLITE_CONSTRAINT_FOREIGNKEY;
    }
};

/**
 * @brief Thrown when BEGIN/COMMIT/ROLLBACK fails
 */
class TransactionException : public DatabaseException {
public:
    explicit TransactionException(const std::string& message, int errorCode = 0)
        : DatabaseException("Transaction error: " + message, errorCode) {}
};

/**
 * @brief Thrown when the on-disk schema or stored data is not what we expect
 */
class SchemaException : public DatabaseException {
public:
    explicit SchemaException(const std::string& message)
        : DatabaseException("Schema error: " + message) {}
};

/**
 * @brief A path handed to ingestion does not exist
 */
class FileNotFoundException : public OmniReaderException {
public:
    explicit FileNotFoundException(const std::string& path)
        : OmniReaderException(ErrorKind::FileNotFound, path)
        , path_(path) {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief The file extension does not name a supported BookType
 */
class UnsupportedFormatException : public OmniReaderException {
public:
    explicit UnsupportedFormatException(const std::string& extension)
        : OmniReaderException(ErrorKind::UnsupportedFormat, extension)
        , extension_(extension) {}

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string extension_;
};

/**
 * @brief Failure reported by an external metadata parser
 */
class ParseException : public OmniReaderException {
public:
    explicit ParseException(const std::string& message)
        : OmniReaderException(ErrorKind::ParseError, message) {}
};

/**
 * @brief Filesystem failure outside the store
 */
class IoException : public OmniReaderException {
public:
    explicit IoException(const std::string& message)
        : OmniReaderException(ErrorKind::IoError, message) {}
};

} // namespace omnireader
