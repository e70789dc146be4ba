/**
 * @file library_store.cpp
 * @brief Implementation of LibraryStore
 */

#include "omnireader/library_store.hpp"
#include "omnireader/identity.hpp"
#include "omnireader/schema.hpp"
#include "omnireader/transaction.hpp"

#include <spdlog/spdlog.h>

namespace omnireader {

namespace {

std::unique_ptr<Connection> requireOpen(std::unique_ptr<Connection> conn) {
    if (!conn || !conn->isOpen()) {
        throw ConnectionException("LibraryStore needs an open connection");
    }
    return conn;
}

ConnectionOptions withForeignKeys(ConnectionOptions options) {
    options.enableForeignKeys = true;
    return options;
}

} // namespace

template<typename Func>
auto LibraryStore::guarded(const char* operation, Func&& func) -> decltype(func()) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return func();
    } catch (const DatabaseException& e) {
        spdlog::error("{} on '{}' failed: {}", operation, conn_->path(), e.what());
        throw;
    }
}

std::unique_ptr<LibraryStore> LibraryStore::open(const std::string& path,
                                                 const StoreOptions& options) {
    auto conn = Connection::open(path, withForeignKeys(options.connection));
    return std::make_unique<LibraryStore>(std::move(conn), options);
}

std::unique_ptr<LibraryStore> LibraryStore::inMemory(const StoreOptions& options) {
    auto conn = Connection::inMemory(withForeignKeys(options.connection));
    return std::make_unique<LibraryStore>(std::move(conn), options);
}

LibraryStore::LibraryStore(std::unique_ptr<Connection> conn, const StoreOptions& options)
    : conn_(requireOpen(std::move(conn)))
    , books_(*conn_)
    , annotations_(*conn_)
    , positions_(*conn_)
{
    if (!conn_->foreignKeysEnabled()) {
        throw SchemaException("Foreign key enforcement is off on '" + conn_->path() +
                              "'; deleting a book would not cascade");
    }

    if (!options.connection.readOnly) {
        initializeSchema(*conn_);
    }

    if (options.validateSchema) {
        librarySchemaValidator().validateOrThrow(*conn_);
    }

    spdlog::info("Opened library '{}' ({} books)", conn_->path(), books_.count());
}

LibraryStore::~LibraryStore() {
    spdlog::debug("Closing library '{}'", conn_->path());
}

// ========== Books ==========

void LibraryStore::insertBook(const Book& book) {
    guarded("insertBook", [&] {
        books_.insert(book);
        spdlog::debug("Inserted book {} '{}' ({})", book.id, book.title, book.filePath);
    });
}

bool LibraryStore::insertBookIfAbsent(const Book& book) {
    return guarded("insertBookIfAbsent", [&] {
        return withTransaction(*conn_, TransactionType::Immediate, [&] {
            if (books_.existsByPath(book.filePath)) {
                spdlog::info("Skipping '{}': already in the library", book.filePath);
                return false;
            }
            books_.insert(book);
            spdlog::debug("Inserted book {} '{}' ({})", book.id, book.title, book.filePath);
            return true;
        });
    });
}

std::vector<Book> LibraryStore::getAllBooks() {
    return guarded("getAllBooks", [&] {
        return books_.findAll();
    });
}

std::optional<Book> LibraryStore::getBook(const std::string& id) {
    return guarded("getBook", [&] {
        return books_.findById(id);
    });
}

bool LibraryStore::bookExistsByPath(const std::string& filePath) {
    return guarded("bookExistsByPath", [&] {
        return books_.existsByPath(filePath);
    });
}

bool LibraryStore::deleteBook(const std::string& id) {
    return guarded("deleteBook", [&] {
        // ON DELETE CASCADE removes annotations and position in the same statement
        bool deleted = books_.deleteById(id);
        if (deleted) {
            spdlog::debug("Deleted book {}", id);
        }
        return deleted;
    });
}

bool LibraryStore::updateLastRead(const std::string& id) {
    return guarded("updateLastRead", [&] {
        return books_.touchLastRead(id, nowSeconds());
    });
}

// ========== Annotations ==========

void LibraryStore::insertAnnotation(const Annotation& annotation) {
    guarded("insertAnnotation", [&] {
        annotations_.insert(annotation);
        spdlog::debug("Inserted {} {} on book {} at {:.2f}%",
                      toString(annotation.annotationType), annotation.id,
                      annotation.bookId, annotation.startPercent);
    });
}

std::vector<Annotation> LibraryStore::getAnnotations(const std::string& bookId) {
    return guarded("getAnnotations", [&] {
        return annotations_.findByBook(bookId);
    });
}

bool LibraryStore::deleteAnnotation(const std::string& id) {
    return guarded("deleteAnnotation", [&] {
        return annotations_.deleteById(id);
    });
}

// ========== Reading positions ==========

void LibraryStore::saveReadingPosition(const ReadingPosition& position) {
    guarded("saveReadingPosition", [&] {
        positions_.upsert(position);
    });
}

std::optional<ReadingPosition> LibraryStore::getReadingPosition(const std::string& bookId) {
    return guarded("getReadingPosition", [&] {
        return positions_.findById(bookId);
    });
}

} // namespace omnireader
