/**
 * @file library_store.hpp
 * @brief The persistent library: books, annotations and reading positions
 *
 * LibraryStore owns one SQLite connection and a mutex. Every public
 * operation takes the mutex for its whole duration, so operations from
 * different threads run one at a time in the order they acquire the
 * lock. There is no connection pool and no asynchronous mode; a slow
 * operation blocks the others.
 *
 * Entities go in and come out by value. A Book returned by getBook() is
 * a copy; changing it has no effect until it is written back.
 *
 * Usage:
 *   auto store = LibraryStore::open("/home/me/.omnireader/library.db");
 *   auto book = Book::create("Dune", "Frank Herbert", "/books/dune.epub",
 *                            BookType::Epub, 48);
 *   store->insertBook(book);
 *   store->saveReadingPosition(ReadingPosition::create(book.id, 12.5, 6));
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "annotation.hpp"
#include "annotation_repository.hpp"
#include "book.hpp"
#include "book_repository.hpp"
#include "connection.hpp"
#include "position_repository.hpp"

namespace omnireader {

/**
 * @brief Configuration for opening a LibraryStore
 */
struct StoreOptions {
    ConnectionOptions connection;

    // Check tables, columns, index and cascades after initialization
    bool validateSchema = true;
};

class LibraryStore {
public:
    /**
     * @brief Open (creating if needed) the library at path
     *
     * Creates missing tables; an existing library is left untouched.
     * Foreign keys are always switched on, whatever the options say,
     * because deleting a book relies on ON DELETE CASCADE.
     *
     * @throws ConnectionException if the file cannot be opened
     * @throws SchemaException if the schema does not match
     */
    static std::unique_ptr<LibraryStore> open(const std::string& path,
                                              const StoreOptions& options = StoreOptions{});

    /**
     * @brief Transient library that disappears with the store
     */
    static std::unique_ptr<LibraryStore> inMemory(const StoreOptions& options = StoreOptions{});

    /**
     * @brief Take over an already open connection
     */
    LibraryStore(std::unique_ptr<Connection> conn, const StoreOptions& options);

    ~LibraryStore();

    LibraryStore(const LibraryStore&) = delete;
    LibraryStore& operator=(const LibraryStore&) = delete;

    // ========== Books ==========

    /**
     * @throws ConstraintException if a book with the same file path exists
     */
    void insertBook(const Book& book);

    /**
     * @brief Insert unless the path is already in the library
     *
     * The check and the insert run in one transaction under the lock.
     *
     * @return true if inserted, false if the path was already present
     */
    bool insertBookIfAbsent(const Book& book);

    /**
     * @brief Every book, most recently added first
     */
    std::vector<Book> getAllBooks();

    std::optional<Book> getBook(const std::string& id);

    bool bookExistsByPath(const std::string& filePath);

    /**
     * @brief Delete a book together with its annotations and position
     * @return false if there was no such book
     */
    bool deleteBook(const std::string& id);

    /**
     * @brief Stamp the book as read now
     * @return false if there was no such book
     */
    bool updateLastRead(const std::string& id);

    // ========== Annotations ==========

    /**
     * @throws ConstraintException if the annotation's book does not exist
     */
    void insertAnnotation(const Annotation& annotation);

    /**
     * @brief Annotations of a book, ascending by start position
     */
    std::vector<Annotation> getAnnotations(const std::string& bookId);

    /**
     * @return false if there was no such annotation
     */
    bool deleteAnnotation(const std::string& id);

    // ========== Reading positions ==========

    /**
     * @brief Insert or replace the book's reading position
     * @throws ConstraintException if the book does not exist
     */
    void saveReadingPosition(const ReadingPosition& position);

    std::optional<ReadingPosition> getReadingPosition(const std::string& bookId);

    const std::string& path() const { return conn_->path(); }

private:
    /**
     * @brief Run func with the store lock held, logging storage failures
     */
    template<typename Func>
    auto guarded(const char* operation, Func&& func) -> decltype(func());

    std::mutex mutex_;
    std::unique_ptr<Connection> conn_;
    BookRepository books_;
    AnnotationRepository annotations_;
    ReadingPositionRepository positions_;
};

} // namespace omnireader
