/**
 * @file book_repository.cpp
 * @brief Implementation of BookRepository
 */

#include "omnireader/book_repository.hpp"

namespace omnireader {

BookRepository::BookRepository(Connection& conn)
    : Repository(conn, "books", "id",
                 "id, title, author, file_path, file_type, cover_data, "
                 "added_at, last_read_at, total_pages") {}

void BookRepository::insert(const Book& book) {
    auto stmt = conn_.prepare(R"(
        INSERT INTO books (id, title, author, file_path, file_type, cover_data,
                           added_at, last_read_at, total_pages)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    bindForInsert(stmt, book);
    stmt.execute();
}

std::vector<Book> BookRepository::findAll() {
    // rowid breaks ties between books added within the same second
    auto stmt = conn_.prepare(selectClause() + " ORDER BY added_at DESC, rowid DESC");
    return collect(stmt);
}

bool BookRepository::existsByPath(const std::string& filePath) {
    auto stmt = conn_.prepare("SELECT 1 FROM books WHERE file_path = ? LIMIT 1");
    stmt.bind(1, filePath);
    return stmt.step();
}

bool BookRepository::touchLastRead(const std::string& id, int64_t timestamp) {
    auto stmt = conn_.prepare("UPDATE books SET last_read_at = ? WHERE id = ?");
    stmt.bind(1, timestamp).bind(2, id).execute();
    return conn_.changes() > 0;
}

Book BookRepository::fromRow(Statement& stmt) {
    Book book;
    book.id = stmt.columnString(0);
    book.title = stmt.columnString(1);
    book.author = stmt.columnOptionalString(2);
    book.filePath = stmt.columnString(3);

    std::string token = stmt.columnString(4);
    auto fileType = bookTypeFromToken(token);
    if (!fileType) {
        throw SchemaException("Book '" + book.id + "' has unknown file_type '" + token + "'");
    }
    book.fileType = *fileType;

    book.coverData = stmt.columnOptionalBlob(5);
    book.addedAt = stmt.columnInt64(6);
    book.lastReadAt = stmt.columnOptionalInt64(7);
    book.totalPages = stmt.columnUInt32(8);
    return book;
}

void BookRepository::bindForInsert(Statement& stmt, const Book& book) {
    stmt.bind(1, book.id)
        .bind(2, book.title)
        .bind(3, book.author)
        .bind(4, book.filePath)
        .bind(5, extension(book.fileType))
        .bind(6, book.coverData)
        .bind(7, book.addedAt)
        .bind(8, book.lastReadAt)
        .bind(9, book.totalPages);
}

} // namespace omnireader
