/**
 * @file position_repository.cpp
 * @brief Implementation of ReadingPositionRepository
 */

#include "omnireader/position_repository.hpp"

namespace omnireader {

ReadingPositionRepository::ReadingPositionRepository(Connection& conn)
    : Repository(conn, "reading_positions", "book_id",
                 "book_id, percent, page_number, updated_at") {}

void ReadingPositionRepository::upsert(const ReadingPosition& position) {
    auto stmt = conn_.prepare(R"(
        INSERT INTO reading_positions (book_id, percent, page_number, updated_at)
        VALUES (:book_id, :percent, :page_number, :updated_at)
        ON CONFLICT(book_id) DO UPDATE SET
            percent = excluded.percent,
            page_number = excluded.page_number,
            updated_at = excluded.updated_at
    )");
    bindForInsert(stmt, position);
    stmt.execute();
}

ReadingPosition ReadingPositionRepository::fromRow(Statement& stmt) {
    ReadingPosition position;
    position.bookId = stmt.columnString(0);
    position.percent = stmt.columnDouble(1);
    position.pageNumber = stmt.columnUInt32(2);
    position.updatedAt = stmt.columnInt64(3);
    return position;
}

void ReadingPositionRepository::bindForInsert(Statement& stmt, const ReadingPosition& position) {
    stmt.bind(":book_id", position.bookId)
        .bind(":percent", position.percent)
        .bind(":page_number", position.pageNumber)
        .bind(":updated_at", position.updatedAt);
}

} // namespace omnireader
