/**
 * @file annotation_repository.cpp
 * @brief Implementation of AnnotationRepository
 */

#include "omnireader/annotation_repository.hpp"

namespace omnireader {

AnnotationRepository::AnnotationRepository(Connection& conn)
    : Repository(conn, "annotations", "id",
                 "id, book_id, annotation_type, start_percent, end_percent, "
                 "page_number, color, selected_text, note_text, created_at") {}

void AnnotationRepository::insert(const Annotation& annotation) {
    auto stmt = conn_.prepare(R"(
        INSERT INTO annotations (id, book_id, annotation_type, start_percent, end_percent,
                                 page_number, color, selected_text, note_text, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    bindForInsert(stmt, annotation);
    stmt.execute();
}

std::vector<Annotation> AnnotationRepository::findByBook(const std::string& bookId) {
    auto stmt = conn_.prepare(selectClause() +
        " WHERE book_id = ? ORDER BY start_percent ASC, created_at ASC, rowid ASC");
    stmt.bind(1, bookId);
    return collect(stmt);
}

Annotation AnnotationRepository::fromRow(Statement& stmt) {
    Annotation annotation;
    annotation.id = stmt.columnString(0);
    annotation.bookId = stmt.columnString(1);

    std::string token = stmt.columnString(2);
    auto type = annotationTypeFromString(token);
    if (!type) {
        throw SchemaException("Annotation '" + annotation.id +
                              "' has unknown annotation_type '" + token + "'");
    }
    annotation.annotationType = *type;

    annotation.startPercent = stmt.columnDouble(3);
    annotation.endPercent = stmt.columnDouble(4);
    annotation.pageNumber = stmt.columnUInt32(5);
    annotation.color = stmt.columnString(6);
    annotation.selectedText = stmt.columnOptionalString(7);
    annotation.noteText = stmt.columnOptionalString(8);
    annotation.createdAt = stmt.columnInt64(9);
    return annotation;
}

void AnnotationRepository::bindForInsert(Statement& stmt, const Annotation& annotation) {
    stmt.bind(1, annotation.id)
        .bind(2, annotation.bookId)
        .bind(3, toString(annotation.annotationType))
        .bind(4, annotation.startPercent)
        .bind(5, annotation.endPercent)
        .bind(6, annotation.pageNumber)
        .bind(7, annotation.color)
        .bind(8, annotation.selectedText)
        .bind(9, annotation.noteText)
        .bind(10, annotation.createdAt);
}

} // namespace omnireader
