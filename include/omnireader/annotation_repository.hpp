/**
 * @file annotation_repository.hpp
 * @brief Data access for the annotations table
 */

#pragma once

#include <string>
#include <vector>
#include "annotation.hpp"
#include "repository.hpp"

namespace omnireader {

class AnnotationRepository : public Repository<Annotation> {
public:
    explicit AnnotationRepository(Connection& conn);

    /**
     * @throws ConstraintException if bookId does not name an existing book
     */
    void insert(const Annotation& annotation);

    /**
     * @brief Annotations of one book by ascending start position
     *
     * Served from idx_annotations_book_id. Equal starts come back in
     * creation order.
     */
    std::vector<Annotation> findByBook(const std::string& bookId);

protected:
    Annotation fromRow(Statement& stmt) override;
    void bindForInsert(Statement& stmt, const Annotation& annotation) override;
};

} // namespace omnireader
