/**
 * @file position_repository.hpp
 * @brief Data access for the reading_positions table
 */

#pragma once

#include "annotation.hpp"
#include "repository.hpp"

namespace omnireader {

/**
 * @brief One row per book, keyed by book_id
 *
 * findById() takes the book id.
 */
class ReadingPositionRepository : public Repository<ReadingPosition> {
public:
    explicit ReadingPositionRepository(Connection& conn);

    /**
     * @brief Insert the position, or overwrite the existing row for the book
     *
     * A single INSERT ... ON CONFLICT statement, so there is never a
     * window in which the book has zero or two rows.
     *
     * @throws ConstraintException if the book does not exist
     */
    void upsert(const ReadingPosition& position);

protected:
    ReadingPosition fromRow(Statement& stmt) override;
    void bindForInsert(Statement& stmt, const ReadingPosition& position) override;
};

} // namespace omnireader
