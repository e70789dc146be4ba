/**
 * @file book_repository.hpp
 * @brief Data access for the books table
 */

#pragma once

#include <string>
#include <vector>
#include "book.hpp"
#include "repository.hpp"

namespace omnireader {

class BookRepository : public Repository<Book> {
public:
    explicit BookRepository(Connection& conn);

    /**
     * @throws ConstraintException if file_path (or id) is already present
     */
    void insert(const Book& book);

    /**
     * @brief All books, most recently added first
     */
    std::vector<Book> findAll();

    bool existsByPath(const std::string& filePath);

    /**
     * @return false if no book has this id
     */
    bool touchLastRead(const std::string& id, int64_t timestamp);

protected:
    Book fromRow(Statement& stmt) override;
    void bindForInsert(Statement& stmt, const Book& book) override;
};

} // namespace omnireader
