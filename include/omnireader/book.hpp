/**
 * @file book.hpp
 * @brief Book entity and its file type
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace omnireader {

/**
 * @brief Format of a book file
 *
 * Persisted as its lowercase extension ("pdf", "epub"), never as an
 * ordinal, so reordering the enumerators does not change stored data.
 */
enum class BookType {
    Pdf,
    Epub
};

/**
 * @brief Lowercase file extension for a book type, without the dot
 */
const char* extension(BookType type);

/**
 * @brief Parse a file extension ("pdf", ".EPUB", ...)
 * @return std::nullopt for anything that is not a supported format
 */
std::optional<BookType> bookTypeFromExtension(const std::string& ext);

/**
 * @brief Parse a stored file_type token; exact match only ("pdf", "epub")
 */
std::optional<BookType> bookTypeFromToken(const std::string& token);

/**
 * @brief A library item
 *
 * filePath is unique across the library. Values handed out by the store
 * are copies; changing one does nothing until it is written back.
 */
struct Book {
    std::string id;
    std::string title;
    std::optional<std::string> author;
    std::string filePath;
    BookType fileType = BookType::Pdf;
    std::optional<std::vector<uint8_t>> coverData;
    int64_t addedAt = 0;
    std::optional<int64_t> lastReadAt;
    uint32_t totalPages = 0;

    /**
     * @brief Create a new book with a fresh id, stamped as added now
     *
     * The path is taken as given; checking that it exists is the job of
     * whoever parsed the file.
     */
    static Book create(std::string title,
                       std::optional<std::string> author,
                       std::string filePath,
                       BookType fileType,
                       uint32_t totalPages);
};

bool operator==(const Book& lhs, const Book& rhs);
bool operator!=(const Book& lhs, const Book& rhs);

} // namespace omnireader
