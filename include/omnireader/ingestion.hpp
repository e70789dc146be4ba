/**
 * @file ingestion.hpp
 * @brief Boundary between document parsers and the library
 *
 * PDF and EPUB parsing live outside this library. A parser hands back a
 * BookMetadata and nothing else; how it was produced (document info
 * dictionary, OPF metadata, filename fallback) does not matter here.
 * Rendering pages, extracting chapter text and walking tables of
 * contents are the host's business and never go through the store.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "book.hpp"

namespace omnireader {

class LibraryStore;

/**
 * @brief What a parser reports about a book file
 */
struct BookMetadata {
    std::optional<std::string> title;
    std::optional<std::string> author;
    std::optional<std::vector<uint8_t>> coverData;
    uint32_t totalPages = 0;
};

/**
 * @brief Interface implemented by external document parsers
 */
class MetadataExtractor {
public:
    virtual ~MetadataExtractor() = default;

    /**
     * @brief Read metadata from a file already known to exist
     * @throws ParseException if the document cannot be read
     */
    virtual BookMetadata extract(const std::string& filePath, BookType type) const = 0;
};

/**
 * @brief Book type from a path's extension
 * @throws UnsupportedFormatException for anything but .pdf / .epub
 */
BookType bookTypeForPath(const std::string& filePath);

/**
 * @brief Build a new Book from parser output
 *
 * A missing or blank title falls back to the file name without its
 * extension. A blank author is treated as missing.
 */
Book bookFromMetadata(const std::string& filePath, BookType type, const BookMetadata& metadata);

/**
 * @brief Adds book files to a library
 *
 *   BookImporter importer(*store, pdfAndEpubParser);
 *   if (auto book = importer.importBook("/books/dune.epub")) {
 *       ...
 *   }
 */
class BookImporter {
public:
    BookImporter(LibraryStore& store, const MetadataExtractor& extractor);

    /**
     * @brief Parse a file and add it to the library
     *
     * The path is made absolute before anything else.
     *
     * @return the stored book, or std::nullopt if the path was already
     *         in the library
     * @throws UnsupportedFormatException, FileNotFoundException,
     *         IoException, ParseException, DatabaseException
     */
    std::optional<Book> importBook(const std::string& filePath);

private:
    LibraryStore& store_;
    const MetadataExtractor& extractor_;
};

} // namespace omnireader
