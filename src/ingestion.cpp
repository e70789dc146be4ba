/**
 * @file ingestion.cpp
 * @brief Implementation of the metadata ingestion boundary
 */

#include "omnireader/ingestion.hpp"
#include "omnireader/exceptions.hpp"
#include "omnireader/library_store.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace omnireader {

namespace {

std::optional<std::string> nonBlank(const std::optional<std::string>& text) {
    if (!text) {
        return std::nullopt;
    }
    auto begin = text->find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    auto end = text->find_last_not_of(" \t\r\n");
    return text->substr(begin, end - begin + 1);
}

std::string absolutePath(const std::string& filePath) {
    std::error_code ec;
    fs::path absolute = fs::absolute(filePath, ec);
    if (ec) {
        throw IoException("Cannot resolve '" + filePath + "': " + ec.message());
    }
    return absolute.lexically_normal().string();
}

void requireRegularFile(const std::string& filePath) {
    std::error_code ec;
    fs::file_status status = fs::status(filePath, ec);
    if (status.type() == fs::file_type::not_found) {
        throw FileNotFoundException(filePath);
    }
    if (ec) {
        throw IoException("Cannot stat '" + filePath + "': " + ec.message());
    }
    if (status.type() != fs::file_type::regular) {
        throw IoException("'" + filePath + "' is not a regular file");
    }
}

} // namespace

BookType bookTypeForPath(const std::string& filePath) {
    std::string ext = fs::path(filePath).extension().string();
    auto type = bookTypeFromExtension(ext);
    if (!type) {
        throw UnsupportedFormatException(ext.empty() ? ext : ext.substr(1));
    }
    return *type;
}

Book bookFromMetadata(const std::string& filePath, BookType type, const BookMetadata& metadata) {
    std::string title = nonBlank(metadata.title).value_or(fs::path(filePath).stem().string());

    Book book = Book::create(std::move(title), nonBlank(metadata.author),
                             filePath, type, metadata.totalPages);
    book.coverData = metadata.coverData;
    return book;
}

BookImporter::BookImporter(LibraryStore& store, const MetadataExtractor& extractor)
    : store_(store)
    , extractor_(extractor) {}

std::optional<Book> BookImporter::importBook(const std::string& filePath) {
    std::string path = absolutePath(filePath);
    BookType type = bookTypeForPath(path);
    requireRegularFile(path);

    if (store_.bookExistsByPath(path)) {
        spdlog::info("'{}' is already in the library", path);
        return std::nullopt;
    }

    BookMetadata metadata;
    try {
        metadata = extractor_.extract(path, type);
    } catch (const OmniReaderException&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseException("Failed to read '" + path + "': " + e.what());
    }

    Book book = bookFromMetadata(path, type, metadata);

    // Another thread may have imported the same file while we parsed
    if (!store_.insertBookIfAbsent(book)) {
        return std::nullopt;
    }

    spdlog::info("Imported '{}' as {} ({} {}, {} pages)",
                 book.title, book.id, extension(type),
                 book.coverData ? "with cover" : "no cover", book.totalPages);
    return book;
}

} // namespace omnireader
