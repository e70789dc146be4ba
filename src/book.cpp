/**
 * @file book.cpp
 * @brief Book construction and BookType token table
 */

#include "omnireader/book.hpp"
#include "omnireader/identity.hpp"

#include <algorithm>
#include <cctype>

namespace omnireader {

namespace {

struct BookTypeToken {
    BookType type;
    const char* extension;
};

constexpr BookTypeToken kBookTypeTokens[] = {
    {BookType::Pdf, "pdf"},
    {BookType::Epub, "epub"},
};

} // namespace

const char* extension(BookType type) {
    for (const auto& token : kBookTypeTokens) {
        if (token.type == type) {
            return token.extension;
        }
    }
    return "";
}

std::optional<BookType> bookTypeFromExtension(const std::string& ext) {
    std::string lower = (!ext.empty() && ext.front() == '.') ? ext.substr(1) : ext;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& token : kBookTypeTokens) {
        if (lower == token.extension) {
            return token.type;
        }
    }
    return std::nullopt;
}

std::optional<BookType> bookTypeFromToken(const std::string& token) {
    for (const auto& entry : kBookTypeTokens) {
        if (token == entry.extension) {
            return entry.type;
        }
    }
    return std::nullopt;
}

Book Book::create(std::string title,
                  std::optional<std::string> author,
                  std::string filePath,
                  BookType fileType,
                  uint32_t totalPages) {
    Book book;
    book.id = generateId();
    book.title = std::move(title);
    book.author = std::move(author);
    book.filePath = std::move(filePath);
    book.fileType = fileType;
    book.addedAt = nowSeconds();
    book.totalPages = totalPages;
    return book;
}

bool operator==(const Book& lhs, const Book& rhs) {
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.author == rhs.author
        && lhs.filePath == rhs.filePath
        && lhs.fileType == rhs.fileType
        && lhs.coverData == rhs.coverData
        && lhs.addedAt == rhs.addedAt
        && lhs.lastReadAt == rhs.lastReadAt
        && lhs.totalPages == rhs.totalPages;
}

bool operator!=(const Book& lhs, const Book& rhs) {
    return !(lhs == rhs);
}

} // namespace omnireader
