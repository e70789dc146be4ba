/**
 * @file annotation.cpp
 * @brief Annotation/ReadingPosition construction and token tables
 */

#include "omnireader/annotation.hpp"
#include "omnireader/identity.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace omnireader {

namespace {

struct AnnotationTypeToken {
    AnnotationType type;
    const char* token;
};

constexpr AnnotationTypeToken kAnnotationTypeTokens[] = {
    {AnnotationType::Highlight, "highlight"},
    {AnnotationType::Note, "note"},
};

struct ColorHex {
    HighlightColor color;
    const char* hex;
};

constexpr ColorHex kColorHex[] = {
    {HighlightColor::Yellow, "#FFEB3B"},
    {HighlightColor::Green, "#4CAF50"},
    {HighlightColor::Blue, "#2196F3"},
    {HighlightColor::Pink, "#E91E63"},
    {HighlightColor::Orange, "#FF9800"},
};

} // namespace

double clampPercent(double percent) {
    if (std::isnan(percent)) {
        return kMinPercent;
    }
    return std::clamp(percent, kMinPercent, kMaxPercent);
}

const char* toString(AnnotationType type) {
    for (const auto& entry : kAnnotationTypeTokens) {
        if (entry.type == type) {
            return entry.token;
        }
    }
    return "";
}

std::optional<AnnotationType> annotationTypeFromString(const std::string& token) {
    for (const auto& entry : kAnnotationTypeTokens) {
        if (token == entry.token) {
            return entry.type;
        }
    }
    return std::nullopt;
}

const char* hex(HighlightColor color) {
    for (const auto& entry : kColorHex) {
        if (entry.color == color) {
            return entry.hex;
        }
    }
    return "";
}

std::optional<HighlightColor> highlightColorFromHex(const std::string& hexString) {
    std::string upper = hexString;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto& entry : kColorHex) {
        if (upper == entry.hex) {
            return entry.color;
        }
    }
    return std::nullopt;
}

Annotation Annotation::highlight(std::string bookId,
                                 double startPercent,
                                 double endPercent,
                                 uint32_t pageNumber,
                                 HighlightColor color,
                                 std::optional<std::string> selectedText) {
    double start = clampPercent(startPercent);
    double end = clampPercent(endPercent);
    if (end < start) {
        std::swap(start, end);
    }

    Annotation annotation;
    annotation.id = generateId();
    annotation.bookId = std::move(bookId);
    annotation.annotationType = AnnotationType::Highlight;
    annotation.startPercent = start;
    annotation.endPercent = end;
    annotation.pageNumber = pageNumber;
    annotation.color = hex(color);
    annotation.selectedText = std::move(selectedText);
    annotation.createdAt = nowSeconds();
    return annotation;
}

Annotation Annotation::note(std::string bookId,
                            double startPercent,
                            uint32_t pageNumber,
                            std::string noteText) {
    double start = clampPercent(startPercent);

    Annotation annotation;
    annotation.id = generateId();
    annotation.bookId = std::move(bookId);
    annotation.annotationType = AnnotationType::Note;
    annotation.startPercent = start;
    annotation.endPercent = start;
    annotation.pageNumber = pageNumber;
    annotation.color = hex(kHighlightPalette[0]);
    annotation.noteText = std::move(noteText);
    annotation.createdAt = nowSeconds();
    return annotation;
}

bool operator==(const Annotation& lhs, const Annotation& rhs) {
    return lhs.id == rhs.id
        && lhs.bookId == rhs.bookId
        && lhs.annotationType == rhs.annotationType
        && lhs.startPercent == rhs.startPercent
        && lhs.endPercent == rhs.endPercent
        && lhs.pageNumber == rhs.pageNumber
        && lhs.color == rhs.color
        && lhs.selectedText == rhs.selectedText
        && lhs.noteText == rhs.noteText
        && lhs.createdAt == rhs.createdAt;
}

bool operator!=(const Annotation& lhs, const Annotation& rhs) {
    return !(lhs == rhs);
}

ReadingPosition ReadingPosition::create(std::string bookId, double percent, uint32_t pageNumber) {
    ReadingPosition position;
    position.bookId = std::move(bookId);
    position.percent = clampPercent(percent);
    position.pageNumber = pageNumber;
    position.updatedAt = nowSeconds();
    return position;
}

bool operator==(const ReadingPosition& lhs, const ReadingPosition& rhs) {
    return lhs.bookId == rhs.bookId
        && lhs.percent == rhs.percent
        && lhs.pageNumber == rhs.pageNumber
        && lhs.updatedAt == rhs.updatedAt;
}

bool operator!=(const ReadingPosition& lhs, const ReadingPosition& rhs) {
    return !(lhs == rhs);
}

} // namespace omnireader
