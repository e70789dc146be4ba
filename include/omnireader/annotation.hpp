/**
 * @file annotation.hpp
 * @brief Annotation and reading position entities
 *
 * Positions inside a book are percentages in [0, 100] so that they stay
 * meaningful across re-layout; page numbers are display hints only.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace omnireader {

constexpr double kMinPercent = 0.0;
constexpr double kMaxPercent = 100.0;

/**
 * @brief Clamp a position into [kMinPercent, kMaxPercent]; NaN becomes 0
 */
double clampPercent(double percent);

enum class AnnotationType {
    Highlight,
    Note
};

/**
 * @brief Persisted token for an annotation type ("highlight", "note")
 */
const char* toString(AnnotationType type);

std::optional<AnnotationType> annotationTypeFromString(const std::string& token);

/**
 * @brief Fixed highlight palette
 *
 * Each preset maps to exactly one hex string; the hex string is what
 * gets stored.
 */
enum class HighlightColor {
    Yellow,
    Green,
    Blue,
    Pink,
    Orange
};

/**
 * @brief Every palette entry, in palette order (Yellow first)
 */
constexpr HighlightColor kHighlightPalette[] = {
    HighlightColor::Yellow,
    HighlightColor::Green,
    HighlightColor::Blue,
    HighlightColor::Pink,
    HighlightColor::Orange,
};

/**
 * @brief Canonical "#RRGGBB" (uppercase) for a palette entry
 */
const char* hex(HighlightColor color);

/**
 * @brief Case-insensitive reverse lookup of a palette hex string
 * @return std::nullopt if the string is not one of the presets
 */
std::optional<HighlightColor> highlightColorFromHex(const std::string& hexString);

/**
 * @brief A highlight or a note anchored to a book
 *
 * Annotations are never edited in place; replace one by deleting it and
 * inserting a new one.
 */
struct Annotation {
    std::string id;
    std::string bookId;
    AnnotationType annotationType = AnnotationType::Highlight;
    double startPercent = 0.0;
    double endPercent = 0.0;
    uint32_t pageNumber = 0;
    std::string color;
    std::optional<std::string> selectedText;
    std::optional<std::string> noteText;
    int64_t createdAt = 0;

    /**
     * @brief New highlight over [startPercent, endPercent]
     *
     * Both ends are clamped into range and a reversed range is swapped.
     */
    static Annotation highlight(std::string bookId,
                                double startPercent,
                                double endPercent,
                                uint32_t pageNumber,
                                HighlightColor color,
                                std::optional<std::string> selectedText);

    /**
     * @brief New point note; end equals start, color is the first palette entry
     */
    static Annotation note(std::string bookId,
                           double startPercent,
                           uint32_t pageNumber,
                           std::string noteText);
};

bool operator==(const Annotation& lhs, const Annotation& rhs);
bool operator!=(const Annotation& lhs, const Annotation& rhs);

/**
 * @brief Where the user is in a book; at most one per book
 */
struct ReadingPosition {
    std::string bookId;
    double percent = 0.0;
    uint32_t pageNumber = 0;
    int64_t updatedAt = 0;

    static ReadingPosition create(std::string bookId, double percent, uint32_t pageNumber);
};

bool operator==(const ReadingPosition& lhs, const ReadingPosition& rhs);
bool operator!=(const ReadingPosition& lhs, const ReadingPosition& rhs);

} // namespace omnireader
