/**
 * @file main.cpp
 * @brief Walk through a library session
 *
 * Usage: omnireader_example [library.db] [book.pdf|book.epub ...]
 *
 * Without arguments the library lives in memory and a sample book is
 * added by hand. Any book files given are imported with a parser that
 * only knows the file name, then listed with their annotations.
 */

#include <iomanip>
#include <iostream>

#include <spdlog/spdlog.h>

#include "omnireader/omnireader.hpp"

using namespace omnireader;

// ========== Stand-in parser ==========
// A real host plugs in its PDF and EPUB parsers here

class FileNameExtractor : public MetadataExtractor {
public:
    BookMetadata extract(const std::string&, BookType type) const override {
        BookMetadata metadata;
        metadata.totalPages = type == BookType::Pdf ? 1 : 0;
        return metadata;
    }
};

// ========== Demo Functions ==========

void printSection(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void demonstrateImport(LibraryStore& store, int argc, char* argv[]) {
    printSection("Adding Books");

    if (argc <= 2) {
        Book book = Book::create("Dune", std::string("Frank Herbert"), "/books/dune.epub",
                                 BookType::Epub, 48);
        store.insertBookIfAbsent(book);
        std::cout << "  Added sample book '" << book.title << "'\n";
        return;
    }

    FileNameExtractor extractor;
    BookImporter importer(store, extractor);
    for (int i = 2; i < argc; ++i) {
        try {
            if (auto book = importer.importBook(argv[i])) {
                std::cout << "  Imported '" << book->title << "' (" << book->id << ")\n";
            } else {
                std::cout << "  Already in library: " << argv[i] << "\n";
            }
        } catch (const OmniReaderException& e) {
            std::cout << "  Skipped " << argv[i] << ": " << e.what() << "\n";
        }
    }
}

void demonstrateReading(LibraryStore& store, const Book& book) {
    printSection("Reading '" + book.title + "'");

    store.updateLastRead(book.id);
    store.saveReadingPosition(ReadingPosition::create(book.id, 12.5, 6));

    store.insertAnnotation(Annotation::highlight(book.id, 10.0, 11.5, 5, HighlightColor::Green,
                                                 std::string("Fear is the mind-killer.")));
    store.insertAnnotation(Annotation::note(book.id, 3.0, 2, "Check the appendix"));

    auto position = store.getReadingPosition(book.id);
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  Position: " << position->percent << "% (page " << position->pageNumber << ")\n";

    std::cout << "  Annotations:\n";
    for (const auto& a : store.getAnnotations(book.id)) {
        std::cout << "    " << std::setw(5) << a.startPercent << "%  "
                  << toString(a.annotationType) << " " << a.color << "  "
                  << a.noteText.value_or(a.selectedText.value_or("")) << "\n";
    }
}

void demonstrateLibrary(LibraryStore& store) {
    printSection("Library");

    for (const auto& book : store.getAllBooks()) {
        std::cout << "  " << book.title
                  << " by " << book.author.value_or("unknown author")
                  << " [" << extension(book.fileType) << ", "
                  << book.totalPages << " pages]\n";
    }
}

void demonstrateErrorHandling(LibraryStore& store, const Book& book) {
    printSection("Error Handling");

    Book copy = Book::create("Another Dune", std::nullopt, book.filePath, book.fileType, 0);
    try {
        store.insertBook(copy);
    } catch (const ConstraintException& e) {
        std::cout << "  Duplicate path rejected: " << e.what() << "\n";
    }

    try {
        store.insertAnnotation(Annotation::note("no-such-book", 1.0, 1, "orphan"));
    } catch (const ConstraintException& e) {
        std::cout << "  Orphan annotation rejected: " << e.what() << "\n";
    }
}

// ========== Main ==========

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "OmniReader library store v" << VERSION_STRING
              << " (SQLite " << sqliteVersion() << ")\n";

    try {
        auto store = argc > 1 ? LibraryStore::open(argv[1]) : LibraryStore::inMemory();

        demonstrateImport(*store, argc, argv);

        auto books = store->getAllBooks();
        if (books.empty()) {
            std::cout << "\nNo books in the library.\n";
            return 0;
        }

        demonstrateReading(*store, books.front());
        demonstrateLibrary(*store);
        demonstrateErrorHandling(*store, books.front());

        printSection("Cleanup");
        if (argc <= 1) {
            store->deleteBook(books.front().id);
            std::cout << "  Deleted '" << books.front().title << "'; annotations left: "
                      << store->getAnnotations(books.front().id).size() << "\n";
        } else {
            std::cout << "  Library kept at " << store->path() << "\n";
        }

    } catch (const DatabaseException& e) {
        std::cerr << "Database error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
