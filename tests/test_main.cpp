/**
 * @file test_main.cpp
 * @brief Unit tests for the OmniReader library store
 *
 * Most tests run against in-memory stores, so each one starts from an
 * empty library and leaves nothing behind. Tests that need a real file
 * (reopening, a second connection, concurrent writers) use a scratch
 * directory that is removed afterwards.
 */

#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "omnireader/omnireader.hpp"

using namespace omnireader;
namespace fs = std::filesystem;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "  Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
        passed++; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed++; \
    } \
} while(0)

#define ASSERT_TRUE(expr) do { \
    if (!(expr)) throw std::runtime_error("Assertion failed: " #expr); \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::ostringstream oss; \
        oss << "Assertion failed: " << (a) << " != " << (b); \
        throw std::runtime_error(oss.str()); \
    } \
} while(0)

#define ASSERT_THROWS(expr, ExceptionType) do { \
    bool caught = false; \
    try { expr; } catch (const ExceptionType&) { caught = true; } \
    if (!caught) throw std::runtime_error("Expected " #ExceptionType " not thrown"); \
} while(0)

// ========== Helpers ==========

namespace {

Book makeBook(const std::string& path, const std::string& title = "Test Book") {
    return Book::create(title, std::nullopt, path, BookType::Pdf, 100);
}

/**
 * @brief Scratch directory removed on scope exit
 */
struct TempDir {
    fs::path path;

    TempDir()
        : path(fs::temp_directory_path() / ("omnireader-test-" + generateId())) {
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name, const std::string& content = "%PDF-1.7") const {
        fs::path p = path / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    std::string db() const {
        return (path / "library.db").string();
    }
};

class FakeExtractor : public MetadataExtractor {
public:
    BookMetadata metadata;
    bool fail = false;
    mutable int calls = 0;

    BookMetadata extract(const std::string&, BookType) const override {
        ++calls;
        if (fail) {
            throw std::runtime_error("broken cross-reference table");
        }
        return metadata;
    }
};

int64_t countRows(const std::string& dbPath, const std::string& sql, const std::string& key) {
    auto conn = Connection::open(dbPath);
    auto stmt = conn->prepare(sql);
    stmt.bind(1, key);
    stmt.step();
    return stmt.columnInt64(0);
}

} // namespace

// ========== Error Taxonomy Tests ==========

TEST(error_kinds) {
    ASSERT_TRUE(ConstraintException("x").kind() == ErrorKind::Database);
    ASSERT_TRUE(SchemaException("x").kind() == ErrorKind::Database);
    ASSERT_TRUE(FileNotFoundException("/a.pdf").kind() == ErrorKind::FileNotFound);
    ASSERT_TRUE(UnsupportedFormatException("mobi").kind() == ErrorKind::UnsupportedFormat);
    ASSERT_TRUE(ParseException("bad").kind() == ErrorKind::ParseError);
    ASSERT_TRUE(IoException("denied").kind() == ErrorKind::IoError);
}

TEST(error_messages) {
    ASSERT_EQ(std::string(FileNotFoundException("/a.pdf").what()), "File not found: /a.pdf");
    ASSERT_EQ(std::string(UnsupportedFormatException("mobi").what()), "Unsupported format: mobi");
    ASSERT_EQ(std::string(DatabaseException("disk I/O error", SQLITE_IOERR).what()),
              "Database error: disk I/O error (SQLite error code: 10)");
}

// ========== Connection / Statement / Transaction Tests ==========

TEST(connection_open_memory) {
    auto conn = Connection::inMemory();
    ASSERT_TRUE(conn->isOpen());
    ASSERT_EQ(conn->path(), ":memory:");
    ASSERT_TRUE(conn->foreignKeysEnabled());
}

TEST(connection_foreign_keys_off) {
    ConnectionOptions opts;
    opts.enableForeignKeys = false;
    auto conn = Connection::inMemory(opts);
    ASSERT_TRUE(!conn->foreignKeysEnabled());
}

TEST(connection_constraint_classified) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (id INTEGER PRIMARY KEY, path TEXT UNIQUE)");
    conn->execute("INSERT INTO t (path) VALUES ('/a.pdf')");

    try {
        conn->execute("INSERT INTO t (path) VALUES ('/a.pdf')");
        throw std::runtime_error("duplicate insert succeeded");
    } catch (const ConstraintException& e) {
        ASSERT_TRUE(e.isUnique());
        ASSERT_EQ(e.primaryCode(), SQLITE_CONSTRAINT);
    }
}

TEST(connection_query_error) {
    auto conn = Connection::inMemory();
    ASSERT_THROWS(conn->execute("SELECT * FROM nonexistent"), QueryException);
    ASSERT_THROWS(conn->prepare("SELEKT 1"), QueryException);
}

TEST(statement_optional_binding) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, data BLOB)");

    std::optional<std::string> none;
    std::optional<Blob> cover = Blob{0x89, 0x50, 0x4E, 0x47};
    conn->prepare("INSERT INTO t (name, data) VALUES (?, ?)")
        .bind(1, none).bind(2, cover).execute();

    auto stmt = conn->prepare("SELECT name, data FROM t");
    ASSERT_TRUE(stmt.step());
    ASSERT_TRUE(!stmt.columnOptionalString(0).has_value());
    ASSERT_TRUE(stmt.columnOptionalBlob(1) == cover);
}

TEST(statement_empty_blob_is_not_null) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (data BLOB)");
    conn->prepare("INSERT INTO t (data) VALUES (?)").bind(1, Blob{}).execute();

    auto stmt = conn->prepare("SELECT data FROM t");
    ASSERT_TRUE(stmt.step());
    ASSERT_TRUE(stmt.columnOptionalBlob(0).has_value());
    ASSERT_TRUE(stmt.columnOptionalBlob(0)->empty());
}

TEST(statement_named_parameters) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (book_id TEXT, page INTEGER)");

    auto stmt = conn->prepare("INSERT INTO t (book_id, page) VALUES (:book_id, :page)");
    stmt.bind(":book_id", std::string("b1")).bind(":page", uint32_t(42)).execute();
    ASSERT_THROWS(stmt.bind(":missing", 1), QueryException);

    auto query = conn->prepare("SELECT page FROM t WHERE book_id = 'b1'");
    ASSERT_TRUE(query.step());
    ASSERT_EQ(query.columnUInt32(0), 42u);
}

TEST(statement_uint32_range_checked) {
    auto conn = Connection::inMemory();
    auto stmt = conn->prepare("SELECT -1, 4294967296");
    ASSERT_TRUE(stmt.step());
    ASSERT_THROWS(stmt.columnUInt32(0), SchemaException);
    ASSERT_THROWS(stmt.columnUInt32(1), SchemaException);
}

TEST(transaction_commit) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (id INTEGER PRIMARY KEY)");

    {
        Transaction txn = conn->beginTransaction();
        conn->execute("INSERT INTO t DEFAULT VALUES");
        txn.commit();
        ASSERT_TRUE(!txn.isActive());
        ASSERT_THROWS(txn.commit(), TransactionException);
    }

    auto stmt = conn->prepare("SELECT COUNT(*) FROM t");
    stmt.step();
    ASSERT_EQ(stmt.columnInt64(0), 1);
}

TEST(transaction_rollback_on_scope_exit) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (id INTEGER PRIMARY KEY)");

    {
        Transaction txn = conn->beginTransaction(TransactionType::Immediate);
        conn->execute("INSERT INTO t DEFAULT VALUES");
    }

    auto stmt = conn->prepare("SELECT COUNT(*) FROM t");
    stmt.step();
    ASSERT_EQ(stmt.columnInt64(0), 0);
}

TEST(transaction_explicit_rollback) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (id INTEGER PRIMARY KEY)");

    Transaction txn = conn->beginTransaction(TransactionType::Immediate);
    conn->execute("INSERT INTO t DEFAULT VALUES");
    txn.rollback();
    ASSERT_TRUE(!txn.isActive());
    ASSERT_THROWS(txn.rollback(), TransactionException);

    auto stmt = conn->prepare("SELECT COUNT(*) FROM t");
    stmt.step();
    ASSERT_EQ(stmt.columnInt64(0), 0);
}

TEST(transaction_exclusive) {
    TempDir dir;
    auto conn = Connection::open(dir.db());
    conn->execute("CREATE TABLE t (id INTEGER PRIMARY KEY)");

    withTransaction(*conn, TransactionType::Exclusive, [&] {
        conn->execute("INSERT INTO t DEFAULT VALUES");
    });

    auto stmt = conn->prepare("SELECT COUNT(*) FROM t");
    stmt.step();
    ASSERT_EQ(stmt.columnInt64(0), 1);
}

TEST(connection_replaced_under_live_statement) {
    auto conn = Connection::inMemory();
    auto stmt = conn->prepare("SELECT 1");
    *conn = Connection(":memory:");
    ASSERT_TRUE(conn->isOpen());

    auto fresh = conn->prepare("SELECT 2");
    ASSERT_TRUE(fresh.step());
    ASSERT_EQ(fresh.columnInt(0), 2);
}

TEST(with_transaction_rolls_back_on_throw) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE t (id INTEGER PRIMARY KEY)");

    auto failing = [&] {
        withTransaction(*conn, TransactionType::Immediate, [&] {
            conn->execute("INSERT INTO t DEFAULT VALUES");
            conn->execute("INSERT INTO missing DEFAULT VALUES");
        });
    };
    ASSERT_THROWS(failing(), QueryException);

    int64_t count = withTransaction(*conn, TransactionType::Deferred, [&] {
        auto stmt = conn->prepare("SELECT COUNT(*) FROM t");
        stmt.step();
        return stmt.columnInt64(0);
    });
    ASSERT_EQ(count, 0);
}

// ========== Schema Tests ==========

TEST(schema_initialize_idempotent) {
    auto conn = Connection::inMemory();
    initializeSchema(*conn);
    conn->execute("INSERT INTO books (id, title, file_path, file_type, added_at) "
                  "VALUES ('b1', 'Kept', '/kept.pdf', 'pdf', 1)");
    initializeSchema(*conn);

    auto stmt = conn->prepare("SELECT COUNT(*) FROM books");
    stmt.step();
    ASSERT_EQ(stmt.columnInt64(0), 1);
    ASSERT_TRUE(librarySchemaValidator().validate(*conn).empty());
}

TEST(schema_validator_reports_problems) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE books (id TEXT PRIMARY KEY, title TEXT)");
    conn->execute("CREATE TABLE annotations (id TEXT PRIMARY KEY, book_id TEXT REFERENCES books(id))");

    SchemaValidator validator;
    validator.requireTable("books")
             .requireTable("reading_positions")
             .requireColumn("books", "file_path", "TEXT")
             .requireNotNull("books", "title")
             .requireIndex("annotations", "idx_annotations_book_id")
             .requireCascade("annotations", "book_id", "books");

    auto errors = validator.validate(*conn);
    ASSERT_EQ(errors.size(), 5u);
    ASSERT_THROWS(validator.validateOrThrow(*conn), SchemaException);
}

TEST(store_rejects_foreign_schema) {
    auto conn = Connection::inMemory();
    conn->execute("CREATE TABLE books (id TEXT PRIMARY KEY)");

    auto openStore = [&] { LibraryStore store(std::move(conn), StoreOptions{}); };
    ASSERT_THROWS(openStore(), SchemaException);
}

TEST(store_requires_foreign_keys) {
    ConnectionOptions opts;
    opts.enableForeignKeys = false;
    auto conn = Connection::inMemory(opts);

    auto openStore = [&] { LibraryStore store(std::move(conn), StoreOptions{}); };
    ASSERT_THROWS(openStore(), SchemaException);
}

// ========== Entity Tests ==========

TEST(book_create) {
    int64_t before = nowSeconds();
    Book book = Book::create("Dune", std::string("Frank Herbert"), "/books/dune.epub",
                             BookType::Epub, 48);

    ASSERT_EQ(book.id.size(), 36u);
    ASSERT_EQ(book.id[14], '4');
    ASSERT_EQ(book.title, "Dune");
    ASSERT_TRUE(book.author == std::optional<std::string>("Frank Herbert"));
    ASSERT_TRUE(book.fileType == BookType::Epub);
    ASSERT_TRUE(!book.coverData.has_value());
    ASSERT_TRUE(!book.lastReadAt.has_value());
    ASSERT_TRUE(book.addedAt >= before && book.addedAt <= nowSeconds());
    ASSERT_EQ(book.totalPages, 48u);
}

TEST(book_ids_unique) {
    ASSERT_TRUE(makeBook("/a.pdf").id != makeBook("/a.pdf").id);
}

TEST(book_type_extensions) {
    ASSERT_EQ(std::string(extension(BookType::Pdf)), "pdf");
    ASSERT_EQ(std::string(extension(BookType::Epub)), "epub");
    ASSERT_TRUE(bookTypeFromExtension("PDF") == BookType::Pdf);
    ASSERT_TRUE(bookTypeFromExtension(".epub") == BookType::Epub);
    ASSERT_TRUE(!bookTypeFromExtension("mobi").has_value());
    ASSERT_TRUE(!bookTypeFromExtension("").has_value());
}

TEST(highlight_color_round_trip) {
    for (HighlightColor color : kHighlightPalette) {
        std::string code = hex(color);
        ASSERT_TRUE(highlightColorFromHex(code) == color);

        std::string lower = code;
        for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        ASSERT_TRUE(highlightColorFromHex(lower) == color);
    }
    ASSERT_TRUE(!highlightColorFromHex("#123456").has_value());
    ASSERT_EQ(std::string(hex(HighlightColor::Blue)), "#2196F3");
}

TEST(annotation_type_tokens) {
    ASSERT_EQ(std::string(toString(AnnotationType::Highlight)), "highlight");
    ASSERT_EQ(std::string(toString(AnnotationType::Note)), "note");
    ASSERT_TRUE(annotationTypeFromString("note") == AnnotationType::Note);
    ASSERT_TRUE(!annotationTypeFromString("bookmark").has_value());
}

TEST(annotation_highlight) {
    Annotation a = Annotation::highlight("b1", 10.0, 15.0, 3, HighlightColor::Green,
                                         std::string("Selected text"));
    ASSERT_TRUE(a.annotationType == AnnotationType::Highlight);
    ASSERT_EQ(a.color, "#4CAF50");
    ASSERT_EQ(a.startPercent, 10.0);
    ASSERT_EQ(a.endPercent, 15.0);
    ASSERT_TRUE(a.selectedText == std::optional<std::string>("Selected text"));
    ASSERT_TRUE(!a.noteText.has_value());
    ASSERT_EQ(a.id.size(), 36u);
}

TEST(annotation_highlight_normalises_range) {
    Annotation a = Annotation::highlight("b1", 120.0, -5.0, 1, HighlightColor::Pink, std::nullopt);
    ASSERT_EQ(a.startPercent, 0.0);
    ASSERT_EQ(a.endPercent, 100.0);
}

TEST(annotation_note) {
    Annotation n = Annotation::note("b1", 42.5, 7, "Remember this");
    ASSERT_TRUE(n.annotationType == AnnotationType::Note);
    ASSERT_EQ(n.startPercent, 42.5);
    ASSERT_EQ(n.endPercent, 42.5);
    ASSERT_EQ(n.color, std::string(hex(HighlightColor::Yellow)));
    ASSERT_TRUE(n.noteText == std::optional<std::string>("Remember this"));
    ASSERT_TRUE(!n.selectedText.has_value());
}

TEST(reading_position_create) {
    ReadingPosition p = ReadingPosition::create("b1", 250.0, 9);
    ASSERT_EQ(p.percent, 100.0);
    ASSERT_EQ(p.pageNumber, 9u);
    ASSERT_TRUE(p.updatedAt > 0);
}

// ========== Store: Books ==========

TEST(store_starts_empty) {
    auto store = LibraryStore::inMemory();
    ASSERT_TRUE(store->getAllBooks().empty());
}

TEST(store_insert_and_get_book) {
    auto store = LibraryStore::inMemory();
    Book book = Book::create("Test Book", std::string("Test Author"), "/path/to/book.pdf",
                             BookType::Pdf, 100);
    book.coverData = Blob{1, 2, 3, 4};
    store->insertBook(book);

    auto books = store->getAllBooks();
    ASSERT_EQ(books.size(), 1u);
    ASSERT_TRUE(books[0] == book);

    auto fetched = store->getBook(book.id);
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(*fetched == book);
}

TEST(store_get_missing_book) {
    auto store = LibraryStore::inMemory();
    ASSERT_TRUE(!store->getBook("no-such-id").has_value());
}

TEST(store_duplicate_path_rejected) {
    auto store = LibraryStore::inMemory();
    Book first = makeBook("/b.pdf", "First");
    Book second = makeBook("/b.pdf", "Second");
    store->insertBook(first);

    try {
        store->insertBook(second);
        throw std::runtime_error("duplicate path accepted");
    } catch (const ConstraintException& e) {
        ASSERT_TRUE(e.isUnique());
        ASSERT_TRUE(e.kind() == ErrorKind::Database);
    }

    auto books = store->getAllBooks();
    ASSERT_EQ(books.size(), 1u);
    ASSERT_EQ(books[0].title, "First");
}

TEST(store_insert_book_if_absent) {
    auto store = LibraryStore::inMemory();
    ASSERT_TRUE(store->insertBookIfAbsent(makeBook("/b.pdf", "First")));
    ASSERT_TRUE(!store->insertBookIfAbsent(makeBook("/b.pdf", "Second")));
    ASSERT_EQ(store->getAllBooks().size(), 1u);
}

TEST(store_empty_title_rejected) {
    auto store = LibraryStore::inMemory();
    ASSERT_THROWS(store->insertBook(makeBook("/b.pdf", "")), ConstraintException);
}

TEST(store_books_newest_first) {
    auto store = LibraryStore::inMemory();
    Book oldest = makeBook("/1.pdf", "Oldest");
    Book newest = makeBook("/2.pdf", "Newest");
    Book middle = makeBook("/3.pdf", "Middle");
    oldest.addedAt = 100;
    newest.addedAt = 300;
    middle.addedAt = 200;
    store->insertBook(oldest);
    store->insertBook(newest);
    store->insertBook(middle);

    auto books = store->getAllBooks();
    ASSERT_EQ(books.size(), 3u);
    ASSERT_EQ(books[0].title, "Newest");
    ASSERT_EQ(books[1].title, "Middle");
    ASSERT_EQ(books[2].title, "Oldest");
}

TEST(store_book_exists_by_path) {
    auto store = LibraryStore::inMemory();
    store->insertBook(makeBook("/b.pdf"));
    ASSERT_TRUE(store->bookExistsByPath("/b.pdf"));
    ASSERT_TRUE(!store->bookExistsByPath("/other.pdf"));
}

TEST(store_update_last_read) {
    auto store = LibraryStore::inMemory();
    Book book = makeBook("/b.pdf");
    store->insertBook(book);

    int64_t before = nowSeconds();
    ASSERT_TRUE(store->updateLastRead(book.id));
    auto fetched = store->getBook(book.id);
    ASSERT_TRUE(fetched->lastReadAt.has_value());
    ASSERT_TRUE(*fetched->lastReadAt >= before);

    ASSERT_TRUE(!store->updateLastRead("no-such-id"));
}

// ========== Store: Annotations ==========

TEST(store_annotation_requires_book) {
    auto store = LibraryStore::inMemory();
    Annotation orphan = Annotation::note("no-such-book", 5.0, 1, "lost");
    try {
        store->insertAnnotation(orphan);
        throw std::runtime_error("orphan annotation accepted");
    } catch (const ConstraintException& e) {
        ASSERT_TRUE(e.isForeignKey());
    }
}

TEST(store_annotation_range_checked) {
    auto store = LibraryStore::inMemory();
    Book book = makeBook("/b.pdf");
    store->insertBook(book);

    Annotation bad = Annotation::highlight(book.id, 10.0, 20.0, 1, HighlightColor::Yellow, std::nullopt);
    bad.endPercent = 150.0;
    ASSERT_THROWS(store->insertAnnotation(bad), ConstraintException);
    ASSERT_TRUE(store->getAnnotations(book.id).empty());
}

TEST(store_annotations_ordered_by_start) {
    auto store = LibraryStore::inMemory();
    Book book = makeBook("/b.epub");
    store->insertBook(book);

    store->insertAnnotation(Annotation::note(book.id, 75.0, 30, "late"));
    store->insertAnnotation(Annotation::highlight(book.id, 5.0, 6.0, 2, HighlightColor::Blue, std::nullopt));
    store->insertAnnotation(Annotation::highlight(book.id, 40.0, 45.0, 12, HighlightColor::Orange, std::nullopt));

    auto annotations = store->getAnnotations(book.id);
    ASSERT_EQ(annotations.size(), 3u);
    ASSERT_EQ(annotations[0].startPercent, 5.0);
    ASSERT_EQ(annotations[1].startPercent, 40.0);
    ASSERT_EQ(annotations[2].startPercent, 75.0);
    ASSERT_TRUE(annotations[2].annotationType == AnnotationType::Note);
    ASSERT_TRUE(store->getAnnotations("other-book").empty());
}

TEST(store_annotation_round_trip) {
    auto store = LibraryStore::inMemory();
    Book book = makeBook("/b.pdf");
    store->insertBook(book);

    Annotation a = Annotation::highlight(book.id, 10.0, 15.0, 1, HighlightColor::Pink,
                                         std::string("Selected text"));
    store->insertAnnotation(a);

    auto annotations = store->getAnnotations(book.id);
    ASSERT_EQ(annotations.size(), 1u);
    ASSERT_TRUE(annotations[0] == a);
}

TEST(store_delete_annotation) {
    auto store = LibraryStore::inMemory();
    Book book = makeBook("/b.pdf");
    store->insertBook(book);
    Annotation keep = Annotation::note(book.id, 1.0, 1, "keep");
    Annotation drop = Annotation::note(book.id, 2.0, 1, "drop");
    store->insertAnnotation(keep);
    store->insertAnnotation(drop);

    ASSERT_TRUE(store->deleteAnnotation(drop.id));
    ASSERT_TRUE(!store->deleteAnnotation(drop.id));

    auto annotations = store->getAnnotations(book.id);
    ASSERT_EQ(annotations.size(), 1u);
    ASSERT_EQ(annotations[0].id, keep.id);
}

// ========== Store: Reading Positions ==========

TEST(store_reading_position_upsert) {
    auto store = LibraryStore::inMemory();
    Book book = makeBook("/b.pdf");
    store->insertBook(book);

    ASSERT_TRUE(!store->getReadingPosition(book.id).has_value());

    store->saveReadingPosition(ReadingPosition::create(book.id, 25.5, 13));
    ASSERT_EQ(store->getReadingPosition(book.id)->percent, 25.5);

    ReadingPosition second = ReadingPosition::create(book.id, 50.0, 25);
    second.updatedAt += 10;
    store->saveReadingPosition(second);

    auto fetched = store->getReadingPosition(book.id);
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(*fetched == second);
}

TEST(store_reading_position_requires_book) {
    auto store = LibraryStore::inMemory();
    ASSERT_THROWS(store->saveReadingPosition(ReadingPosition::create("nope", 1.0, 1)),
                  ConstraintException);
}

// ========== Store: Cascade ==========

TEST(store_delete_book_cascades) {
    auto store = LibraryStore::inMemory();
    Book book = makeBook("/b.pdf");
    Book other = makeBook("/other.pdf");
    store->insertBook(book);
    store->insertBook(other);

    for (int i = 0; i < 5; ++i) {
        store->insertAnnotation(Annotation::note(book.id, i * 10.0, i, "n"));
    }
    store->insertAnnotation(Annotation::note(other.id, 1.0, 1, "survives"));
    store->saveReadingPosition(ReadingPosition::create(book.id, 60.0, 60));
    store->saveReadingPosition(ReadingPosition::create(other.id, 3.0, 3));

    ASSERT_TRUE(store->deleteBook(book.id));

    ASSERT_TRUE(!store->getBook(book.id).has_value());
    ASSERT_TRUE(store->getAnnotations(book.id).empty());
    ASSERT_TRUE(!store->getReadingPosition(book.id).has_value());

    ASSERT_EQ(store->getAnnotations(other.id).size(), 1u);
    ASSERT_TRUE(store->getReadingPosition(other.id).has_value());

    ASSERT_TRUE(!store->deleteBook(book.id));
}

TEST(store_scenario) {
    auto store = LibraryStore::inMemory();
    Book book = Book::create("Test Book", std::nullopt, "/b.pdf", BookType::Pdf, 100);
    store->insertBook(book);

    auto books = store->getAllBooks();
    ASSERT_EQ(books.size(), 1u);
    ASSERT_EQ(books[0].title, "Test Book");

    store->insertAnnotation(Annotation::highlight(book.id, 10.0, 15.0, 1, HighlightColor::Yellow,
                                                  std::string("Selected text")));
    auto annotations = store->getAnnotations(book.id);
    ASSERT_EQ(annotations.size(), 1u);
    ASSERT_TRUE(annotations[0].selectedText == std::optional<std::string>("Selected text"));

    store->deleteBook(book.id);
    ASSERT_TRUE(store->getAllBooks().empty());
    ASSERT_TRUE(store->getAnnotations(book.id).empty());
}

// ========== Store: On-Disk ==========

TEST(store_reopen_keeps_data) {
    TempDir dir;
    Book book = makeBook("/b.pdf");
    {
        auto store = LibraryStore::open(dir.db());
        store->insertBook(book);
        store->insertAnnotation(Annotation::note(book.id, 12.0, 4, "kept"));
        store->saveReadingPosition(ReadingPosition::create(book.id, 33.0, 11));
    }

    auto store = LibraryStore::open(dir.db());
    auto fetched = store->getBook(book.id);
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(*fetched == book);
    ASSERT_EQ(store->getAnnotations(book.id).size(), 1u);
    ASSERT_EQ(store->getReadingPosition(book.id)->percent, 33.0);
}

TEST(store_unknown_token_is_database_error) {
    TempDir dir;
    auto store = LibraryStore::open(dir.db());
    store->insertBook(makeBook("/b.pdf"));

    auto raw = Connection::open(dir.db());
    raw->execute("UPDATE books SET file_type = 'mobi'");

    try {
        store->getAllBooks();
        throw std::runtime_error("corrupt row accepted");
    } catch (const DatabaseException& e) {
        ASSERT_TRUE(e.kind() == ErrorKind::Database);
    }
}

TEST(store_file_type_token_is_exact) {
    TempDir dir;
    auto store = LibraryStore::open(dir.db());
    Book book = makeBook("/b.pdf");
    store->insertBook(book);

    auto raw = Connection::open(dir.db());
    raw->execute("UPDATE books SET file_type = '.PDF'");
    ASSERT_THROWS(store->getBook(book.id), SchemaException);

    raw->execute("UPDATE books SET file_type = 'pdf'");
    ASSERT_TRUE(store->getBook(book.id)->fileType == BookType::Pdf);
}

// ========== Store: Concurrency ==========

TEST(store_concurrent_position_saves) {
    TempDir dir;
    auto store = LibraryStore::open(dir.db());
    Book book = makeBook("/b.pdf");
    store->insertBook(book);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, &book, &failures, t] {
            for (int i = 0; i < 25; ++i) {
                try {
                    store->saveReadingPosition(
                        ReadingPosition::create(book.id, t * 10.0 + i * 0.1, static_cast<uint32_t>(i)));
                } catch (const std::exception&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    ASSERT_EQ(failures.load(), 0);

    ReadingPosition last = ReadingPosition::create(book.id, 99.0, 400);
    store->saveReadingPosition(last);
    ASSERT_TRUE(*store->getReadingPosition(book.id) == last);

    ASSERT_EQ(countRows(dir.db(), "SELECT COUNT(*) FROM reading_positions WHERE book_id = ?", book.id), 1);
}

TEST(store_concurrent_imports_of_same_path) {
    auto store = LibraryStore::inMemory();

    std::atomic<int> inserted{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, &inserted, &failures] {
            try {
                if (store->insertBookIfAbsent(makeBook("/same.pdf"))) {
                    ++inserted;
                }
            } catch (const std::exception&) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(failures.load(), 0);
    ASSERT_EQ(inserted.load(), 1);
    ASSERT_EQ(store->getAllBooks().size(), 1u);
}

// ========== Ingestion Tests ==========

TEST(ingestion_book_type_for_path) {
    ASSERT_TRUE(bookTypeForPath("/books/a.PDF") == BookType::Pdf);
    ASSERT_TRUE(bookTypeForPath("/books/a.epub") == BookType::Epub);
    ASSERT_THROWS(bookTypeForPath("/books/a.mobi"), UnsupportedFormatException);
    ASSERT_THROWS(bookTypeForPath("/books/README"), UnsupportedFormatException);
}

TEST(ingestion_book_from_metadata) {
    BookMetadata metadata;
    metadata.title = std::string("  ");
    metadata.author = std::string("");
    metadata.coverData = Blob{9, 9};
    metadata.totalPages = 321;

    Book book = bookFromMetadata("/books/The Hobbit.epub", BookType::Epub, metadata);
    ASSERT_EQ(book.title, "The Hobbit");
    ASSERT_TRUE(!book.author.has_value());
    ASSERT_TRUE(book.coverData == metadata.coverData);
    ASSERT_EQ(book.totalPages, 321u);
    ASSERT_EQ(book.filePath, "/books/The Hobbit.epub");

    metadata.title = std::string(" Real Title ");
    ASSERT_EQ(bookFromMetadata("/x.pdf", BookType::Pdf, metadata).title, "Real Title");
}

TEST(ingestion_import_book) {
    TempDir dir;
    std::string path = dir.file("novel.pdf");
    auto store = LibraryStore::inMemory();

    FakeExtractor extractor;
    extractor.metadata.author = std::string("Anon");
    extractor.metadata.totalPages = 12;

    BookImporter importer(*store, extractor);
    auto book = importer.importBook(path);
    ASSERT_TRUE(book.has_value());
    ASSERT_EQ(book->title, "novel");
    ASSERT_TRUE(book->fileType == BookType::Pdf);
    ASSERT_TRUE(store->getBook(book->id) == book);

    ASSERT_TRUE(!importer.importBook(path).has_value());
    ASSERT_EQ(extractor.calls, 1);
    ASSERT_EQ(store->getAllBooks().size(), 1u);
}

TEST(ingestion_import_errors) {
    TempDir dir;
    auto store = LibraryStore::inMemory();
    FakeExtractor extractor;
    BookImporter importer(*store, extractor);

    ASSERT_THROWS(importer.importBook((dir.path / "missing.epub").string()), FileNotFoundException);
    ASSERT_THROWS(importer.importBook(dir.file("notes.txt")), UnsupportedFormatException);

    fs::create_directories(dir.path / "folder.pdf");
    ASSERT_THROWS(importer.importBook((dir.path / "folder.pdf").string()), IoException);

    extractor.fail = true;
    ASSERT_THROWS(importer.importBook(dir.file("broken.pdf")), ParseException);

    ASSERT_TRUE(store->getAllBooks().empty());
}

// ========== Main ==========

int main() {
    int passed = 0;
    int failed = 0;

    // Failure paths are exercised on purpose; keep their log lines out of the report
    spdlog::set_level(spdlog::level::off);

    std::cout << "\nRunning omnireader tests...\n\n";

    std::cout << "Error taxonomy tests:\n";
    RUN_TEST(error_kinds);
    RUN_TEST(error_messages);

    std::cout << "\nSQLite access tests:\n";
    RUN_TEST(connection_open_memory);
    RUN_TEST(connection_foreign_keys_off);
    RUN_TEST(connection_constraint_classified);
    RUN_TEST(connection_query_error);
    RUN_TEST(statement_optional_binding);
    RUN_TEST(statement_empty_blob_is_not_null);
    RUN_TEST(statement_named_parameters);
    RUN_TEST(statement_uint32_range_checked);
    RUN_TEST(transaction_commit);
    RUN_TEST(transaction_rollback_on_scope_exit);
    RUN_TEST(transaction_explicit_rollback);
    RUN_TEST(transaction_exclusive);
    RUN_TEST(connection_replaced_under_live_statement);
    RUN_TEST(with_transaction_rolls_back_on_throw);

    std::cout << "\nSchema tests:\n";
    RUN_TEST(schema_initialize_idempotent);
    RUN_TEST(schema_validator_reports_problems);
    RUN_TEST(store_rejects_foreign_schema);
    RUN_TEST(store_requires_foreign_keys);

    std::cout << "\nEntity tests:\n";
    RUN_TEST(book_create);
    RUN_TEST(book_ids_unique);
    RUN_TEST(book_type_extensions);
    RUN_TEST(highlight_color_round_trip);
    RUN_TEST(annotation_type_tokens);
    RUN_TEST(annotation_highlight);
    RUN_TEST(annotation_highlight_normalises_range);
    RUN_TEST(annotation_note);
    RUN_TEST(reading_position_create);

    std::cout << "\nStore tests:\n";
    RUN_TEST(store_starts_empty);
    RUN_TEST(store_insert_and_get_book);
    RUN_TEST(store_get_missing_book);
    RUN_TEST(store_duplicate_path_rejected);
    RUN_TEST(store_insert_book_if_absent);
    RUN_TEST(store_empty_title_rejected);
    RUN_TEST(store_books_newest_first);
    RUN_TEST(store_book_exists_by_path);
    RUN_TEST(store_update_last_read);
    RUN_TEST(store_annotation_requires_book);
    RUN_TEST(store_annotation_range_checked);
    RUN_TEST(store_annotations_ordered_by_start);
    RUN_TEST(store_annotation_round_trip);
    RUN_TEST(store_delete_annotation);
    RUN_TEST(store_reading_position_upsert);
    RUN_TEST(store_reading_position_requires_book);
    RUN_TEST(store_delete_book_cascades);
    RUN_TEST(store_scenario);

    std::cout << "\nOn-disk tests:\n";
    RUN_TEST(store_reopen_keeps_data);
    RUN_TEST(store_unknown_token_is_database_error);
    RUN_TEST(store_file_type_token_is_exact);

    std::cout << "\nConcurrency tests:\n";
    RUN_TEST(store_concurrent_position_saves);
    RUN_TEST(store_concurrent_imports_of_same_path);

    std::cout << "\nIngestion tests:\n";
    RUN_TEST(ingestion_book_type_for_path);
    RUN_TEST(ingestion_book_from_metadata);
    RUN_TEST(ingestion_import_book);
    RUN_TEST(ingestion_import_errors);

    std::cout << "\n" << std::string(40, '=') << "\n";
    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    std::cout << std::string(40, '=') << "\n";

    return failed > 0 ? 1 : 0;
}
