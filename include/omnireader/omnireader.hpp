/**
 * @file omnireader.hpp
 * @brief Main include file for the OmniReader library store
 *
 * Include this for everything, or the individual headers:
 *   #include <omnireader/library_store.hpp>
 *   #include <omnireader/ingestion.hpp>
 */

#pragma once

#include "exceptions.hpp"
#include "connection.hpp"
#include "statement.hpp"
#include "transaction.hpp"
#include "schema.hpp"
#include "identity.hpp"
#include "book.hpp"
#include "annotation.hpp"
#include "book_repository.hpp"
#include "annotation_repository.hpp"
#include "position_repository.hpp"
#include "library_store.hpp"
#include "ingestion.hpp"

namespace omnireader {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "0.1.0";

/**
 * @brief Version of the SQLite library linked in
 */
inline const char* sqliteVersion() {
    return sqlite3_libversion();
}

} // namespace omnireader
