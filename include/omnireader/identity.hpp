/**
 * @file identity.hpp
 * @brief Identifier and timestamp sources for new entities
 */

#pragma once

#include <cstdint>
#include <string>

namespace omnireader {

/**
 * @brief Generate a random (version 4) UUID in canonical 8-4-4-4-12 form
 *
 * Thread-safe.
 */
std::string generateId();

/**
 * @brief Current UTC time as whole seconds since the Unix epoch
 */
int64_t nowSeconds();

} // namespace omnireader
