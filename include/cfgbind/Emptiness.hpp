/**
 * @file Emptiness.hpp
 * @brief Logical "is this value empty" classification
 *
 * Categories, tried in order (first match wins):
 * 1. Absent or null → empty
 * 2. String → empty iff length is zero
 * 3. Array, object, binary → empty iff element count is zero
 * 4. Host object exposing is_empty() / empty() → the query's result
 * 5. Anything else (numbers, booleans, other host objects) → not empty
 *
 * A query that throws in step 4 is treated as "not empty"; the
 * classifier never throws.
 */

#ifndef CFGBIND_EMPTINESS_HPP
#define CFGBIND_EMPTINESS_HPP

#include "cfgbind/Value.hpp"
#include <optional>

namespace cfgbind {

/**
 * @brief Classify a tree value
 */
bool is_empty(const Value& value) noexcept;

/**
 * @brief Classify a raw value
 */
bool is_empty(const RawValue& value) noexcept;

/**
 * @brief Capability test for host objects
 *
 * @return The host object's own answer, or nullopt if it has none or the
 *         query failed
 */
std::optional<bool> try_query_empty(const RawValue& value) noexcept;

} // namespace cfgbind

#endif // CFGBIND_EMPTINESS_HPP
