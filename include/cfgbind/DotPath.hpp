/**
 * @file DotPath.hpp
 * @brief Path utilities for nested configuration access
 *
 * Paths are either segment lists (["database", "host"]) or dot-separated
 * strings ("database.host", "servers.0.name"). Numeric segments index
 * into arrays.
 *
 * Two access flavours are provided:
 * - get_by_dot() is strict and raises KeyError / TypeError
 * - find_by_path() is lenient and returns nullptr whenever there is no
 *   entry, including when traversal hits a scalar
 */

#ifndef CFGBIND_DOTPATH_HPP
#define CFGBIND_DOTPATH_HPP

#include "cfgbind/Value.hpp"
#include "cfgbind/Errors.hpp"
#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Split a dot-path into segments
 *
 * Examples:
 * - "database.host" → ["database", "host"]
 * - "logging.handlers.0.type" → ["logging", "handlers", "0", "type"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value from nested structure using dot-path (strict)
 *
 * @param data Source JSON value
 * @param path Dot-separated path; empty returns the root
 * @return Pointer to value at path
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a non-container before the final segment
 *
 * ```cpp
 * Value cfg = {{"db", {{"host", "localhost"}}}};
 * auto* val = get_by_dot(cfg, "db.host");    // OK: points to "localhost"
 * auto* bad = get_by_dot(cfg, "db.port");    // Throws KeyError
 * auto* bad2 = get_by_dot(cfg, "db.host.x"); // Throws TypeError
 * ```
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Find value at a segment path (lenient)
 *
 * @return Pointer to the value, or nullptr if there is no entry at the path
 */
const Value* find_by_path(const Value& data, const std::vector<std::string>& segments);

/**
 * @brief Check if dot-path exists in nested structure
 *
 * @throws TypeError if traversal hits a non-container before the final segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace cfgbind

#endif // CFGBIND_DOTPATH_HPP
