/**
 * @file Loader.hpp
 * @brief Reading configuration trees from JSON and TOML
 *
 * JSON keeps explicit nulls, so a loaded tree distinguishes a missing entry
 * from a null one. TOML has no null: a key is either present or absent.
 * TOML dates and times become strings.
 */

#ifndef CFGBIND_LOADER_HPP
#define CFGBIND_LOADER_HPP

#include "cfgbind/ConfigTree.hpp"
#include "cfgbind/Value.hpp"

#include <optional>
#include <string>

namespace cfgbind {

enum class ConfigFormat { json, toml };

const char* to_string(ConfigFormat format);

/**
 * @brief Format named by a file's extension (".json" or ".toml", any case).
 *
 * @return nullopt for any other extension
 */
std::optional<ConfigFormat> detect_format(const std::string& path);

/**
 * @brief Parse configuration text already in memory.
 *
 * @param source_name Name used in error messages
 * @throws ConfigParseError with the line and column of the first error
 */
Value parse_config(const std::string& text, ConfigFormat format,
                   const std::string& source_name = "<string>");

/**
 * @brief Load a configuration file into a tree.
 *
 * An empty path gives an empty tree.
 *
 * @throws FileNotFoundError if the file cannot be opened
 * @throws ConfigError if the extension is not .json or .toml
 * @throws ConfigParseError on syntax errors
 */
ConfigTree load_tree(const std::string& path);

} // namespace cfgbind

#endif // CFGBIND_LOADER_HPP
