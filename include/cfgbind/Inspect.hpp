/**
 * @file Inspect.hpp
 * @brief Helpers behind the cfgbind command line tool
 *
 * The tool evaluates ad-hoc field rules given as text against a loaded
 * tree. Only the built-in skip conditions can be named this way: CUSTOM
 * checks need a described type.
 */

#ifndef CFGBIND_INSPECT_HPP
#define CFGBIND_INSPECT_HPP

#include "cfgbind/Annotations.hpp"
#include "cfgbind/FieldMetadata.hpp"
#include "cfgbind/FieldPolicy.hpp"
#include "cfgbind/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Field rule as given on the command line.
 */
struct FieldRuleSpec {
    std::string key;                          ///< Dot-path of the entry
    std::string skip_if;                      ///< e.g. "missing,null"
    std::optional<std::string> default_value; ///< JSON text, or a plain string
    std::string default_when = "missing";     ///< e.g. "missing,empty"
};

/// Comma-separated list; empty items are dropped.
std::vector<std::string> split_list(const std::string& list);

/// JSON text if it parses, otherwise the text as a string.
Value parse_json_or_string(const std::string& text);

/**
 * @throws ConfigError for an unknown kind or for CUSTOM
 */
std::vector<SkipCondition> parse_skip_list(const std::string& list);

/**
 * @throws ConfigError for anything but missing, null and empty
 */
std::vector<DefaultWhen> parse_default_when(const std::string& list);

/**
 * @brief Build the metadata of an anonymous field from a rule.
 *
 * @throws ConfigError if the rule cannot be parsed
 */
FieldMetadata make_field_metadata(const FieldRuleSpec& rule);

/// "absent", "null" or "present <json>".
std::string format_raw(const RawValue& raw);

/// "proceed", "skip" or "use_default <json>".
std::string format_decision(const Decision& decision);

} // namespace cfgbind

#endif // CFGBIND_INSPECT_HPP
