/**
 * @file Errors.hpp
 * @brief Exception types for cfgbind
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - FileNotFoundError: Config file not found
 * - ConfigParseError: JSON/TOML syntax errors
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 * - AnnotationError: Malformed field annotations
 * - PredicateResolutionError: Custom skip predicate cannot be resolved
 * - DeserializationError: Field cannot be populated from the config
 */

#ifndef CFGBIND_ERRORS_HPP
#define CFGBIND_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace cfgbind {

/**
 * @brief Base class for all cfgbind exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 *
 * Line and column are 1-based; 0 means the parser did not report them.
 */
class ConfigParseError : public ConfigError {
public:
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public ConfigError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "database.host")
     * @param segment The specific segment that doesn't exist (e.g., "host")
     */
    KeyError(std::string path, std::string segment)
        : ConfigError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-container type
 * (e.g., trying to access "scalar_value.sub_key").
 */
class TypeError : public ConfigError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Field annotations are malformed
 *
 * Raised while deriving field metadata, e.g. for a CUSTOM skip condition
 * without a check name, or a field carrying two deserialization defaults.
 */
class AnnotationError : public ConfigError {
public:
    AnnotationError(std::string type_name, std::string field, const std::string& details)
        : ConfigError("Invalid annotation on field '" + field + "' of type '" +
                      type_name + "': " + details)
        , type_name_(std::move(type_name))
        , field_(std::move(field))
    {}

    const std::string& type_name() const noexcept { return type_name_; }
    const std::string& field() const noexcept { return field_; }

private:
    std::string type_name_;
    std::string field_;
};

/**
 * @brief Why a custom skip predicate could not be resolved
 */
enum class ResolutionFailure {
    not_found,          ///< No field or method with the member name
    ambiguous,          ///< Both a predicate field and a method match
    wrong_field_shape,  ///< The field is not a predicate over raw values
    wrong_method_shape, ///< The method does not take exactly one RawValue and return bool
    unset_predicate,    ///< The predicate field holds no function
    not_static,         ///< A member of another type (or without an instance) is not static
    unknown_type        ///< The declaring type has no registered description
};

inline const char* to_string(ResolutionFailure kind) {
    switch (kind) {
        case ResolutionFailure::not_found: return "no field or method with this name";
        case ResolutionFailure::ambiguous: return "both a predicate field and a method have this name";
        case ResolutionFailure::wrong_field_shape: return "field is not a predicate over raw values";
        case ResolutionFailure::wrong_method_shape:
            return "method must take exactly one RawValue parameter and return bool";
        case ResolutionFailure::unset_predicate: return "predicate field is not set";
        case ResolutionFailure::not_static: return "member must be static";
        case ResolutionFailure::unknown_type: return "type is not described";
    }
    return "unknown failure";
}

/**
 * @brief A custom skip predicate cannot be resolved
 *
 * Fatal for the field being processed. The message names the declaring
 * type, the member and, once known, the field being deserialized.
 */
class PredicateResolutionError : public ConfigError {
public:
    PredicateResolutionError(ResolutionFailure kind, std::string declaring_type,
                             std::string member, std::string field = "")
        : ConfigError(format_message(kind, declaring_type, member, field))
        , kind_(kind)
        , declaring_type_(std::move(declaring_type))
        , member_(std::move(member))
        , field_(std::move(field))
    {}

    ResolutionFailure kind() const noexcept { return kind_; }
    const std::string& declaring_type() const noexcept { return declaring_type_; }
    const std::string& member() const noexcept { return member_; }
    const std::string& field() const noexcept { return field_; }

    /// Copy of this error attributed to a field.
    PredicateResolutionError with_field(std::string field) const {
        return PredicateResolutionError(kind_, declaring_type_, member_, std::move(field));
    }

private:
    ResolutionFailure kind_;
    std::string declaring_type_;
    std::string member_;
    std::string field_;

    static std::string format_message(ResolutionFailure kind, const std::string& type,
                                      const std::string& member, const std::string& field) {
        std::ostringstream oss;
        oss << "Cannot resolve skip predicate '" << member << "' in type '" << type << "'";
        if (!field.empty()) oss << " for field '" << field << "'";
        oss << ": " << to_string(kind);
        return oss.str();
    }
};

/**
 * @brief A field cannot be populated from the configuration
 *
 * Raised by the deserializer for a missing entry with no skip or default
 * rule, or for a value that does not convert to the field's type.
 */
class DeserializationError : public ConfigError {
public:
    DeserializationError(std::string path, const std::string& details)
        : ConfigError("Cannot deserialize '" + path + "': " + details)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace cfgbind

#endif // CFGBIND_ERRORS_HPP
