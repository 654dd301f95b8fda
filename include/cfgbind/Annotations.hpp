/**
 * @file Annotations.hpp
 * @brief Declarative field annotations
 *
 * Annotations are attached to a field when its type is described (see
 * TypeDescription.hpp):
 *
 * ```cpp
 * Describe<Server>("Server")
 *     // The field is left untouched if the entry is missing or null.
 *     .property("name", &Server::name, skip_if(SkipDeIf::is_missing, SkipDeIf::is_null))
 *     // Empty lists do not overwrite the built-in list.
 *     .property("hosts", &Server::hosts, skip_if(SkipDeIf::is_empty))
 *     // Custom check: a method or predicate field of Server.
 *     .property("id", &Server::id, skip_if_custom("skip_id"))
 *     // Custom check defined in another (described) type, must be static.
 *     .property("port", &Server::port, skip_if_custom<Checks>("skip_port"))
 *     .property("timeout", &Server::timeout, default_value(30))
 *     .property("user", &Server::user, config_path("auth.user"))
 *     .commit();
 * ```
 *
 * A field may carry several skip annotations; they are flattened into one
 * ordered condition list. At most one default may apply to
 * deserialization.
 */

#ifndef CFGBIND_ANNOTATIONS_HPP
#define CFGBIND_ANNOTATIONS_HPP

#include "cfgbind/Value.hpp"
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace cfgbind {

/**
 * @brief Sentinel declaring type: "the type of the object being deserialized"
 */
struct CurrentType {};

/**
 * @brief A condition that defines when to skip a field during deserialization.
 */
enum class SkipDeIf {
    is_missing, ///< The config entry is missing
    is_null,    ///< The config value is an explicit null
    is_empty,   ///< The config value is logically empty (see Emptiness.hpp)
    custom      ///< A custom predicate named by custom_check returns true
};

const char* to_string(SkipDeIf kind);

/**
 * @brief Parse "missing", "null", "empty" or "custom" (also "IS_MISSING", ...)
 */
std::optional<SkipDeIf> parse_skip_kind(const std::string& text);

/**
 * @brief Don't deserialize the annotated field if some condition is true.
 *
 * custom_class is where to find the custom predicate. The CurrentType
 * sentinel means the type of the object being deserialized; any other
 * class must be described and its predicate must be static.
 *
 * custom_check names a field of type Predicate or a method taking exactly
 * one RawValue and returning bool. It is applied to the raw config value.
 */
struct SkipDeserializingIf {
    std::vector<SkipDeIf> value;
    std::type_index custom_class = typeid(CurrentType);
    std::string custom_check;
};

/**
 * @brief One normalized skip condition.
 *
 * For custom conditions, declaring_type and member identify the predicate.
 */
struct SkipCondition {
    SkipDeIf kind = SkipDeIf::is_missing;
    std::type_index declaring_type = typeid(CurrentType);
    std::string member;

    bool uses_current_type() const noexcept {
        return declaring_type == std::type_index(typeid(CurrentType));
    }

    static SkipCondition of(SkipDeIf kind) {
        SkipCondition c;
        c.kind = kind;
        return c;
    }

    static SkipCondition custom(std::string member, std::type_index declaring_type = typeid(CurrentType)) {
        SkipCondition c;
        c.kind = SkipDeIf::custom;
        c.declaring_type = declaring_type;
        c.member = std::move(member);
        return c;
    }
};

/**
 * @brief Flatten repeated skip annotations into one condition list.
 *
 * Annotation order and kind order within each annotation are preserved.
 * Duplicates are kept. A CUSTOM kind inherits the annotation's
 * custom_class and custom_check.
 *
 * @param type_name, field Used in error messages only
 * @throws AnnotationError if a CUSTOM kind has no custom_check
 */
std::vector<SkipCondition> flatten_skip_annotations(
    const std::vector<SkipDeserializingIf>& annotations,
    const std::string& type_name = "", const std::string& field = "");

// ============================================================================
// Defaults
// ============================================================================

/**
 * @brief When a default value replaces the config value.
 */
enum class DefaultWhen {
    is_missing,
    is_null,
    is_empty,
    is_invalid ///< Present but not convertible to the field's type
};

/**
 * @brief Supplies a substitute value for a field.
 *
 * The field policy only asks is_active() and, when true, takes
 * compute_default() as the field's value.
 */
class DefaultRule {
public:
    virtual ~DefaultRule() = default;

    virtual bool is_active(const RawValue& raw) const = 0;
    virtual Value compute_default() const = 0;
};

/**
 * @brief Default rule backed by a supplier and a list of triggers.
 */
class DefaultValue : public DefaultRule {
public:
    using Supplier = std::function<Value()>;
    using Validator = std::function<bool(const Value&)>;

    DefaultValue(Supplier supplier, std::vector<DefaultWhen> when, Validator validator = {});

    bool is_active(const RawValue& raw) const override;
    Value compute_default() const override;

    const std::vector<DefaultWhen>& when() const noexcept { return when_; }

private:
    Supplier supplier_;
    std::vector<DefaultWhen> when_;
    Validator validator_;
};

/**
 * @brief Default annotation, turned into a DefaultValue once the field's
 * type is known.
 */
struct SerdeDefault {
    DefaultValue::Supplier supplier;
    std::vector<DefaultWhen> when{DefaultWhen::is_missing};
};

/**
 * @brief Config path override annotation.
 */
struct ConfigPath {
    std::vector<std::string> segments;
};

/**
 * @brief Every annotation declared on one field.
 */
struct FieldAnnotations {
    std::vector<SkipDeserializingIf> skips;
    std::vector<SerdeDefault> defaults;
    std::optional<ConfigPath> path;

    void add(SkipDeserializingIf a) { skips.push_back(std::move(a)); }
    void add(SerdeDefault a) { defaults.push_back(std::move(a)); }
    void add(ConfigPath a) { path = std::move(a); }
};

// ============================================================================
// Annotation helpers
// ============================================================================

template <typename... Kinds>
SkipDeserializingIf skip_if(Kinds... kinds) {
    return SkipDeserializingIf{{kinds...}, typeid(CurrentType), ""};
}

/// CUSTOM skip condition looked up in the object being deserialized.
inline SkipDeserializingIf skip_if_custom(std::string check) {
    return SkipDeserializingIf{{SkipDeIf::custom}, typeid(CurrentType), std::move(check)};
}

/// CUSTOM skip condition looked up in Class; the predicate must be static.
template <typename Class>
SkipDeserializingIf skip_if_custom(std::string check) {
    return SkipDeserializingIf{{SkipDeIf::custom}, typeid(Class), std::move(check)};
}

/// Constant default; applies when the entry is missing unless `when` says otherwise.
inline SerdeDefault default_value(Value value, std::initializer_list<DefaultWhen> when = {DefaultWhen::is_missing}) {
    return SerdeDefault{[value]() { return value; }, std::vector<DefaultWhen>(when)};
}

inline SerdeDefault default_from(DefaultValue::Supplier supplier,
                                 std::initializer_list<DefaultWhen> when = {DefaultWhen::is_missing}) {
    return SerdeDefault{std::move(supplier), std::vector<DefaultWhen>(when)};
}

/// Read the field from another dot-path than its name.
ConfigPath config_path(const std::string& dot_path);

} // namespace cfgbind

#endif // CFGBIND_ANNOTATIONS_HPP
