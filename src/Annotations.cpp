#include "cfgbind/Annotations.hpp"
#include "cfgbind/DotPath.hpp"
#include "cfgbind/Emptiness.hpp"
#include "cfgbind/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace cfgbind {

const char* to_string(SkipDeIf kind) {
    switch (kind) {
        case SkipDeIf::is_missing: return "IS_MISSING";
        case SkipDeIf::is_null: return "IS_NULL";
        case SkipDeIf::is_empty: return "IS_EMPTY";
        case SkipDeIf::custom: return "CUSTOM";
    }
    return "UNKNOWN";
}

std::optional<SkipDeIf> parse_skip_kind(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower.rfind("is_", 0) == 0) {
        lower = lower.substr(3);
    }

    if (lower == "missing") return SkipDeIf::is_missing;
    if (lower == "null") return SkipDeIf::is_null;
    if (lower == "empty") return SkipDeIf::is_empty;
    if (lower == "custom") return SkipDeIf::custom;
    return std::nullopt;
}

std::vector<SkipCondition> flatten_skip_annotations(
    const std::vector<SkipDeserializingIf>& annotations,
    const std::string& type_name, const std::string& field) {
    std::vector<SkipCondition> conditions;

    for (const auto& annotation : annotations) {
        for (SkipDeIf kind : annotation.value) {
            if (kind != SkipDeIf::custom) {
                conditions.push_back(SkipCondition::of(kind));
                continue;
            }
            if (annotation.custom_check.empty()) {
                throw AnnotationError(type_name, field,
                                      "CUSTOM skip condition requires a custom check name");
            }
            conditions.push_back(SkipCondition::custom(annotation.custom_check,
                                                       annotation.custom_class));
        }
    }

    return conditions;
}

ConfigPath config_path(const std::string& dot_path) {
    return ConfigPath{split_dot_path(dot_path)};
}

// ============================================================================
// DefaultValue
// ============================================================================

DefaultValue::DefaultValue(Supplier supplier, std::vector<DefaultWhen> when, Validator validator)
    : supplier_(std::move(supplier))
    , when_(std::move(when))
    , validator_(std::move(validator))
{}

bool DefaultValue::is_active(const RawValue& raw) const {
    for (DefaultWhen trigger : when_) {
        switch (trigger) {
            case DefaultWhen::is_missing:
                if (raw.is_absent()) return true;
                break;
            case DefaultWhen::is_null:
                if (raw.is_null()) return true;
                break;
            case DefaultWhen::is_empty:
                if (is_empty(raw)) return true;
                break;
            case DefaultWhen::is_invalid:
                // Host objects carry no tree value to validate.
                if (raw.is_present() && !raw.is_host_object() && validator_ &&
                    !validator_(raw.value())) {
                    return true;
                }
                break;
        }
    }
    return false;
}

Value DefaultValue::compute_default() const {
    return supplier_();
}

} // namespace cfgbind
