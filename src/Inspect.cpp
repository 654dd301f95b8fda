#include "cfgbind/Inspect.hpp"
#include "cfgbind/DotPath.hpp"
#include "cfgbind/Errors.hpp"

#include <memory>
#include <sstream>

namespace cfgbind {

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(list);
    while (std::getline(iss, tok, ',')) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

Value parse_json_or_string(const std::string& text) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        return Value(text);
    }
}

std::vector<SkipCondition> parse_skip_list(const std::string& list) {
    std::vector<SkipCondition> conditions;
    for (const auto& item : split_list(list)) {
        auto kind = parse_skip_kind(item);
        if (!kind) {
            throw ConfigError("Unknown skip condition: " + item);
        }
        if (*kind == SkipDeIf::custom) {
            throw ConfigError("CUSTOM conditions need a described type and cannot be used here");
        }
        conditions.push_back(SkipCondition::of(*kind));
    }
    return conditions;
}

std::vector<DefaultWhen> parse_default_when(const std::string& list) {
    std::vector<DefaultWhen> when;
    for (const auto& item : split_list(list)) {
        auto kind = parse_skip_kind(item);
        if (kind == SkipDeIf::is_missing) when.push_back(DefaultWhen::is_missing);
        else if (kind == SkipDeIf::is_null) when.push_back(DefaultWhen::is_null);
        else if (kind == SkipDeIf::is_empty) when.push_back(DefaultWhen::is_empty);
        else throw ConfigError("Unknown default trigger: " + item);
    }
    return when;
}

FieldMetadata make_field_metadata(const FieldRuleSpec& rule) {
    FieldMetadata field;
    field.field_name = rule.key;
    field.path = split_dot_path(rule.key);
    field.skip_conditions = parse_skip_list(rule.skip_if);
    if (rule.default_value) {
        Value def = parse_json_or_string(*rule.default_value);
        field.default_rule = std::make_shared<DefaultValue>(
            [def]() { return def; }, parse_default_when(rule.default_when));
    }
    return field;
}

std::string format_raw(const RawValue& raw) {
    std::string out = to_string(raw.state());
    if (raw.is_present()) out += " " + raw.value().dump();
    return out;
}

std::string format_decision(const Decision& decision) {
    std::string out = to_string(decision.kind());
    if (decision.is_use_default()) out += " " + decision.default_value().dump();
    return out;
}

} // namespace cfgbind
