#include "cfgbind/FieldPolicy.hpp"

namespace cfgbind {

const char* to_string(Decision::Kind kind) {
    switch (kind) {
        case Decision::Kind::proceed: return "proceed";
        case Decision::Kind::skip: return "skip";
        case Decision::Kind::use_default: return "use_default";
    }
    return "unknown";
}

Decision FieldPolicyEngine::decide(const FieldMetadata& field, const RawValue& raw,
                                   ObjectRef current) const {
    if (!field.skip_conditions.empty() &&
        conditions_.should_skip(field.skip_conditions, raw, current, field.field_name)) {
        return Decision::skip();
    }

    if (field.default_rule && field.default_rule->is_active(raw)) {
        return Decision::use_default(field.default_rule->compute_default());
    }

    return Decision::proceed();
}

} // namespace cfgbind
