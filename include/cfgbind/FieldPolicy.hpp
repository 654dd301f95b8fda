/**
 * @file FieldPolicy.hpp
 * @brief Per-field deserialization decision
 *
 * For one field and its raw config value:
 * 1. if any skip condition holds → Skip
 * 2. else if a default rule is active → UseDefault(rule.compute_default())
 * 3. else → Proceed
 *
 * Skip conditions take priority, so a skipped field is left untouched even
 * when its default would apply.
 */

#ifndef CFGBIND_FIELD_POLICY_HPP
#define CFGBIND_FIELD_POLICY_HPP

#include "cfgbind/ConditionAggregator.hpp"
#include "cfgbind/FieldMetadata.hpp"
#include "cfgbind/PredicateResolver.hpp"
#include "cfgbind/Value.hpp"

namespace cfgbind {

class Decision {
public:
    enum class Kind { proceed, skip, use_default };

    static Decision proceed() { return Decision(Kind::proceed); }
    static Decision skip() { return Decision(Kind::skip); }
    static Decision use_default(Value value) {
        Decision d(Kind::use_default);
        d.value_ = std::move(value);
        return d;
    }

    Kind kind() const noexcept { return kind_; }
    bool is_proceed() const noexcept { return kind_ == Kind::proceed; }
    bool is_skip() const noexcept { return kind_ == Kind::skip; }
    bool is_use_default() const noexcept { return kind_ == Kind::use_default; }

    /// The computed default; null unless is_use_default().
    const Value& default_value() const noexcept { return value_; }

private:
    explicit Decision(Kind kind) : kind_(kind) {}

    Kind kind_;
    Value value_;
};

const char* to_string(Decision::Kind kind);

class FieldPolicyEngine {
public:
    explicit FieldPolicyEngine(const PredicateResolver& resolver) : conditions_(resolver) {}

    /**
     * @throws PredicateResolutionError if a custom check cannot be resolved
     */
    Decision decide(const FieldMetadata& field, const RawValue& raw, ObjectRef current) const;

private:
    ConditionAggregator conditions_;
};

} // namespace cfgbind

#endif // CFGBIND_FIELD_POLICY_HPP
