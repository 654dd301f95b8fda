#include "cfgbind/ConditionAggregator.hpp"
#include "cfgbind/Emptiness.hpp"
#include "cfgbind/Errors.hpp"

namespace cfgbind {

bool ConditionAggregator::test(const SkipCondition& condition, const RawValue& raw,
                               ObjectRef current) const {
    switch (condition.kind) {
        case SkipDeIf::is_missing:
            return raw.is_absent();
        case SkipDeIf::is_null:
            return raw.is_null();
        case SkipDeIf::is_empty:
            return is_empty(raw);
        case SkipDeIf::custom: {
            PredicateHandle predicate =
                resolver_.resolve(condition.declaring_type, condition.member, current);
            return predicate(raw);
        }
    }
    return false;
}

bool ConditionAggregator::should_skip(const std::vector<SkipCondition>& conditions,
                                      const RawValue& raw, ObjectRef current,
                                      const std::string& field) const {
    for (const auto& condition : conditions) {
        bool satisfied = false;
        try {
            satisfied = test(condition, raw, current);
        } catch (const PredicateResolutionError& e) {
            if (field.empty() || !e.field().empty()) throw;
            throw e.with_field(field);
        }
        if (satisfied) {
            return true;
        }
    }
    return false;
}

} // namespace cfgbind
