#ifndef CFGBIND_CONDITION_AGGREGATOR_HPP
#define CFGBIND_CONDITION_AGGREGATOR_HPP

#include "cfgbind/Annotations.hpp"
#include "cfgbind/PredicateResolver.hpp"
#include "cfgbind/TypeDescription.hpp"
#include "cfgbind/Value.hpp"

#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Combines a field's skip conditions with OR semantics.
 *
 * Conditions are evaluated in declaration order and evaluation stops at
 * the first true one, so later custom predicates are neither resolved nor
 * invoked. An empty list never skips.
 */
class ConditionAggregator {
public:
    explicit ConditionAggregator(const PredicateResolver& resolver) : resolver_(resolver) {}

    /**
     * @param field Field name used to attribute resolution errors
     * @throws PredicateResolutionError if a custom check cannot be resolved
     */
    bool should_skip(const std::vector<SkipCondition>& conditions, const RawValue& raw,
                     ObjectRef current, const std::string& field = "") const;

    /// Evaluate one condition.
    bool test(const SkipCondition& condition, const RawValue& raw, ObjectRef current) const;

private:
    const PredicateResolver& resolver_;
};

} // namespace cfgbind

#endif // CFGBIND_CONDITION_AGGREGATOR_HPP
