#include "cfgbind/PredicateResolver.hpp"
#include "cfgbind/Errors.hpp"

#include <mutex>
#include <vector>

namespace cfgbind {

PredicateHandle PredicateResolver::resolve(std::type_index declaring_type,
                                           const std::string& member,
                                           ObjectRef current) const {
    const bool use_current = declaring_type == std::type_index(typeid(CurrentType));
    const std::type_index target = use_current ? current.type() : declaring_type;

    {
        std::shared_lock lock(mutex_);
        auto it = static_handles_.find(CacheKey(target, member));
        if (it != static_handles_.end()) {
            return it->second;
        }
    }

    auto desc = registry_.find(target);
    if (!desc) {
        throw PredicateResolutionError(ResolutionFailure::unknown_type, target.name(), member);
    }

    // Instance members need the object being deserialized, which only
    // exists for the current type.
    const bool can_bind = use_current && static_cast<bool>(current);

    const FieldMember* field = desc->find_field(member);
    const bool predicate_field = field != nullptr && field->is_predicate;

    std::vector<const MethodMember*> candidates;
    bool has_methods = false;
    for (const MethodMember* m : desc->find_methods(member)) {
        has_methods = true;
        if (m->is_predicate_shaped()) candidates.push_back(m);
    }

    if (predicate_field && has_methods) {
        throw PredicateResolutionError(ResolutionFailure::ambiguous, desc->name(), member);
    }

    if (predicate_field) {
        if (!field->is_static && !can_bind) {
            throw PredicateResolutionError(ResolutionFailure::not_static, desc->name(), member);
        }
        const Predicate* stored = field->predicate(field->is_static ? nullptr : current.get());
        if (!*stored) {
            throw PredicateResolutionError(ResolutionFailure::unset_predicate, desc->name(), member);
        }
        PredicateHandle handle = PredicateHandle::stored(stored);
        if (field->is_static) {
            std::unique_lock lock(mutex_);
            static_handles_.insert_or_assign(CacheKey(target, member), handle);
        }
        return handle;
    }

    if (has_methods) {
        if (candidates.empty()) {
            throw PredicateResolutionError(ResolutionFailure::wrong_method_shape, desc->name(), member);
        }
        if (candidates.size() > 1) {
            throw PredicateResolutionError(ResolutionFailure::ambiguous, desc->name(), member);
        }
        const MethodMember* method = candidates.front();
        if (method->is_static) {
            PredicateHandle handle = PredicateHandle::unbound(method->invoke);
            std::unique_lock lock(mutex_);
            static_handles_.insert_or_assign(CacheKey(target, member), handle);
            return handle;
        }
        if (!can_bind) {
            throw PredicateResolutionError(ResolutionFailure::not_static, desc->name(), member);
        }
        return PredicateHandle::bound(method->invoke, current.get());
    }

    if (field != nullptr) {
        throw PredicateResolutionError(ResolutionFailure::wrong_field_shape, desc->name(), member);
    }
    throw PredicateResolutionError(ResolutionFailure::not_found, desc->name(), member);
}

void PredicateResolver::clear_cache() {
    std::unique_lock lock(mutex_);
    static_handles_.clear();
}

} // namespace cfgbind
