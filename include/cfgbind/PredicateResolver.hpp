/**
 * @file PredicateResolver.hpp
 * @brief Resolution of CUSTOM skip checks to callable predicates
 *
 * A custom check names a member of a declaring type:
 * - with the CurrentType sentinel, the type of the object being
 *   deserialized; instance members are bound to that object
 * - otherwise the named (described) type, whose member must be static
 *
 * Fields are searched before methods. A predicate field and a method with
 * the same name are ambiguous.
 */

#ifndef CFGBIND_PREDICATE_RESOLVER_HPP
#define CFGBIND_PREDICATE_RESOLVER_HPP

#include "cfgbind/TypeDescription.hpp"
#include "cfgbind/Value.hpp"

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <utility>

namespace cfgbind {

/**
 * @brief A resolved predicate, invoked uniformly whatever its origin.
 *
 * Handles of shape bound_method, and stored_predicate handles that point
 * into an instance, are only valid while that instance lives.
 */
class PredicateHandle {
public:
    enum class Shape { stored_predicate, bound_method, static_method };

    static PredicateHandle stored(const Predicate* predicate) {
        PredicateHandle h(Shape::stored_predicate);
        h.stored_ = predicate;
        return h;
    }

    static PredicateHandle bound(std::function<bool(void*, const RawValue&)> method, void* receiver) {
        PredicateHandle h(Shape::bound_method);
        h.method_ = std::move(method);
        h.receiver_ = receiver;
        return h;
    }

    static PredicateHandle unbound(std::function<bool(void*, const RawValue&)> method) {
        PredicateHandle h(Shape::static_method);
        h.method_ = std::move(method);
        return h;
    }

    Shape shape() const noexcept { return shape_; }

    /**
     * @throws std::bad_function_call if a stored predicate was reset after
     *         resolution, or whatever the predicate throws
     */
    bool operator()(const RawValue& raw) const {
        if (shape_ == Shape::stored_predicate) {
            return (*stored_)(raw);
        }
        return method_(receiver_, raw);
    }

private:
    explicit PredicateHandle(Shape shape) : shape_(shape) {}

    Shape shape_;
    const Predicate* stored_ = nullptr;
    std::function<bool(void*, const RawValue&)> method_;
    void* receiver_ = nullptr;
};

class PredicateResolver {
public:
    explicit PredicateResolver(const TypeRegistry& registry = TypeRegistry::global())
        : registry_(registry) {}

    /**
     * @brief Resolve a custom check
     *
     * @param declaring_type typeid(CurrentType) or the type holding the check
     * @param member Name of the predicate field or method
     * @param current The object being deserialized
     * @throws PredicateResolutionError
     */
    PredicateHandle resolve(std::type_index declaring_type, const std::string& member,
                            ObjectRef current) const;

    /// Drop cached handles of static predicates.
    void clear_cache();

private:
    using CacheKey = std::pair<std::type_index, std::string>;

    const TypeRegistry& registry_;
    mutable std::shared_mutex mutex_;
    mutable std::map<CacheKey, PredicateHandle> static_handles_;
};

} // namespace cfgbind

#endif // CFGBIND_PREDICATE_RESOLVER_HPP
