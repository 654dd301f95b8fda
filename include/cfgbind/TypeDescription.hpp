/**
 * @file TypeDescription.hpp
 * @brief Describing C++ types to cfgbind
 *
 * C++ has no runtime reflection, so a type's deserializable fields, its
 * annotations and the members that custom skip checks may name are
 * declared once with the Describe builder and registered in a
 * TypeRegistry:
 *
 * ```cpp
 * struct Server {
 *     std::string name = "main";
 *     int port = 80;
 *     Predicate skip_port;                          // predicate field
 *     bool skip_name(const RawValue& raw) const;    // predicate method
 * };
 *
 * Describe<Server>("Server")
 *     .property("name", &Server::name, skip_if_custom("skip_name"))
 *     .property("port", &Server::port, skip_if_custom("skip_port"))
 *     .field("skip_port", &Server::skip_port)
 *     .method("skip_name", &Server::skip_name)
 *     .commit();
 * ```
 *
 * Members that are not predicate-shaped may be registered as well; the
 * predicate resolver reports them as wrong-shape errors instead of
 * "not found".
 */

#ifndef CFGBIND_TYPE_DESCRIPTION_HPP
#define CFGBIND_TYPE_DESCRIPTION_HPP

#include "cfgbind/Annotations.hpp"
#include "cfgbind/Value.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cfgbind {

/**
 * @brief A predicate over raw config values, storable in a field.
 */
using Predicate = std::function<bool(const RawValue&)>;

/**
 * @brief Type-erased reference to the object being deserialized.
 */
class ObjectRef {
public:
    ObjectRef() : type_(typeid(void)) {}
    ObjectRef(std::type_index type, void* object) : type_(type), object_(object) {}

    template <typename T>
    static ObjectRef of(T& object) {
        return ObjectRef(typeid(T), &object);
    }

    std::type_index type() const noexcept { return type_; }
    void* get() const noexcept { return object_; }
    explicit operator bool() const noexcept { return object_ != nullptr; }

private:
    std::type_index type_;
    void* object_ = nullptr;
};

/**
 * @brief A data member visible to predicate resolution.
 */
struct FieldMember {
    std::string name;
    bool is_static = false;
    bool is_predicate = false;
    /// Address of the stored predicate; instance is ignored for statics.
    std::function<const Predicate*(void* instance)> predicate;
};

/**
 * @brief A member function or static function visible to predicate resolution.
 */
struct MethodMember {
    std::string name;
    bool is_static = false;
    std::size_t arity = 0;
    bool takes_raw_value = false;
    bool returns_bool = false;
    /// Set only when the method is predicate-shaped; instance is ignored for statics.
    std::function<bool(void* instance, const RawValue& raw)> invoke;

    bool is_predicate_shaped() const noexcept {
        return arity == 1 && takes_raw_value && returns_bool;
    }
};

/**
 * @brief A deserializable field and its annotations.
 */
struct PropertyDescriptor {
    std::string name;
    FieldAnnotations annotations;
    /// Whether a tree value converts to the field's type.
    std::function<bool(const Value&)> accepts;
    /// Convert and store; throws nlohmann::json::exception on mismatch. Unset for nested.
    std::function<void(void* instance, const Value&)> assign;
    /// Set for fields whose type is itself described.
    std::optional<std::type_index> nested_type;
    std::function<void*(void* instance)> nested_access;
};

/**
 * @brief Everything registered about one type.
 */
class TypeDescription {
public:
    TypeDescription(std::type_index type, std::string name)
        : type_(type), name_(std::move(name)) {}

    std::type_index type() const noexcept { return type_; }
    const std::string& name() const noexcept { return name_; }

    const std::vector<PropertyDescriptor>& properties() const noexcept { return properties_; }
    const std::vector<FieldMember>& fields() const noexcept { return fields_; }
    const std::vector<MethodMember>& methods() const noexcept { return methods_; }

    const PropertyDescriptor* find_property(const std::string& name) const;
    const FieldMember* find_field(const std::string& name) const;
    std::vector<const MethodMember*> find_methods(const std::string& name) const;

private:
    template <typename T>
    friend class Describe;

    std::type_index type_;
    std::string name_;
    std::vector<PropertyDescriptor> properties_;
    std::vector<FieldMember> fields_;
    std::vector<MethodMember> methods_;
};

/**
 * @brief Process-wide lookup of type descriptions.
 *
 * Registering a type twice replaces the earlier description.
 */
class TypeRegistry {
public:
    static TypeRegistry& global();

    void add(std::shared_ptr<const TypeDescription> description);

    /// @return The description, or nullptr if the type is not described
    std::shared_ptr<const TypeDescription> find(std::type_index type) const;

    template <typename T>
    std::shared_ptr<const TypeDescription> find() const {
        return find(typeid(T));
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<const TypeDescription>> types_;
};

namespace detail {

template <typename... Args>
struct takes_raw_value : std::false_type {};

template <typename A>
struct takes_raw_value<A>
    : std::bool_constant<std::is_same_v<A, RawValue> || std::is_same_v<A, const RawValue&>> {};

template <typename R, typename... Args>
struct is_predicate_signature
    : std::bool_constant<std::is_same_v<R, bool> && takes_raw_value<Args...>::value> {};

template <typename R, typename... Args>
MethodMember method_shape(std::string name, bool is_static) {
    MethodMember m;
    m.name = std::move(name);
    m.is_static = is_static;
    m.arity = sizeof...(Args);
    m.takes_raw_value = takes_raw_value<Args...>::value;
    m.returns_bool = std::is_same_v<R, bool>;
    return m;
}

/// Shape of a function or member function pointer; noexcept is ignored.
template <typename Fn>
struct function_traits;

template <typename R, typename... Args>
struct function_traits<R (*)(Args...)> {
    static constexpr bool is_const = false;
    static constexpr bool is_predicate = is_predicate_signature<R, Args...>::value;

    static MethodMember shape(std::string name, bool is_static) {
        return method_shape<R, Args...>(std::move(name), is_static);
    }
};

template <typename R, typename... Args>
struct function_traits<R (*)(Args...) noexcept> : function_traits<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...)> : function_traits<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...) noexcept> : function_traits<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...) const> : function_traits<R (*)(Args...)> {
    static constexpr bool is_const = true;
};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...) const noexcept> : function_traits<R (*)(Args...)> {
    static constexpr bool is_const = true;
};

template <typename M>
bool converts_to(const Value& value) {
    try {
        (void)value.get<M>();
        return true;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

} // namespace detail

/**
 * @brief Builder for a TypeDescription of T.
 */
template <typename T>
class Describe {
public:
    explicit Describe(std::string name)
        : desc_(std::make_shared<TypeDescription>(typeid(T), std::move(name))) {}

    /**
     * @brief A field converted from its config value with nlohmann::json.
     *
     * Annotations: SkipDeserializingIf (skip_if, skip_if_custom),
     * SerdeDefault (default_value, default_from), ConfigPath (config_path).
     */
    template <typename M, typename... Annotations>
    Describe& property(std::string name, M T::*member, Annotations&&... annotations) {
        static_assert(!std::is_same_v<std::remove_cv_t<M>, Predicate>,
                      "predicate members are registered with field()");
        PropertyDescriptor prop;
        prop.name = name;
        (prop.annotations.add(std::forward<Annotations>(annotations)), ...);
        prop.accepts = &detail::converts_to<M>;
        prop.assign = [member](void* instance, const Value& value) {
            static_cast<T*>(instance)->*member = value.get<M>();
        };
        desc_->properties_.push_back(std::move(prop));
        add_plain_field(std::move(name));
        return *this;
    }

    /**
     * @brief A field whose type M is itself described; deserialized recursively.
     */
    template <typename M, typename... Annotations>
    Describe& nested(std::string name, M T::*member, Annotations&&... annotations) {
        PropertyDescriptor prop;
        prop.name = name;
        (prop.annotations.add(std::forward<Annotations>(annotations)), ...);
        prop.accepts = [](const Value& value) { return value.is_object(); };
        prop.nested_type = std::type_index(typeid(M));
        prop.nested_access = [member](void* instance) -> void* {
            return &(static_cast<T*>(instance)->*member);
        };
        desc_->properties_.push_back(std::move(prop));
        add_plain_field(std::move(name));
        return *this;
    }

    /**
     * @brief A data member that is not deserialized but may be named by a
     * custom check. Members of type Predicate are predicate fields.
     */
    template <typename M>
    Describe& field(std::string name, M T::*member) {
        FieldMember f;
        f.name = std::move(name);
        if constexpr (std::is_same_v<std::remove_cv_t<M>, Predicate>) {
            f.is_predicate = true;
            f.predicate = [member](void* instance) -> const Predicate* {
                return &(static_cast<const T*>(instance)->*member);
            };
        } else {
            (void)member;
        }
        desc_->fields_.push_back(std::move(f));
        return *this;
    }

    /// A static data member (or any object with static storage duration).
    template <typename M>
    Describe& static_field(std::string name, const M* member) {
        FieldMember f;
        f.name = std::move(name);
        f.is_static = true;
        if constexpr (std::is_same_v<std::remove_cv_t<M>, Predicate>) {
            f.is_predicate = true;
            f.predicate = [member](void*) -> const Predicate* { return member; };
        } else {
            (void)member;
        }
        desc_->fields_.push_back(std::move(f));
        return *this;
    }

    /**
     * @brief A member function, const or not, noexcept or not.
     *
     * Only `bool(const RawValue&)` or `bool(RawValue)` methods can serve as
     * predicates; others are recorded so resolution can report their shape.
     */
    template <typename Fn>
    Describe& method(std::string name, Fn fn) {
        static_assert(std::is_member_function_pointer_v<Fn>,
                      "free and static functions are registered with static_method()");
        using Traits = detail::function_traits<Fn>;
        using Self = std::conditional_t<Traits::is_const, const T, T>;
        MethodMember m = Traits::shape(std::move(name), false);
        if constexpr (Traits::is_predicate) {
            m.invoke = [fn](void* instance, const RawValue& raw) {
                return (static_cast<Self*>(instance)->*fn)(raw);
            };
        } else {
            (void)fn;
        }
        desc_->methods_.push_back(std::move(m));
        return *this;
    }

    template <typename Fn>
    Describe& static_method(std::string name, Fn fn) {
        static_assert(std::is_pointer_v<Fn> && std::is_function_v<std::remove_pointer_t<Fn>>,
                      "member functions are registered with method()");
        using Traits = detail::function_traits<Fn>;
        MethodMember m = Traits::shape(std::move(name), true);
        if constexpr (Traits::is_predicate) {
            m.invoke = [fn](void*, const RawValue& raw) { return fn(raw); };
        } else {
            (void)fn;
        }
        desc_->methods_.push_back(std::move(m));
        return *this;
    }

    /// Register the description and return it.
    std::shared_ptr<const TypeDescription> commit(TypeRegistry& registry = TypeRegistry::global()) {
        registry.add(desc_);
        return desc_;
    }

private:
    void add_plain_field(std::string name) {
        FieldMember f;
        f.name = std::move(name);
        desc_->fields_.push_back(std::move(f));
    }

    std::shared_ptr<TypeDescription> desc_;
};

} // namespace cfgbind

#endif // CFGBIND_TYPE_DESCRIPTION_HPP
