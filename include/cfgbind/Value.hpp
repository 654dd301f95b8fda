/**
 * @file Value.hpp
 * @brief Value types for configuration data
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * RawValue wraps a Value fetched from a configuration tree and keeps the
 * distinction between a missing entry, an explicit null and a present value.
 */

#ifndef CFGBIND_VALUE_HPP
#define CFGBIND_VALUE_HPP

#include <nlohmann/json.hpp>
#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace cfgbind {

/**
 * @brief JSON-like value type for configuration
 *
 * This is an alias for nlohmann::json. See nlohmann::json documentation
 * for the complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object", "binary")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    if (val.is_binary()) return "binary";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

namespace detail {

template <typename T, typename = void>
struct has_is_empty : std::false_type {};

template <typename T>
struct has_is_empty<T, std::void_t<decltype(std::declval<const T&>().is_empty())>>
    : std::is_convertible<decltype(std::declval<const T&>().is_empty()), bool> {};

template <typename T, typename = void>
struct has_empty : std::false_type {};

template <typename T>
struct has_empty<T, std::void_t<decltype(std::declval<const T&>().empty())>>
    : std::is_convertible<decltype(std::declval<const T&>().empty()), bool> {};

} // namespace detail

/**
 * @brief Value extracted from a configuration tree at a given path
 *
 * A RawValue is in one of three states:
 * - absent: there is no entry at the path
 * - null: the entry exists and holds an explicit null
 * - present: the entry holds any other value
 *
 * A present RawValue normally holds a Value. It may instead hold an opaque
 * host object (any copyable C++ value placed in the tree by a converter);
 * such objects carry an emptiness query detected from their type when the
 * RawValue is built.
 */
class RawValue {
public:
    enum class State { absent, null, present };

    /// Constructs an absent value.
    RawValue() = default;

    /**
     * @brief Wrap a tree value
     *
     * A JSON null becomes the null state, everything else is present.
     */
    explicit RawValue(Value value)
        : state_(value.is_null() ? State::null : State::present)
        , value_(std::move(value))
    {}

    static RawValue absent() { return RawValue(); }

    static RawValue null() { return RawValue(Value(nullptr)); }

    /**
     * @brief Wrap an opaque host object
     *
     * If T exposes `bool is_empty() const` (preferred) or
     * `bool empty() const`, the query is recorded so that the emptiness
     * classifier can use it later.
     */
    template <typename T>
    static RawValue host_object(T object) {
        RawValue raw;
        raw.state_ = State::present;
        raw.host_ = std::move(object);
        raw.empty_query_ = [](const std::any& any) -> std::optional<bool> {
            const T& obj = std::any_cast<const T&>(any);
            if constexpr (detail::has_is_empty<T>::value) {
                return static_cast<bool>(obj.is_empty());
            } else if constexpr (detail::has_empty<T>::value) {
                return static_cast<bool>(obj.empty());
            } else {
                (void)obj;
                return std::nullopt;
            }
        };
        return raw;
    }

    State state() const noexcept { return state_; }
    bool is_absent() const noexcept { return state_ == State::absent; }
    bool is_null() const noexcept { return state_ == State::null; }
    bool is_present() const noexcept { return state_ == State::present; }

    bool is_host_object() const noexcept { return host_.has_value(); }

    /**
     * @brief The wrapped tree value
     *
     * Returns a JSON null for absent values and host objects.
     */
    const Value& value() const noexcept { return value_; }

    /// The wrapped host object; empty unless is_host_object().
    const std::any& host() const noexcept { return host_; }

    /**
     * @brief Ask a host object whether it is empty
     *
     * @return nullopt when this is not a host object or its type exposes
     *         no emptiness query
     * @throws whatever the host object's query throws
     */
    std::optional<bool> query_empty() const {
        if (!host_.has_value() || !empty_query_) return std::nullopt;
        return empty_query_(host_);
    }

    /// Short description for diagnostics ("absent", "null", "string", ...).
    std::string describe() const {
        switch (state_) {
            case State::absent: return "absent";
            case State::null: return "null";
            case State::present: break;
        }
        if (host_.has_value()) return std::string("host object (") + host_.type().name() + ")";
        return type_name(value_);
    }

private:
    State state_ = State::absent;
    Value value_;
    std::any host_;
    std::function<std::optional<bool>(const std::any&)> empty_query_;
};

/// Name of a RawValue state ("absent", "null" or "present").
inline const char* to_string(RawValue::State state) {
    switch (state) {
        case RawValue::State::absent: return "absent";
        case RawValue::State::null: return "null";
        case RawValue::State::present: return "present";
    }
    return "unknown";
}

} // namespace cfgbind

#endif // CFGBIND_VALUE_HPP
