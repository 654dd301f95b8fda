#include "cfgbind/Emptiness.hpp"

namespace cfgbind {

bool is_empty(const Value& value) noexcept {
    if (value.is_null()) {
        return true;
    }
    if (value.is_string()) {
        return value.get_ref<const std::string&>().empty();
    }
    if (value.is_array() || value.is_object()) {
        return value.empty();
    }
    if (value.is_binary()) {
        return value.get_binary().empty();
    }
    return false;
}

std::optional<bool> try_query_empty(const RawValue& value) noexcept {
    try {
        return value.query_empty();
    } catch (...) {
        // A query that fails in any way leaves the answer unknown.
        return std::nullopt;
    }
}

bool is_empty(const RawValue& value) noexcept {
    if (!value.is_present()) {
        return true;
    }
    if (value.is_host_object()) {
        return try_query_empty(value).value_or(false);
    }
    return is_empty(value.value());
}

} // namespace cfgbind
