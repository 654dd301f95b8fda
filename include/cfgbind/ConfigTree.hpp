#ifndef CFGBIND_CONFIG_TREE_HPP
#define CFGBIND_CONFIG_TREE_HPP

#include "cfgbind/Value.hpp"
#include <string>
#include <vector>

namespace cfgbind {

/**
 * @brief Read-only configuration tree with raw lookup by path.
 *
 * Internally uses nlohmann::json to represent a hierarchical tree.
 * get_raw() distinguishes a missing entry from an explicit null, which is
 * what the skip conditions IS_MISSING and IS_NULL rely on.
 */
class ConfigTree {
public:
    ConfigTree() = default;
    explicit ConfigTree(Value data) : data_(std::move(data)) {}

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }

    // Raw lookup: absent if any segment is missing or traverses a scalar
    RawValue get_raw(const std::vector<std::string>& path) const;
    RawValue get_raw(const std::string& dot_path) const;

    bool contains(const std::vector<std::string>& path) const;

    // Strict dot access, throws KeyError / TypeError
    const Value& at(const std::string& dot_path) const;

    std::string to_json_string(int indent = 2) const;

private:
    Value data_ = Value::object();
};

} // namespace cfgbind

#endif // CFGBIND_CONFIG_TREE_HPP
