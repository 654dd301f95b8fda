#include "cfgbind/ConfigTree.hpp"
#include "cfgbind/DotPath.hpp"

namespace cfgbind {

RawValue ConfigTree::get_raw(const std::vector<std::string>& path) const {
    const Value* found = find_by_path(data_, path);
    if (found == nullptr) {
        return RawValue::absent();
    }
    return RawValue(*found);
}

RawValue ConfigTree::get_raw(const std::string& dot_path) const {
    return get_raw(split_dot_path(dot_path));
}

bool ConfigTree::contains(const std::vector<std::string>& path) const {
    return find_by_path(data_, path) != nullptr;
}

const Value& ConfigTree::at(const std::string& dot_path) const {
    return *get_by_dot(data_, dot_path);
}

std::string ConfigTree::to_json_string(int indent) const {
    return data_.dump(indent);
}

} // namespace cfgbind
