#include "cfgbind/TypeDescription.hpp"

#include <mutex>

namespace cfgbind {

const PropertyDescriptor* TypeDescription::find_property(const std::string& name) const {
    for (const auto& prop : properties_) {
        if (prop.name == name) return &prop;
    }
    return nullptr;
}

const FieldMember* TypeDescription::find_field(const std::string& name) const {
    // A predicate field wins over a plain field registered under the same name.
    const FieldMember* plain = nullptr;
    for (const auto& field : fields_) {
        if (field.name != name) continue;
        if (field.is_predicate) return &field;
        if (plain == nullptr) plain = &field;
    }
    return plain;
}

std::vector<const MethodMember*> TypeDescription::find_methods(const std::string& name) const {
    std::vector<const MethodMember*> found;
    for (const auto& method : methods_) {
        if (method.name == name) found.push_back(&method);
    }
    return found;
}

// ============================================================================
// TypeRegistry
// ============================================================================

TypeRegistry& TypeRegistry::global() {
    static TypeRegistry registry;
    return registry;
}

void TypeRegistry::add(std::shared_ptr<const TypeDescription> description) {
    std::unique_lock lock(mutex_);
    const std::type_index type = description->type();
    types_[type] = std::move(description);
}

std::shared_ptr<const TypeDescription> TypeRegistry::find(std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = types_.find(type);
    if (it == types_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace cfgbind
