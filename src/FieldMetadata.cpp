#include "cfgbind/FieldMetadata.hpp"
#include "cfgbind/Errors.hpp"

#include <mutex>

namespace cfgbind {

std::shared_ptr<const FieldMetadata> derive_field_metadata(const TypeDescription& type,
                                                           const PropertyDescriptor& property) {
    const FieldAnnotations& annotations = property.annotations;

    if (annotations.defaults.size() > 1) {
        throw AnnotationError(type.name(), property.name,
                              "at most one default may apply to deserialization");
    }

    auto meta = std::make_shared<FieldMetadata>();
    meta->declaring_type = type.type();
    meta->declaring_type_name = type.name();
    meta->field_name = property.name;
    if (annotations.path && !annotations.path->segments.empty()) {
        meta->path = annotations.path->segments;
    } else {
        meta->path = {property.name};
    }
    meta->skip_conditions = flatten_skip_annotations(annotations.skips, type.name(), property.name);

    if (!annotations.defaults.empty()) {
        const SerdeDefault& def = annotations.defaults.front();
        if (!def.supplier) {
            throw AnnotationError(type.name(), property.name, "default has no value supplier");
        }
        meta->default_rule = std::make_shared<DefaultValue>(def.supplier, def.when, property.accepts);
    }

    return meta;
}

// ============================================================================
// MetadataCache
// ============================================================================

MetadataCache& MetadataCache::global() {
    static MetadataCache cache;
    return cache;
}

std::shared_ptr<const FieldMetadata> MetadataCache::get(const TypeDescription& type,
                                                        const std::string& field) {
    const Key key(type.type(), field);
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return it->second;
        }
    }

    const PropertyDescriptor* property = type.find_property(field);
    if (property == nullptr) {
        throw AnnotationError(type.name(), field, "no such deserializable field");
    }
    auto meta = derive_field_metadata(type, *property);

    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(key, meta);
    return meta;
}

void MetadataCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

} // namespace cfgbind
