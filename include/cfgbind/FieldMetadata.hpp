/**
 * @file FieldMetadata.hpp
 * @brief Immutable per-field policy metadata and its process-wide cache
 *
 * FieldMetadata is derived from a field's annotations the first time the
 * (declaring type, field) pair is met, then shared read-only. Concurrent
 * first derivations of the same pair may race; the results are equal and
 * the last one stored wins.
 */

#ifndef CFGBIND_FIELD_METADATA_HPP
#define CFGBIND_FIELD_METADATA_HPP

#include "cfgbind/Annotations.hpp"
#include "cfgbind/TypeDescription.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace cfgbind {

struct FieldMetadata {
    std::type_index declaring_type = typeid(void);
    std::string declaring_type_name;
    std::string field_name;
    /// Config path relative to the object's own table.
    std::vector<std::string> path;
    std::vector<SkipCondition> skip_conditions;
    std::shared_ptr<const DefaultRule> default_rule;
};

/**
 * @brief Derive metadata from a described field's annotations.
 *
 * Repeated skip annotations are flattened in order. The path defaults to
 * the field name.
 *
 * @throws AnnotationError for a CUSTOM condition without a check name or
 *         more than one default
 */
std::shared_ptr<const FieldMetadata> derive_field_metadata(const TypeDescription& type,
                                                           const PropertyDescriptor& property);

class MetadataCache {
public:
    static MetadataCache& global();

    /**
     * @brief Metadata for a field, derived on first use.
     *
     * @throws AnnotationError if the type has no such field or its
     *         annotations are malformed
     */
    std::shared_ptr<const FieldMetadata> get(const TypeDescription& type, const std::string& field);

    void clear();

private:
    using Key = std::pair<std::type_index, std::string>;

    mutable std::shared_mutex mutex_;
    std::map<Key, std::shared_ptr<const FieldMetadata>> entries_;
};

} // namespace cfgbind

#endif // CFGBIND_FIELD_METADATA_HPP
