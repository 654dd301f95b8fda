/**
 * @file Deserializer.hpp
 * @brief Populates described objects from a configuration tree
 *
 * For each described field, in registration order, the deserializer
 * fetches the raw value at the field's path, asks the field policy for a
 * decision and applies it:
 * - Skip: the field keeps the value it already had
 * - UseDefault: the computed default is converted into the field
 * - Proceed: the config value is converted into the field; a missing
 *   entry is an error
 *
 * Fields declared with Describe::nested() are deserialized recursively
 * from the table at their path.
 *
 * ```cpp
 * ConfigTree tree = load_tree("server.toml");
 * Server server;
 * Deserializer().deserialize_into(tree, server);
 * ```
 */

#ifndef CFGBIND_DESERIALIZER_HPP
#define CFGBIND_DESERIALIZER_HPP

#include "cfgbind/ConfigTree.hpp"
#include "cfgbind/FieldMetadata.hpp"
#include "cfgbind/FieldPolicy.hpp"
#include "cfgbind/PredicateResolver.hpp"
#include "cfgbind/TypeDescription.hpp"

#include <string>
#include <vector>

namespace cfgbind {

class Deserializer {
public:
    /// Uses the global type registry and metadata cache.
    Deserializer();
    Deserializer(const TypeRegistry& registry, MetadataCache& cache);

    Deserializer(const Deserializer&) = delete;
    Deserializer& operator=(const Deserializer&) = delete;

    /**
     * @throws DeserializationError if a field cannot be populated or the
     *         type is not described
     * @throws PredicateResolutionError if a custom check cannot be resolved
     * @throws AnnotationError if a field's annotations are malformed
     */
    void deserialize_into(const ConfigTree& tree, ObjectRef object) const;

    template <typename T>
    void deserialize_into(const ConfigTree& tree, T& object) const {
        deserialize_into(tree, ObjectRef::of(object));
    }

    /// Deserialize into a value-initialized T.
    template <typename T>
    T deserialize(const ConfigTree& tree) const {
        T object{};
        deserialize_into(tree, object);
        return object;
    }

private:
    void walk(const ConfigTree& tree, const std::vector<std::string>& prefix, ObjectRef object) const;
    void apply_value(const ConfigTree& tree, const PropertyDescriptor& property,
                     const std::vector<std::string>& path, const Value& value,
                     bool from_tree, ObjectRef object) const;

    const TypeRegistry& registry_;
    MetadataCache& cache_;
    PredicateResolver resolver_;
    FieldPolicyEngine policy_;
};

} // namespace cfgbind

#endif // CFGBIND_DESERIALIZER_HPP
