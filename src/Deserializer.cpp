#include "cfgbind/Deserializer.hpp"
#include "cfgbind/DotPath.hpp"
#include "cfgbind/Errors.hpp"

namespace cfgbind {

Deserializer::Deserializer()
    : Deserializer(TypeRegistry::global(), MetadataCache::global())
{}

Deserializer::Deserializer(const TypeRegistry& registry, MetadataCache& cache)
    : registry_(registry)
    , cache_(cache)
    , resolver_(registry)
    , policy_(resolver_)
{}

void Deserializer::deserialize_into(const ConfigTree& tree, ObjectRef object) const {
    walk(tree, {}, object);
}

void Deserializer::walk(const ConfigTree& tree, const std::vector<std::string>& prefix,
                        ObjectRef object) const {
    auto desc = registry_.find(object.type());
    if (!desc) {
        throw DeserializationError(join_dot_path(prefix),
                                   std::string("type is not described: ") + object.type().name());
    }

    for (const auto& property : desc->properties()) {
        auto meta = cache_.get(*desc, property.name);

        std::vector<std::string> path = prefix;
        path.insert(path.end(), meta->path.begin(), meta->path.end());

        const RawValue raw = tree.get_raw(path);
        const Decision decision = policy_.decide(*meta, raw, object);

        switch (decision.kind()) {
            case Decision::Kind::skip:
                break;
            case Decision::Kind::use_default:
                apply_value(tree, property, path, decision.default_value(), false, object);
                break;
            case Decision::Kind::proceed:
                if (raw.is_absent()) {
                    throw DeserializationError(join_dot_path(path), "missing config entry");
                }
                apply_value(tree, property, path, raw.value(), true, object);
                break;
        }
    }
}

void Deserializer::apply_value(const ConfigTree& tree, const PropertyDescriptor& property,
                               const std::vector<std::string>& path, const Value& value,
                               bool from_tree, ObjectRef object) const {
    if (property.nested_type) {
        if (!value.is_object()) {
            throw DeserializationError(join_dot_path(path),
                                       "expected object, got " + type_name(value));
        }
        ObjectRef child(*property.nested_type, property.nested_access(object.get()));
        if (from_tree) {
            walk(tree, path, child);
        } else {
            walk(ConfigTree(value), {}, child);
        }
        return;
    }

    try {
        property.assign(object.get(), value);
    } catch (const nlohmann::json::exception& e) {
        throw DeserializationError(join_dot_path(path), e.what());
    }
}

} // namespace cfgbind
