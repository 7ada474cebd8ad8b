#include "ontology/entity_index.hpp"

namespace atlas {

EntityIndex::EntityIndex(const Ontology& ontology) {
    for (EntityType type : ontology.populated_types()) {
        auto& ids = by_type_[type];
        const auto& collection = ontology.entities(type);
        ids.reserve(collection.size());

        for (const auto& entity : collection) {
            if (ids.emplace(entity.id, &entity).second) {
                ++size_;
            }
        }
    }
}

const Entity* EntityIndex::lookup(EntityType type, const std::string& id) const {
    auto type_it = by_type_.find(type);
    if (type_it == by_type_.end()) {
        return nullptr;
    }
    auto it = type_it->second.find(id);
    return it != type_it->second.end() ? it->second : nullptr;
}

}  // namespace atlas
