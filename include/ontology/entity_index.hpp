#pragma once

#include "ontology/ontology.hpp"
#include <string>
#include <unordered_map>

namespace atlas {

/**
 * @brief Per-type id lookup over an Ontology snapshot
 *
 * Built once in O(n). A missing id is not an error: lookup() returns
 * nullptr and callers drop the reference. When a type holds the same id
 * twice the first record wins.
 */
class EntityIndex {
public:
    EntityIndex() = default;
    explicit EntityIndex(const Ontology& ontology);

    const Entity* lookup(EntityType type, const std::string& id) const;

    bool contains(EntityType type, const std::string& id) const {
        return lookup(type, id) != nullptr;
    }

    size_t size() const { return size_; }

private:
    std::unordered_map<EntityType, std::unordered_map<std::string, const Entity*>> by_type_;
    size_t size_ = 0;
};

}  // namespace atlas
