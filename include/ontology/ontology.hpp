#pragma once

#include "ontology/entity.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace atlas {

/**
 * @brief Read-only, already merged snapshot of the knowledge graph
 *
 * Holds one ordered collection of entities per entity type. Records that
 * share an id within a type are combined into a single entity when added,
 * so relationship lists split across several input files end up on one
 * record.
 *
 * Navigators keep pointers into these collections: an Ontology must not
 * be modified once a GraphNavigator has been built over it.
 */
class Ontology {
public:
    Ontology() = default;

    /**
     * @brief Add an entity, combining it with an existing record of the same (type, id)
     */
    void add_entity(const Entity& entity);

    /**
     * @brief Entities of one type in load order (empty if none)
     */
    const std::vector<Entity>& entities(EntityType type) const;

    size_t size(EntityType type) const;
    size_t total_entities() const;
    bool empty() const { return total_entities() == 0; }

    // Types that have at least one entity
    std::vector<EntityType> populated_types() const;

    // ==========================================
    // Import/Export
    // ==========================================

    /**
     * @brief Build a snapshot from a JSON object keyed by collection
     *
     * Keys may be collection keys ("capabilities") or class names
     * ("Capability"). Unknown keys are skipped with a warning.
     */
    static Ontology from_json(const nlohmann::json& j);

    /**
     * @brief Merge another JSON document into this snapshot
     */
    void merge_json(const nlohmann::json& j, const std::string& origin = "");

    static Ontology load_from_json(const std::string& filename);

    /**
     * @brief Load every *.json file below a directory, in path order
     *
     * Files that cannot be read or parsed are skipped with a warning.
     */
    static Ontology load_from_directory(const std::string& directory);

    nlohmann::json to_json() const;

private:
    std::map<EntityType, std::vector<Entity>> collections_;
    std::map<EntityType, std::unordered_map<std::string, size_t>> positions_;

    static void combine_into(Entity& existing, const Entity& incoming);
};

}  // namespace atlas
