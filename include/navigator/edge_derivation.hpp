#pragma once

#include "ontology/entity.hpp"
#include "ontology/entity_index.hpp"
#include <map>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief One attribute-to-relationship rule
 *
 * Reading `attribute` off an entity yields target ids of `target_type`,
 * each becoming a `relation` edge.
 */
struct EdgeRule {
    std::string attribute;
    RelationType relation = RelationType::REQUIRES_CAPABILITY;
    EntityType target_type = EntityType::CAPABILITY;
};

/**
 * @brief An outgoing edge resolved against the entity index
 */
struct DerivedEdge {
    RelationType relation = RelationType::REQUIRES_CAPABILITY;
    std::string target_id;
    EntityType target_type = EntityType::CAPABILITY;
    const Entity* target = nullptr;   // Not owned
};

/**
 * @brief Static registry of which attributes encode outgoing relationships
 *
 * Rules are kept per source entity type, plus global rules that apply to
 * every type. derive_edges() enumerates a type's leading rules in
 * registration order, then the global rules, then the type's trailing
 * rules; within a rule it follows the attribute's list order. Targets
 * missing from the index are dropped.
 */
class EdgeDerivationTable {
public:
    EdgeDerivationTable() = default;

    void add_rule(EntityType source_type, const EdgeRule& rule);
    void add_global_rule(const EdgeRule& rule);

    // Applied after the global rules for this type
    void add_trailing_rule(EntityType source_type, const EdgeRule& rule);

    /**
     * @brief All rules for a type, in the order derive_edges() applies them
     */
    std::vector<EdgeRule> rules_for(EntityType source_type) const;

    const std::vector<EdgeRule>& global_rules() const { return global_rules_; }

    std::vector<DerivedEdge> derive_edges(const Entity& entity, const EntityIndex& index) const;

    size_t num_rules() const;

    /**
     * @brief The knowledge graph's relationship layout
     */
    static EdgeDerivationTable default_table();

    /**
     * @brief Normalize an attribute value to a list of target ids
     *
     * A string becomes a one-element list, an array keeps its string
     * members in order, anything else (null, numbers, objects) yields
     * nothing.
     */
    static std::vector<std::string> target_ids(const nlohmann::json& value);

private:
    std::map<EntityType, std::vector<EdgeRule>> type_rules_;
    std::vector<EdgeRule> global_rules_;
    std::map<EntityType, std::vector<EdgeRule>> trailing_rules_;
};

}  // namespace atlas
