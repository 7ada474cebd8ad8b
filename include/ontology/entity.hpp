#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace atlas {

// Entity types in the knowledge graph
enum class EntityType {
    // Risk entities
    RISK,
    RISK_GROUP,
    RISK_TAXONOMY,
    RISK_CONTROL,
    RISK_INCIDENT,
    ACTION,

    // AI system entities
    AI_SYSTEM,
    AI_MODEL,
    AI_TASK,
    USE_CASE,

    // Capability entities
    CAPABILITY,
    CAPABILITY_GROUP,
    CAPABILITY_DOMAIN,
    CAPABILITY_TAXONOMY,

    // Intrinsic entities
    LLM_INTRINSIC,
    ADAPTER,

    // Evaluation entities
    EVALUATION,
    AI_EVAL_RESULT,
    BENCHMARK,

    // Supporting entities
    STAKEHOLDER,
    STAKEHOLDER_GROUP,
    DOCUMENT,
    DATASET,
    PRINCIPLE,
    POLICY,
    RULE,
    LICENSE,
    ORGANIZATION
};

// Relationship types (directed edge kinds)
enum class RelationType {
    // Risk relationships
    HAS_RELATED_RISK,
    HAS_RELATED_ACTION,
    IS_DETECTED_BY,
    DETECTS_RISK_CONCEPT,
    REFERS_TO_RISK,

    // Task-capability relationships
    REQUIRES_CAPABILITY,
    REQUIRED_BY_TASK,

    // Capability-intrinsic relationships
    IMPLEMENTS_CAPABILITY,
    IMPLEMENTED_BY_INTRINSIC,
    IMPLEMENTS_CAPABILITY_ADAPTER,
    IMPLEMENTED_BY_ADAPTER,

    // Capability-benchmark relationships
    EVALUATES_CAPABILITY,
    EVALUATED_BY_BENCHMARK,

    // Hierarchy relationships
    IS_PART_OF,
    HAS_PART,
    BELONGS_TO_DOMAIN,
    IS_DEFINED_BY_TAXONOMY,

    // SKOS relationships
    EXACT_MATCH,
    CLOSE_MATCH,
    BROAD_MATCH,
    NARROW_MATCH,
    RELATED_MATCH,

    // Evaluation relationships
    HAS_EVALUATION,
    EVALUATES_RISK,
    HAS_RELATED_LLMINTRINSIC,

    // Documentation relationships
    HAS_DOCUMENTATION,
    HAS_LICENSE,

    // AI system relationships
    HAS_AI_TASK,
    HAS_STAKEHOLDER,

    // Rule relationships
    HAS_RULE
};

std::string to_string(EntityType type);
std::string to_string(RelationType type);

// Parse the ontology class name ("Capability", "AiTask", ...)
std::optional<EntityType> entity_type_from_string(const std::string& name);

// Parse the relationship name ("requiresCapability", ...)
std::optional<RelationType> relation_type_from_string(const std::string& name);

// Snapshot collection key for a type ("capabilities", "aitasks", ...)
std::string collection_key(EntityType type);

// Accepts either a collection key or a class name
std::optional<EntityType> entity_type_from_collection_key(const std::string& key);

const std::vector<EntityType>& all_entity_types();
const std::vector<RelationType>& all_relation_types();

/**
 * @brief A typed, identified record of the knowledge graph
 *
 * The type tag is assigned once when the record is loaded. Relationship
 * attributes hold either a single target id or a list of target ids;
 * everything else is plain data.
 */
struct Entity {
    EntityType type = EntityType::CAPABILITY;
    std::string id;
    std::map<std::string, nlohmann::json> attributes;

    /**
     * @brief Get a named attribute, null when absent
     *
     * "id" always resolves to the entity id.
     */
    nlohmann::json attribute(const std::string& name) const;

    bool has_attribute(const std::string& name) const;

    // Convenience for text attributes ("name", "isDefinedByTaxonomy", ...)
    std::string attribute_string(const std::string& name,
                                 const std::string& default_value = "") const;

    nlohmann::json to_json() const;
    static Entity from_json(EntityType type, const nlohmann::json& j);
};

}  // namespace atlas
