#include "ontology/entity.hpp"
#include <algorithm>

namespace {

using atlas::EntityType;
using atlas::RelationType;

struct EntityTypeInfo {
    EntityType type;
    const char* name;
    const char* collection;
};

struct RelationTypeInfo {
    RelationType type;
    const char* name;
};

const std::vector<EntityTypeInfo>& entity_type_table() {
    static const std::vector<EntityTypeInfo> table = {
        {EntityType::RISK, "Risk", "risks"},
        {EntityType::RISK_GROUP, "RiskGroup", "riskgroups"},
        {EntityType::RISK_TAXONOMY, "RiskTaxonomy", "taxonomies"},
        {EntityType::RISK_CONTROL, "RiskControl", "riskcontrols"},
        {EntityType::RISK_INCIDENT, "RiskIncident", "riskincidents"},
        {EntityType::ACTION, "Action", "actions"},
        {EntityType::AI_SYSTEM, "AiSystem", "aisystems"},
        {EntityType::AI_MODEL, "AiModel", "aimodels"},
        {EntityType::AI_TASK, "AiTask", "aitasks"},
        {EntityType::USE_CASE, "UseCase", "usecases"},
        {EntityType::CAPABILITY, "Capability", "capabilities"},
        {EntityType::CAPABILITY_GROUP, "CapabilityGroup", "capabilitygroups"},
        {EntityType::CAPABILITY_DOMAIN, "CapabilityDomain", "capabilitydomains"},
        {EntityType::CAPABILITY_TAXONOMY, "CapabilityTaxonomy", "capabilitytaxonomies"},
        {EntityType::LLM_INTRINSIC, "LLMIntrinsic", "llmintrinsics"},
        {EntityType::ADAPTER, "Adapter", "adapters"},
        {EntityType::EVALUATION, "Evaluation", "evaluations"},
        {EntityType::AI_EVAL_RESULT, "AiEvalResult", "aievalresults"},
        {EntityType::BENCHMARK, "BenchmarkMetadataCard", "benchmarkmetadatacards"},
        {EntityType::STAKEHOLDER, "Stakeholder", "stakeholders"},
        {EntityType::STAKEHOLDER_GROUP, "StakeholderGroup", "stakeholdergroups"},
        {EntityType::DOCUMENT, "Documentation", "documents"},
        {EntityType::DATASET, "Dataset", "datasets"},
        {EntityType::PRINCIPLE, "Principle", "principles"},
        {EntityType::POLICY, "LLMQuestionPolicy", "llmquestionpolicies"},
        {EntityType::RULE, "Rule", "rules"},
        {EntityType::LICENSE, "License", "licenses"},
        {EntityType::ORGANIZATION, "Organization", "organizations"},
    };
    return table;
}

const std::vector<RelationTypeInfo>& relation_type_table() {
    static const std::vector<RelationTypeInfo> table = {
        {RelationType::HAS_RELATED_RISK, "hasRelatedRisk"},
        {RelationType::HAS_RELATED_ACTION, "hasRelatedAction"},
        {RelationType::IS_DETECTED_BY, "isDetectedBy"},
        {RelationType::DETECTS_RISK_CONCEPT, "detectsRiskConcept"},
        {RelationType::REFERS_TO_RISK, "refersToRisk"},
        {RelationType::REQUIRES_CAPABILITY, "requiresCapability"},
        {RelationType::REQUIRED_BY_TASK, "requiredByTask"},
        {RelationType::IMPLEMENTS_CAPABILITY, "implementsCapability"},
        {RelationType::IMPLEMENTED_BY_INTRINSIC, "implementedByIntrinsic"},
        {RelationType::IMPLEMENTS_CAPABILITY_ADAPTER, "implementsCapability_adapter"},
        {RelationType::IMPLEMENTED_BY_ADAPTER, "implementedByAdapter"},
        {RelationType::EVALUATES_CAPABILITY, "evaluatesCapability"},
        {RelationType::EVALUATED_BY_BENCHMARK, "evaluatedByBenchmark"},
        {RelationType::IS_PART_OF, "isPartOf"},
        {RelationType::HAS_PART, "hasPart"},
        {RelationType::BELONGS_TO_DOMAIN, "belongsToDomain"},
        {RelationType::IS_DEFINED_BY_TAXONOMY, "isDefinedByTaxonomy"},
        {RelationType::EXACT_MATCH, "exactMatch"},
        {RelationType::CLOSE_MATCH, "closeMatch"},
        {RelationType::BROAD_MATCH, "broadMatch"},
        {RelationType::NARROW_MATCH, "narrowMatch"},
        {RelationType::RELATED_MATCH, "relatedMatch"},
        {RelationType::HAS_EVALUATION, "hasEvaluation"},
        {RelationType::EVALUATES_RISK, "evaluatesRisk"},
        {RelationType::HAS_RELATED_LLMINTRINSIC, "hasRelatedLLMIntrinsic"},
        {RelationType::HAS_DOCUMENTATION, "hasDocumentation"},
        {RelationType::HAS_LICENSE, "hasLicense"},
        {RelationType::HAS_AI_TASK, "hasAiTask"},
        {RelationType::HAS_STAKEHOLDER, "hasStakeholder"},
        {RelationType::HAS_RULE, "hasRule"},
    };
    return table;
}

}  // namespace

namespace atlas {

// ==========================================
// Enum conversions
// ==========================================

std::string to_string(EntityType type) {
    for (const auto& info : entity_type_table()) {
        if (info.type == type) return info.name;
    }
    return "unknown";
}

std::string to_string(RelationType type) {
    for (const auto& info : relation_type_table()) {
        if (info.type == type) return info.name;
    }
    return "unknown";
}

std::optional<EntityType> entity_type_from_string(const std::string& name) {
    for (const auto& info : entity_type_table()) {
        if (name == info.name) return info.type;
    }
    return std::nullopt;
}

std::optional<RelationType> relation_type_from_string(const std::string& name) {
    for (const auto& info : relation_type_table()) {
        if (name == info.name) return info.type;
    }
    return std::nullopt;
}

std::string collection_key(EntityType type) {
    for (const auto& info : entity_type_table()) {
        if (info.type == type) return info.collection;
    }
    return "";
}

std::optional<EntityType> entity_type_from_collection_key(const std::string& key) {
    for (const auto& info : entity_type_table()) {
        if (key == info.collection || key == info.name) return info.type;
    }
    return std::nullopt;
}

const std::vector<EntityType>& all_entity_types() {
    static const std::vector<EntityType> types = [] {
        std::vector<EntityType> result;
        for (const auto& info : entity_type_table()) {
            result.push_back(info.type);
        }
        return result;
    }();
    return types;
}

const std::vector<RelationType>& all_relation_types() {
    static const std::vector<RelationType> types = [] {
        std::vector<RelationType> result;
        for (const auto& info : relation_type_table()) {
            result.push_back(info.type);
        }
        return result;
    }();
    return types;
}

// ==========================================
// Entity Implementation
// ==========================================

nlohmann::json Entity::attribute(const std::string& name) const {
    if (name == "id") {
        return id;
    }
    auto it = attributes.find(name);
    return it != attributes.end() ? it->second : nlohmann::json();
}

bool Entity::has_attribute(const std::string& name) const {
    if (name == "id") return true;
    auto it = attributes.find(name);
    return it != attributes.end() && !it->second.is_null();
}

std::string Entity::attribute_string(const std::string& name,
                                     const std::string& default_value) const {
    auto value = attribute(name);
    return value.is_string() ? value.get<std::string>() : default_value;
}

nlohmann::json Entity::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : attributes) {
        j[key] = value;
    }
    j["id"] = id;
    return j;
}

Entity Entity::from_json(EntityType type, const nlohmann::json& j) {
    Entity entity;
    entity.type = type;
    entity.id = j.at("id").get<std::string>();

    for (const auto& [key, value] : j.items()) {
        if (key == "id") continue;
        entity.attributes[key] = value;
    }

    return entity;
}

}  // namespace atlas
