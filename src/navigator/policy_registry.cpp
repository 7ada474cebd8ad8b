#include "navigator/policy_registry.hpp"
#include <sstream>

namespace {

using atlas::EntityType;
using atlas::RelationType;
using atlas::TraversalPolicyOptions;

struct NamedPolicy {
    std::string description;
    TraversalPolicyOptions options;
};

TraversalPolicyOptions make_options(
    int max_depth,
    std::set<RelationType> relations,
    std::set<EntityType> entity_types = {}
) {
    TraversalPolicyOptions options;
    options.max_depth = max_depth;
    options.included_relationships = std::move(relations);
    if (!entity_types.empty()) {
        options.included_entity_types = std::move(entity_types);
    }
    return options;
}

const std::set<RelationType>& skos_relations() {
    static const std::set<RelationType> relations = {
        RelationType::EXACT_MATCH,
        RelationType::CLOSE_MATCH,
        RelationType::BROAD_MATCH,
        RelationType::NARROW_MATCH,
        RelationType::RELATED_MATCH,
    };
    return relations;
}

const std::map<std::string, NamedPolicy>& named_policies() {
    static const std::map<std::string, NamedPolicy> policies = [] {
        std::map<std::string, NamedPolicy> p;

        // Capability patterns
        p["capabilities_for_task"] = {
            "Get all capabilities required by a specific AI task",
            make_options(1, {RelationType::REQUIRES_CAPABILITY}, {EntityType::CAPABILITY})
        };
        p["intrinsics_for_capability"] = {
            "Get all intrinsics/adapters that implement a capability",
            make_options(1,
                {RelationType::IMPLEMENTED_BY_INTRINSIC, RelationType::IMPLEMENTED_BY_ADAPTER},
                {EntityType::LLM_INTRINSIC, EntityType::ADAPTER})
        };
        p["tasks_for_capability"] = {
            "Get all tasks that require a capability",
            make_options(1, {RelationType::REQUIRED_BY_TASK}, {EntityType::AI_TASK})
        };
        p["capability_hierarchy"] = {
            "Get the full capability hierarchy (domain -> groups -> capabilities)",
            make_options(2,
                {RelationType::HAS_PART, RelationType::IS_PART_OF, RelationType::BELONGS_TO_DOMAIN},
                {EntityType::CAPABILITY_DOMAIN, EntityType::CAPABILITY_GROUP, EntityType::CAPABILITY})
        };
        p["end_to_end_task_to_intrinsics"] = {
            "Complete path: task -> capabilities -> intrinsics",
            make_options(2,
                {RelationType::REQUIRES_CAPABILITY, RelationType::IMPLEMENTED_BY_INTRINSIC,
                 RelationType::IMPLEMENTED_BY_ADAPTER},
                {EntityType::CAPABILITY, EntityType::LLM_INTRINSIC, EntityType::ADAPTER})
        };

        // Risk patterns
        p["controls_for_risk"] = {
            "Get all controls that detect a specific risk",
            make_options(1, {RelationType::IS_DETECTED_BY}, {EntityType::RISK_CONTROL})
        };
        p["actions_for_risk"] = {
            "Get all actions for a specific risk",
            make_options(1, {RelationType::HAS_RELATED_ACTION}, {EntityType::ACTION})
        };
        p["related_risks"] = {
            "Get all risks related via SKOS relationships",
            make_options(1, skos_relations(), {EntityType::RISK})
        };

        std::set<RelationType> neighborhood = skos_relations();
        neighborhood.insert(RelationType::IS_DETECTED_BY);
        neighborhood.insert(RelationType::HAS_RELATED_ACTION);
        p["risk_neighborhood"] = {
            "Comprehensive neighborhood of a risk (controls, actions, related risks)",
            make_options(2, neighborhood,
                {EntityType::RISK_CONTROL, EntityType::ACTION, EntityType::RISK})
        };

        // Evaluation patterns
        p["intrinsics_for_task"] = {
            "Get intrinsics related to a task",
            make_options(1, {RelationType::HAS_RELATED_LLMINTRINSIC}, {EntityType::LLM_INTRINSIC})
        };

        // Documentation patterns
        p["documentation_for_entity"] = {
            "Get all documentation for an entity",
            make_options(1, {RelationType::HAS_DOCUMENTATION}, {EntityType::DOCUMENT})
        };

        // Cross-taxonomy patterns
        p["skos_matches"] = {
            "Get all SKOS-matched entities (works for risks, capabilities, etc.)",
            make_options(1, skos_relations())
        };

        return p;
    }();
    return policies;
}

std::vector<std::string> policy_names() {
    std::vector<std::string> names;
    for (const auto& [name, policy] : named_policies()) {
        names.push_back(name);
    }
    return names;
}

}  // namespace

namespace atlas {

PolicyNotFoundError::PolicyNotFoundError(const std::string& requested,
                                         std::vector<std::string> available)
    : std::out_of_range(build_message(requested, available)),
      requested_(requested),
      available_(std::move(available)) {}

std::string PolicyNotFoundError::build_message(const std::string& requested,
                                               const std::vector<std::string>& available) {
    std::ostringstream ss;
    ss << "Unknown pattern: '" << requested << "'. Available patterns: ";
    for (size_t i = 0; i < available.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << available[i];
    }
    return ss.str();
}

TraversalPolicy get_named_policy(const std::string& name) {
    const auto& policies = named_policies();
    auto it = policies.find(name);
    if (it == policies.end()) {
        throw PolicyNotFoundError(name, policy_names());
    }
    return TraversalPolicy(it->second.options);
}

bool has_named_policy(const std::string& name) {
    return named_policies().count(name) > 0;
}

std::map<std::string, std::string> list_named_policies() {
    std::map<std::string, std::string> result;
    for (const auto& [name, policy] : named_policies()) {
        result[name] = policy.description;
    }
    return result;
}

}  // namespace atlas
