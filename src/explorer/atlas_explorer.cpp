#include "explorer/atlas_explorer.hpp"

namespace {

const char* const TAXONOMY_ATTRIBUTE = "isDefinedByTaxonomy";

nlohmann::json entity_ids(const std::vector<const atlas::Entity*>& entities) {
    nlohmann::json ids = nlohmann::json::array();
    for (const auto* entity : entities) {
        ids.push_back(entity->id);
    }
    return ids;
}

}  // namespace

namespace atlas {

nlohmann::json TaskTrace::to_json() const {
    nlohmann::json j;
    j["task"] = task ? nlohmann::json(task->id) : nlohmann::json();
    j["capabilities"] = entity_ids(capabilities);

    nlohmann::json by_capability = nlohmann::json::object();
    for (const auto& [capability_id, intrinsics] : intrinsics_by_capability) {
        by_capability[capability_id] = entity_ids(intrinsics);
    }
    j["intrinsics_by_capability"] = by_capability;
    j["all_intrinsics"] = entity_ids(all_intrinsics);

    return j;
}

AtlasExplorer::AtlasExplorer(const Ontology& ontology)
    : ontology_(ontology),
      navigator_(ontology) {}

// ==========================================
// Generic navigation
// ==========================================

TraversalResult AtlasExplorer::navigate(const std::string& start_id, EntityType start_type,
                                        const std::string& pattern) {
    return navigator_.traverse_from_node(start_id, start_type, get_named_policy(pattern));
}

TraversalResult AtlasExplorer::navigate(const std::string& start_id, EntityType start_type,
                                        const TraversalPolicy& policy) {
    return navigator_.traverse_from_node(start_id, start_type, policy);
}

std::vector<const Entity*> AtlasExplorer::get_related(
    const std::string& entity_id,
    EntityType entity_type,
    RelationType relation,
    std::optional<EntityType> target_type,
    int max_depth,
    const std::string& taxonomy
) {
    TraversalPolicyOptions options;
    options.max_depth = max_depth;
    options.included_relationships = std::set<RelationType>{relation};
    if (target_type) {
        options.included_entity_types = std::set<EntityType>{*target_type};
    }
    if (!taxonomy.empty()) {
        options.node_property_filters[TAXONOMY_ATTRIBUTE] = taxonomy;
    }

    auto result = navigator_.traverse_from_node(entity_id, entity_type, TraversalPolicy(options));

    std::vector<const Entity*> related;
    for (const auto& node : result.nodes()) {
        if (node.depth > 0) {
            related.push_back(node.entity);
        }
    }
    return related;
}

// ==========================================
// Lookup
// ==========================================

const Entity* AtlasExplorer::find_entity(EntityType type, const std::string& id) const {
    return navigator_.get_node(type, id);
}

const Entity* AtlasExplorer::find_by_attribute(EntityType type, const std::string& attribute,
                                               const std::string& value) const {
    for (const auto& entity : ontology_.entities(type)) {
        if (entity.attribute(attribute) == value) {
            return &entity;
        }
    }
    return nullptr;
}

std::vector<const Entity*> AtlasExplorer::all_entities(EntityType type,
                                                       const std::string& taxonomy) const {
    std::vector<const Entity*> result;
    for (const auto& entity : ontology_.entities(type)) {
        if (in_taxonomy(entity, taxonomy)) {
            result.push_back(&entity);
        }
    }
    return result;
}

bool AtlasExplorer::in_taxonomy(const Entity& entity, const std::string& taxonomy) {
    return taxonomy.empty() || entity.attribute(TAXONOMY_ATTRIBUTE) == taxonomy;
}

std::vector<const Entity*> AtlasExplorer::collect(
    const std::string& start_id,
    EntityType start_type,
    const std::string& pattern,
    const std::set<EntityType>& types,
    const std::string& taxonomy,
    bool skip_start
) {
    std::vector<const Entity*> entities;
    if (!find_entity(start_type, start_id)) {
        return entities;
    }

    auto result = navigate(start_id, start_type, pattern);
    for (const auto& node : result.nodes()) {
        if (skip_start && node.depth == 0) continue;
        if (types.count(node.entity_type) == 0) continue;
        if (!in_taxonomy(*node.entity, taxonomy)) continue;
        entities.push_back(node.entity);
    }
    return entities;
}

// ==========================================
// Capabilities
// ==========================================

std::vector<const Entity*> AtlasExplorer::get_capabilities_for_task(const std::string& task_id,
                                                                    const std::string& taxonomy) {
    return collect(task_id, EntityType::AI_TASK, "capabilities_for_task",
                   {EntityType::CAPABILITY}, taxonomy);
}

std::vector<const Entity*> AtlasExplorer::get_intrinsics_for_capability(
    const std::string& capability_id,
    bool include_adapters,
    const std::string& taxonomy
) {
    std::set<EntityType> types = {EntityType::LLM_INTRINSIC};
    if (include_adapters) {
        types.insert(EntityType::ADAPTER);
    }
    return collect(capability_id, EntityType::CAPABILITY, "intrinsics_for_capability",
                   types, taxonomy);
}

std::vector<const Entity*> AtlasExplorer::get_tasks_for_capability(const std::string& capability_id,
                                                                   const std::string& taxonomy) {
    return collect(capability_id, EntityType::CAPABILITY, "tasks_for_capability",
                   {EntityType::AI_TASK}, taxonomy);
}

std::vector<const Entity*> AtlasExplorer::get_intrinsics_for_task(const std::string& task_id,
                                                                  const std::string& taxonomy) {
    return collect(task_id, EntityType::AI_TASK, "intrinsics_for_task",
                   {EntityType::LLM_INTRINSIC}, taxonomy);
}

std::optional<TaskTrace> AtlasExplorer::trace_task_to_intrinsics(const std::string& task_id) {
    const Entity* task = find_entity(EntityType::AI_TASK, task_id);
    if (!task) {
        return std::nullopt;
    }

    auto result = navigate(task_id, EntityType::AI_TASK, "end_to_end_task_to_intrinsics");

    TaskTrace trace;
    trace.task = task;

    for (const auto& node : result.nodes()) {
        if (node.entity_type == EntityType::CAPABILITY && node.depth == 1) {
            trace.capabilities.push_back(node.entity);
            trace.intrinsics_by_capability[node.entity_id];
        }
    }

    for (const auto& node : result.nodes()) {
        bool implementation = node.entity_type == EntityType::LLM_INTRINSIC ||
                              node.entity_type == EntityType::ADAPTER;
        if (!implementation || node.depth != 2 || !node.parent_id) {
            continue;
        }

        auto it = trace.intrinsics_by_capability.find(*node.parent_id);
        if (it != trace.intrinsics_by_capability.end()) {
            it->second.push_back(node.entity);
        }
        trace.all_intrinsics.push_back(node.entity);
    }

    return trace;
}

// ==========================================
// Risks
// ==========================================

std::vector<const Entity*> AtlasExplorer::get_related_risks(const std::string& risk_id,
                                                            const std::string& taxonomy) {
    return collect(risk_id, EntityType::RISK, "related_risks",
                   {EntityType::RISK}, taxonomy, true);
}

std::vector<const Entity*> AtlasExplorer::get_controls_for_risk(const std::string& risk_id,
                                                                const std::string& taxonomy) {
    return collect(risk_id, EntityType::RISK, "controls_for_risk",
                   {EntityType::RISK_CONTROL}, taxonomy);
}

std::vector<const Entity*> AtlasExplorer::get_actions_for_risk(const std::string& risk_id,
                                                               const std::string& taxonomy) {
    return collect(risk_id, EntityType::RISK, "actions_for_risk",
                   {EntityType::ACTION}, taxonomy);
}

}  // namespace atlas
