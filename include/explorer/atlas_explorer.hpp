#pragma once

#include "navigator/graph_navigator.hpp"
#include "navigator/policy_registry.hpp"
#include "ontology/ontology.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Task -> capabilities -> intrinsics trace
 */
struct TaskTrace {
    const Entity* task = nullptr;
    std::vector<const Entity*> capabilities;
    std::map<std::string, std::vector<const Entity*>> intrinsics_by_capability;
    std::vector<const Entity*> all_intrinsics;

    nlohmann::json to_json() const;
};

/**
 * @brief Domain-named queries built on GraphNavigator and the named policies
 *
 * Every result is a list of entity pointers into the Ontology, which
 * must outlive the explorer. An unknown start entity yields an empty
 * list. An empty taxonomy argument means "no taxonomy filter".
 */
class AtlasExplorer {
public:
    explicit AtlasExplorer(const Ontology& ontology);

    // ==========================================
    // Generic navigation
    // ==========================================

    /**
     * @brief Traverse using a named policy
     * @throws PolicyNotFoundError if the pattern is unknown
     */
    TraversalResult navigate(const std::string& start_id, EntityType start_type,
                             const std::string& pattern);

    TraversalResult navigate(const std::string& start_id, EntityType start_type,
                             const TraversalPolicy& policy);

    /**
     * @brief Entities reached from a start entity through one relationship type
     *
     * The start node itself is never part of the returned list.
     */
    std::vector<const Entity*> get_related(
        const std::string& entity_id,
        EntityType entity_type,
        RelationType relation,
        std::optional<EntityType> target_type = std::nullopt,
        int max_depth = 1,
        const std::string& taxonomy = ""
    );

    // ==========================================
    // Lookup
    // ==========================================

    const Entity* find_entity(EntityType type, const std::string& id) const;

    // First entity whose text attribute equals the value ("tag", "name", ...)
    const Entity* find_by_attribute(EntityType type, const std::string& attribute,
                                    const std::string& value) const;

    std::vector<const Entity*> all_entities(EntityType type, const std::string& taxonomy = "") const;

    // ==========================================
    // Capabilities
    // ==========================================

    std::vector<const Entity*> get_capabilities_for_task(const std::string& task_id,
                                                         const std::string& taxonomy = "");

    std::vector<const Entity*> get_intrinsics_for_capability(const std::string& capability_id,
                                                             bool include_adapters = true,
                                                             const std::string& taxonomy = "");

    std::vector<const Entity*> get_tasks_for_capability(const std::string& capability_id,
                                                        const std::string& taxonomy = "");

    std::vector<const Entity*> get_intrinsics_for_task(const std::string& task_id,
                                                       const std::string& taxonomy = "");

    /**
     * @brief Trace from task through capabilities to intrinsics in one traversal
     * @return nullopt if the task does not exist
     */
    std::optional<TaskTrace> trace_task_to_intrinsics(const std::string& task_id);

    // ==========================================
    // Risks
    // ==========================================

    std::vector<const Entity*> get_related_risks(const std::string& risk_id,
                                                 const std::string& taxonomy = "");
    std::vector<const Entity*> get_controls_for_risk(const std::string& risk_id,
                                                     const std::string& taxonomy = "");
    std::vector<const Entity*> get_actions_for_risk(const std::string& risk_id,
                                                    const std::string& taxonomy = "");

    void clear_cache() { navigator_.clear_cache(); }

    GraphNavigator& navigator() { return navigator_; }
    const Ontology& ontology() const { return ontology_; }

private:
    const Ontology& ontology_;
    GraphNavigator navigator_;

    /**
     * @brief Run a named policy and keep nodes of the given types
     */
    std::vector<const Entity*> collect(
        const std::string& start_id,
        EntityType start_type,
        const std::string& pattern,
        const std::set<EntityType>& types,
        const std::string& taxonomy,
        bool skip_start = false
    );

    static bool in_taxonomy(const Entity& entity, const std::string& taxonomy);
};

}  // namespace atlas
