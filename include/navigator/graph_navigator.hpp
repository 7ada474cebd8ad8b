#ifndef ATLAS_GRAPH_NAVIGATOR_HPP
#define ATLAS_GRAPH_NAVIGATOR_HPP

#include "navigator/edge_derivation.hpp"
#include "navigator/traversal_policy.hpp"
#include "navigator/traversal_result.hpp"
#include "ontology/entity_index.hpp"
#include "ontology/ontology.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace atlas {

/**
 * @brief Policy-driven breadth-first traversal over an Ontology snapshot
 *
 * Each query runs INIT -> RUNNING -> DONE within a single call:
 * - INIT: serve a cached result if the policy allows caching, otherwise
 *   resolve the start entity. An unknown start yields an empty result.
 * - RUNNING: FIFO expansion. Every dequeued node, the start node
 *   included, is accepted only if its type and properties pass the
 *   policy. Nodes at max_depth are not expanded. Edges come from the
 *   EdgeDerivationTable and are filtered by allows_relationship().
 * - DONE: statistics are computed and the result is cached.
 *
 * The snapshot is never modified, so traversals may run concurrently;
 * the result cache is owned by this instance and guarded by a mutex.
 */
class GraphNavigator {
public:
    explicit GraphNavigator(const Ontology& ontology);
    GraphNavigator(const Ontology& ontology, EdgeDerivationTable edge_table);

    GraphNavigator(const GraphNavigator&) = delete;
    GraphNavigator& operator=(const GraphNavigator&) = delete;

    // ==========================================
    // Traversal
    // ==========================================

    /**
     * @brief Traverse the graph from a starting node
     * @param start_id Id of the starting entity
     * @param start_type Type of the starting entity
     * @param policy Filtering and depth policy
     * @return Discovered nodes, followed edges and statistics
     */
    TraversalResult traverse_from_node(
        const std::string& start_id,
        EntityType start_type,
        const TraversalPolicy& policy
    );

    /**
     * @brief All resolvable outgoing edges of an entity, unfiltered
     */
    std::vector<DerivedEdge> get_edges(const Entity& entity) const;

    const Entity* get_node(EntityType type, const std::string& id) const {
        return index_.lookup(type, id);
    }

    // ==========================================
    // Cache control
    // ==========================================

    void clear_cache();
    size_t cache_size() const;

    // True if this exact query has a stored result
    bool has_cached(const std::string& start_id, EntityType start_type,
                    const TraversalPolicy& policy) const;

    const Ontology& ontology() const { return ontology_; }
    const EntityIndex& index() const { return index_; }
    const EdgeDerivationTable& edge_table() const { return edge_table_; }

private:
    const Ontology& ontology_;
    EntityIndex index_;
    EdgeDerivationTable edge_table_;

    std::unordered_map<std::string, TraversalResult> cache_;   // canonical descriptor -> result
    mutable std::mutex cache_mutex_;

    TraversalResult run_bfs(
        const Entity& start,
        const TraversalPolicy& policy
    ) const;
};

}  // namespace atlas

#endif  // ATLAS_GRAPH_NAVIGATOR_HPP
