#include "navigator/graph_navigator.hpp"
#include <deque>
#include <set>

namespace atlas {

GraphNavigator::GraphNavigator(const Ontology& ontology)
    : GraphNavigator(ontology, EdgeDerivationTable::default_table()) {}

GraphNavigator::GraphNavigator(const Ontology& ontology, EdgeDerivationTable edge_table)
    : ontology_(ontology),
      index_(ontology),
      edge_table_(std::move(edge_table)) {}

// ==========================================
// Traversal
// ==========================================

TraversalResult GraphNavigator::traverse_from_node(
    const std::string& start_id,
    EntityType start_type,
    const TraversalPolicy& policy
) {
    // Keyed by the full canonical descriptor so distinct queries never share an entry
    std::string descriptor;
    if (policy.cache_enabled()) {
        descriptor = policy.cache_descriptor(start_id, start_type).dump();

        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(descriptor);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    const Entity* start = index_.lookup(start_type, start_id);
    if (!start) {
        return TraversalResult();
    }

    TraversalResult result = run_bfs(*start, policy);

    if (policy.cache_enabled()) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_[descriptor] = result;
    }

    return result;
}

TraversalResult GraphNavigator::run_bfs(
    const Entity& start,
    const TraversalPolicy& policy
) const {
    std::set<NodeKey> visited;
    std::vector<TraversalNode> nodes;
    std::map<NodeKey, std::vector<TraversalEdge>> relationships;
    std::map<int, std::vector<std::string>> depth_map;
    std::deque<TraversalNode> queue;

    TraversalNode start_node;
    start_node.entity_id = start.id;
    start_node.entity_type = start.type;
    start_node.entity = &start;
    start_node.depth = 0;

    queue.push_back(start_node);
    visited.insert(start_node.key());

    const auto& max_results = policy.max_results();
    size_t edges_recorded = 0;

    while (!queue.empty() && (!max_results || nodes.size() < *max_results)) {
        TraversalNode current = std::move(queue.front());
        queue.pop_front();

        // Acceptance applies to every node, the start node included
        if (policy.allows_entity_type(current.entity_type) &&
            policy.matches_node_filters(*current.entity)) {
            nodes.push_back(current);
            depth_map[current.depth].push_back(current.entity_id);
        }

        if (current.depth >= policy.max_depth()) {
            continue;
        }

        for (const auto& edge : edge_table_.derive_edges(*current.entity, index_)) {
            if (!policy.allows_relationship(edge.relation)) {
                continue;
            }

            NodeKey target_key{edge.target_type, edge.target_id};
            if (policy.deduplicate_results() && visited.count(target_key) > 0) {
                continue;
            }
            visited.insert(target_key);

            relationships[current.key()].push_back({edge.relation, edge.target_id, edge.target_type});
            ++edges_recorded;

            TraversalNode next;
            next.entity_id = edge.target_id;
            next.entity_type = edge.target_type;
            next.entity = edge.target;
            next.depth = current.depth + 1;
            next.path = current.path;
            next.path.push_back(edge.relation);
            next.parent_id = current.entity_id;
            next.parent_type = current.entity_type;

            queue.push_back(std::move(next));
        }
    }

    TraversalStatistics statistics;
    statistics.nodes_visited = visited.size();
    statistics.nodes_returned = nodes.size();
    statistics.max_depth_reached = depth_map.empty() ? 0 : depth_map.rbegin()->first;
    statistics.relationships_traversed = edges_recorded;

    return TraversalResult(std::move(nodes), std::move(relationships),
                           std::move(depth_map), statistics);
}

std::vector<DerivedEdge> GraphNavigator::get_edges(const Entity& entity) const {
    return edge_table_.derive_edges(entity, index_);
}

// ==========================================
// Cache control
// ==========================================

void GraphNavigator::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

size_t GraphNavigator::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

bool GraphNavigator::has_cached(
    const std::string& start_id,
    EntityType start_type,
    const TraversalPolicy& policy
) const {
    std::string descriptor = policy.cache_descriptor(start_id, start_type).dump();

    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.count(descriptor) > 0;
}

}  // namespace atlas
