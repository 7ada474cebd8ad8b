#pragma once

#include "ontology/entity.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace atlas {

/**
 * @brief Identity of a node within one traversal
 *
 * Ids are only unique within a type, so node identity is the pair.
 */
struct NodeKey {
    EntityType type = EntityType::CAPABILITY;
    std::string id;

    bool operator<(const NodeKey& other) const {
        return std::tie(type, id) < std::tie(other.type, other.id);
    }
    bool operator==(const NodeKey& other) const {
        return type == other.type && id == other.id;
    }
};

/**
 * @brief A node discovered during traversal
 */
struct TraversalNode {
    std::string entity_id;
    EntityType entity_type = EntityType::CAPABILITY;
    const Entity* entity = nullptr;          // Not owned, never copied
    int depth = 0;                           // Start node is depth 0
    std::vector<RelationType> path;          // Relationships followed from the start
    std::optional<std::string> parent_id;    // Empty for the start node
    std::optional<EntityType> parent_type;

    NodeKey key() const { return {entity_type, entity_id}; }

    nlohmann::json to_json() const;
};

/**
 * @brief An edge actually followed from a node
 */
struct TraversalEdge {
    RelationType relation = RelationType::REQUIRES_CAPABILITY;
    std::string target_id;
    EntityType target_type = EntityType::CAPABILITY;

    nlohmann::json to_json() const;
};

struct TraversalStatistics {
    size_t nodes_visited = 0;            // Distinct (type, id) pairs seen
    size_t nodes_returned = 0;           // Nodes that passed acceptance
    int max_depth_reached = 0;           // Over accepted nodes
    size_t relationships_traversed = 0;  // Edges recorded

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable output of one traversal
 *
 * Nodes are in BFS discovery order (non-decreasing depth). Only the
 * navigator builds populated results.
 */
class TraversalResult {
public:
    TraversalResult() = default;

    TraversalResult(std::vector<TraversalNode> nodes,
                    std::map<NodeKey, std::vector<TraversalEdge>> relationships,
                    std::map<int, std::vector<std::string>> depth_map,
                    TraversalStatistics statistics);

    const std::vector<TraversalNode>& nodes() const { return nodes_; }
    const std::map<NodeKey, std::vector<TraversalEdge>>& relationships() const { return relationships_; }
    const std::map<int, std::vector<std::string>>& depth_map() const { return depth_map_; }
    const TraversalStatistics& statistics() const { return statistics_; }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    std::vector<TraversalNode> get_nodes_at_depth(int depth) const;
    std::vector<TraversalNode> get_nodes_by_type(EntityType type) const;

    /**
     * @brief First accepted node with this id (any type)
     */
    const TraversalNode* get_node(const std::string& entity_id) const;
    const TraversalNode* get_node(EntityType type, const std::string& entity_id) const;

    /**
     * @brief Edges followed from a node (empty if none)
     */
    const std::vector<TraversalEdge>& edges_from(EntityType type, const std::string& entity_id) const;

    nlohmann::json to_json() const;

private:
    std::vector<TraversalNode> nodes_;
    std::map<NodeKey, std::vector<TraversalEdge>> relationships_;
    std::map<int, std::vector<std::string>> depth_map_;
    TraversalStatistics statistics_;
};

}  // namespace atlas
