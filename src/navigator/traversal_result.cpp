#include "navigator/traversal_result.hpp"

namespace atlas {

// ==========================================
// TraversalNode / TraversalEdge
// ==========================================

nlohmann::json TraversalNode::to_json() const {
    nlohmann::json j;
    j["entity_id"] = entity_id;
    j["entity_type"] = to_string(entity_type);
    j["depth"] = depth;

    nlohmann::json path_json = nlohmann::json::array();
    for (const auto& relation : path) {
        path_json.push_back(to_string(relation));
    }
    j["path"] = path_json;

    if (parent_id) {
        j["parent_id"] = *parent_id;
    } else {
        j["parent_id"] = nullptr;
    }
    if (parent_type) {
        j["parent_type"] = to_string(*parent_type);
    } else {
        j["parent_type"] = nullptr;
    }

    return j;
}

nlohmann::json TraversalEdge::to_json() const {
    return {
        {"relation", to_string(relation)},
        {"target_id", target_id},
        {"target_type", to_string(target_type)}
    };
}

nlohmann::json TraversalStatistics::to_json() const {
    nlohmann::json j;
    j["nodes_visited"] = nodes_visited;
    j["nodes_returned"] = nodes_returned;
    j["max_depth_reached"] = max_depth_reached;
    j["relationships_traversed"] = relationships_traversed;
    return j;
}

// ==========================================
// TraversalResult
// ==========================================

TraversalResult::TraversalResult(std::vector<TraversalNode> nodes,
                                 std::map<NodeKey, std::vector<TraversalEdge>> relationships,
                                 std::map<int, std::vector<std::string>> depth_map,
                                 TraversalStatistics statistics)
    : nodes_(std::move(nodes)),
      relationships_(std::move(relationships)),
      depth_map_(std::move(depth_map)),
      statistics_(statistics) {}

std::vector<TraversalNode> TraversalResult::get_nodes_at_depth(int depth) const {
    std::vector<TraversalNode> result;
    for (const auto& node : nodes_) {
        if (node.depth == depth) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<TraversalNode> TraversalResult::get_nodes_by_type(EntityType type) const {
    std::vector<TraversalNode> result;
    for (const auto& node : nodes_) {
        if (node.entity_type == type) {
            result.push_back(node);
        }
    }
    return result;
}

const TraversalNode* TraversalResult::get_node(const std::string& entity_id) const {
    for (const auto& node : nodes_) {
        if (node.entity_id == entity_id) {
            return &node;
        }
    }
    return nullptr;
}

const TraversalNode* TraversalResult::get_node(EntityType type, const std::string& entity_id) const {
    for (const auto& node : nodes_) {
        if (node.entity_type == type && node.entity_id == entity_id) {
            return &node;
        }
    }
    return nullptr;
}

const std::vector<TraversalEdge>& TraversalResult::edges_from(EntityType type,
                                                              const std::string& entity_id) const {
    static const std::vector<TraversalEdge> no_edges;
    auto it = relationships_.find(NodeKey{type, entity_id});
    return it != relationships_.end() ? it->second : no_edges;
}

nlohmann::json TraversalResult::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    // Keyed by (type, id), so emitted as a list of sources
    nlohmann::json rel_json = nlohmann::json::array();
    for (const auto& [source, edges] : relationships_) {
        nlohmann::json edges_json = nlohmann::json::array();
        for (const auto& edge : edges) {
            edges_json.push_back(edge.to_json());
        }
        rel_json.push_back({
            {"source_id", source.id},
            {"source_type", to_string(source.type)},
            {"edges", edges_json}
        });
    }
    j["relationships"] = rel_json;

    nlohmann::json depth_json = nlohmann::json::object();
    for (const auto& [depth, ids] : depth_map_) {
        depth_json[std::to_string(depth)] = ids;
    }
    j["depth_map"] = depth_json;

    j["statistics"] = statistics_.to_json();

    return j;
}

}  // namespace atlas
