#pragma once

#include "ontology/entity.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace atlas {

// Traversal policy settings
struct TraversalPolicyOptions {
    // Traversal depth
    int max_depth = 2;                   // Start node is depth 0

    // Edge filtering (exclusion wins over inclusion)
    std::optional<std::set<RelationType>> included_relationships;
    std::optional<std::set<RelationType>> excluded_relationships;

    // Entity type filtering
    std::optional<std::set<EntityType>> included_entity_types;
    std::optional<std::set<EntityType>> excluded_entity_types;

    // Attribute filters, AND-combined. A null value matches a missing attribute.
    std::map<std::string, nlohmann::json> node_property_filters;

    // Traversal behavior
    bool follow_bidirectional = true;    // Informational; edge direction comes from the rule table
    bool deduplicate_results = true;
    std::optional<size_t> max_results;
    bool cache_enabled = true;
};

/**
 * @brief Immutable filtering and depth configuration for one BFS query
 *
 * Construction validates the options and normalizes empty inclusion or
 * exclusion sets to "unset". Once built, a policy never changes.
 */
class TraversalPolicy {
public:
    TraversalPolicy();

    /**
     * @throws std::invalid_argument if max_depth is negative
     */
    explicit TraversalPolicy(const TraversalPolicyOptions& options);

    int max_depth() const { return options_.max_depth; }
    const std::optional<std::set<RelationType>>& included_relationships() const {
        return options_.included_relationships;
    }
    const std::optional<std::set<RelationType>>& excluded_relationships() const {
        return options_.excluded_relationships;
    }
    const std::optional<std::set<EntityType>>& included_entity_types() const {
        return options_.included_entity_types;
    }
    const std::optional<std::set<EntityType>>& excluded_entity_types() const {
        return options_.excluded_entity_types;
    }
    const std::map<std::string, nlohmann::json>& node_property_filters() const {
        return options_.node_property_filters;
    }
    bool follow_bidirectional() const { return options_.follow_bidirectional; }
    bool deduplicate_results() const { return options_.deduplicate_results; }
    const std::optional<size_t>& max_results() const { return options_.max_results; }
    bool cache_enabled() const { return options_.cache_enabled; }

    const TraversalPolicyOptions& options() const { return options_; }

    // ==========================================
    // Decision predicates
    // ==========================================

    bool allows_relationship(RelationType relation) const;
    bool allows_entity_type(EntityType type) const;

    /**
     * @brief True if every property filter matches the entity exactly
     */
    bool matches_node_filters(const Entity& entity) const;

    // ==========================================
    // Cache key
    // ==========================================

    /**
     * @brief Canonical description of everything that shapes a result
     *
     * Covers the start node and every option except cache_enabled. Sets
     * are emitted sorted by name.
     */
    nlohmann::json cache_descriptor(const std::string& start_id, EntityType start_type) const;

    /**
     * @brief 64-bit FNV-1a digest of the cache descriptor, as 16 hex digits
     *
     * For display and logging. GraphNavigator stores results under the
     * dumped descriptor itself.
     */
    std::string cache_key(const std::string& start_id, EntityType start_type) const;

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * Every field is checked before the policy is built: integers must be
     * integral and in range, flags must be booleans, lists must hold names.
     *
     * @throws std::invalid_argument on unknown type names or invalid values
     */
    static TraversalPolicy from_json(const nlohmann::json& j);

private:
    TraversalPolicyOptions options_;
};

}  // namespace atlas
