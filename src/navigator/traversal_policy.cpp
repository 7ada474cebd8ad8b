#include "navigator/traversal_policy.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

template <typename T>
void normalize(std::optional<std::set<T>>& values) {
    if (values && values->empty()) {
        values.reset();
    }
}

template <typename T>
nlohmann::json sorted_names(const std::optional<std::set<T>>& values) {
    if (!values) {
        return nullptr;
    }
    std::vector<std::string> names;
    for (const auto& value : *values) {
        names.push_back(atlas::to_string(value));
    }
    std::sort(names.begin(), names.end());
    return names;
}

const nlohmann::json* list_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return nullptr;
    }
    if (!j[key].is_array()) {
        throw std::invalid_argument("'" + std::string(key) + "' must be a list of names");
    }
    return &j[key];
}

std::string name_field(const nlohmann::json& item, const char* key) {
    if (!item.is_string()) {
        throw std::invalid_argument("'" + std::string(key) + "' entries must be strings, got " + item.dump());
    }
    return item.get<std::string>();
}

std::optional<std::set<atlas::RelationType>> parse_relations(const nlohmann::json& j, const char* key) {
    const nlohmann::json* items = list_field(j, key);
    if (!items) {
        return std::nullopt;
    }
    std::set<atlas::RelationType> result;
    for (const auto& item : *items) {
        auto name = name_field(item, key);
        auto relation = atlas::relation_type_from_string(name);
        if (!relation) {
            throw std::invalid_argument("Unknown relationship type in '" + std::string(key) + "': " + name);
        }
        result.insert(*relation);
    }
    return result;
}

std::optional<std::set<atlas::EntityType>> parse_entity_types(const nlohmann::json& j, const char* key) {
    const nlohmann::json* items = list_field(j, key);
    if (!items) {
        return std::nullopt;
    }
    std::set<atlas::EntityType> result;
    for (const auto& item : *items) {
        auto name = name_field(item, key);
        auto type = atlas::entity_type_from_string(name);
        if (!type) {
            throw std::invalid_argument("Unknown entity type in '" + std::string(key) + "': " + name);
        }
        result.insert(*type);
    }
    return result;
}

// Integral JSON number as long long; floats, strings and null are rejected
long long integer_field(const nlohmann::json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument("'" + std::string(key) + "' must be an integer, got " + value.dump());
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<long long>::max())) {
        throw std::invalid_argument("'" + std::string(key) + "' is out of range: " + value.dump());
    }
    return value.get<long long>();
}

bool bool_field(const nlohmann::json& j, const char* key, bool default_value) {
    if (!j.contains(key)) {
        return default_value;
    }
    if (!j[key].is_boolean()) {
        throw std::invalid_argument("'" + std::string(key) + "' must be true or false, got " + j[key].dump());
    }
    return j[key].get<bool>();
}

uint64_t fnv1a_64(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

}  // namespace

namespace atlas {

TraversalPolicy::TraversalPolicy() = default;

TraversalPolicy::TraversalPolicy(const TraversalPolicyOptions& options)
    : options_(options) {
    if (options_.max_depth < 0) {
        throw std::invalid_argument("max_depth must be non-negative, got " +
                                    std::to_string(options_.max_depth));
    }

    normalize(options_.included_relationships);
    normalize(options_.excluded_relationships);
    normalize(options_.included_entity_types);
    normalize(options_.excluded_entity_types);
}

// ==========================================
// Decision predicates
// ==========================================

bool TraversalPolicy::allows_relationship(RelationType relation) const {
    const auto& excluded = options_.excluded_relationships;
    if (excluded && excluded->count(relation) > 0) {
        return false;
    }
    const auto& included = options_.included_relationships;
    if (included && included->count(relation) == 0) {
        return false;
    }
    return true;
}

bool TraversalPolicy::allows_entity_type(EntityType type) const {
    const auto& excluded = options_.excluded_entity_types;
    if (excluded && excluded->count(type) > 0) {
        return false;
    }
    const auto& included = options_.included_entity_types;
    if (included && included->count(type) == 0) {
        return false;
    }
    return true;
}

bool TraversalPolicy::matches_node_filters(const Entity& entity) const {
    for (const auto& [property, expected] : options_.node_property_filters) {
        if (entity.attribute(property) != expected) {
            return false;
        }
    }
    return true;
}

// ==========================================
// Cache key
// ==========================================

nlohmann::json TraversalPolicy::cache_descriptor(const std::string& start_id,
                                                 EntityType start_type) const {
    nlohmann::json j;
    j["start_id"] = start_id;
    j["start_type"] = to_string(start_type);
    j["max_depth"] = options_.max_depth;
    j["included_relationships"] = sorted_names(options_.included_relationships);
    j["excluded_relationships"] = sorted_names(options_.excluded_relationships);
    j["included_entity_types"] = sorted_names(options_.included_entity_types);
    j["excluded_entity_types"] = sorted_names(options_.excluded_entity_types);

    if (options_.node_property_filters.empty()) {
        j["node_property_filters"] = nullptr;
    } else {
        j["node_property_filters"] = options_.node_property_filters;
    }

    j["follow_bidirectional"] = options_.follow_bidirectional;
    j["deduplicate_results"] = options_.deduplicate_results;
    if (options_.max_results) {
        j["max_results"] = *options_.max_results;
    } else {
        j["max_results"] = nullptr;
    }

    return j;
}

std::string TraversalPolicy::cache_key(const std::string& start_id, EntityType start_type) const {
    // nlohmann::json objects keep keys sorted, so dump() is canonical
    std::string canonical = cache_descriptor(start_id, start_type).dump();

    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << fnv1a_64(canonical);
    return ss.str();
}

// ==========================================
// Import/Export
// ==========================================

nlohmann::json TraversalPolicy::to_json() const {
    nlohmann::json j;
    j["max_depth"] = options_.max_depth;
    j["included_relationships"] = sorted_names(options_.included_relationships);
    j["excluded_relationships"] = sorted_names(options_.excluded_relationships);
    j["included_entity_types"] = sorted_names(options_.included_entity_types);
    j["excluded_entity_types"] = sorted_names(options_.excluded_entity_types);
    j["node_property_filters"] = options_.node_property_filters;
    j["follow_bidirectional"] = options_.follow_bidirectional;
    j["deduplicate_results"] = options_.deduplicate_results;
    if (options_.max_results) {
        j["max_results"] = *options_.max_results;
    } else {
        j["max_results"] = nullptr;
    }
    j["cache_enabled"] = options_.cache_enabled;
    return j;
}

TraversalPolicy TraversalPolicy::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Traversal policy must be a JSON object");
    }

    TraversalPolicyOptions options;

    if (j.contains("max_depth")) {
        long long max_depth = integer_field(j["max_depth"], "max_depth");
        if (max_depth < 0 || max_depth > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("max_depth must be between 0 and " +
                                        std::to_string(std::numeric_limits<int>::max()) +
                                        ", got " + std::to_string(max_depth));
        }
        options.max_depth = static_cast<int>(max_depth);
    }

    options.included_relationships = parse_relations(j, "included_relationships");
    options.excluded_relationships = parse_relations(j, "excluded_relationships");
    options.included_entity_types = parse_entity_types(j, "included_entity_types");
    options.excluded_entity_types = parse_entity_types(j, "excluded_entity_types");

    if (j.contains("node_property_filters") && !j["node_property_filters"].is_null()) {
        if (!j["node_property_filters"].is_object()) {
            throw std::invalid_argument("'node_property_filters' must be an object");
        }
        for (const auto& [key, value] : j["node_property_filters"].items()) {
            options.node_property_filters[key] = value;
        }
    }

    options.follow_bidirectional = bool_field(j, "follow_bidirectional", true);
    options.deduplicate_results = bool_field(j, "deduplicate_results", true);
    options.cache_enabled = bool_field(j, "cache_enabled", true);

    if (j.contains("max_results") && !j["max_results"].is_null()) {
        long long max_results = integer_field(j["max_results"], "max_results");
        if (max_results < 0) {
            throw std::invalid_argument("max_results must be non-negative");
        }
        options.max_results = static_cast<size_t>(max_results);
    }

    return TraversalPolicy(options);
}

}  // namespace atlas
