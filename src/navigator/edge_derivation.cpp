#include "navigator/edge_derivation.hpp"

namespace atlas {

void EdgeDerivationTable::add_rule(EntityType source_type, const EdgeRule& rule) {
    type_rules_[source_type].push_back(rule);
}

void EdgeDerivationTable::add_global_rule(const EdgeRule& rule) {
    global_rules_.push_back(rule);
}

void EdgeDerivationTable::add_trailing_rule(EntityType source_type, const EdgeRule& rule) {
    trailing_rules_[source_type].push_back(rule);
}

std::vector<EdgeRule> EdgeDerivationTable::rules_for(EntityType source_type) const {
    std::vector<EdgeRule> result;

    auto it = type_rules_.find(source_type);
    if (it != type_rules_.end()) {
        result = it->second;
    }
    result.insert(result.end(), global_rules_.begin(), global_rules_.end());

    auto trailing = trailing_rules_.find(source_type);
    if (trailing != trailing_rules_.end()) {
        result.insert(result.end(), trailing->second.begin(), trailing->second.end());
    }

    return result;
}

size_t EdgeDerivationTable::num_rules() const {
    size_t total = global_rules_.size();
    for (const auto& [type, rules] : type_rules_) {
        total += rules.size();
    }
    for (const auto& [type, rules] : trailing_rules_) {
        total += rules.size();
    }
    return total;
}

std::vector<std::string> EdgeDerivationTable::target_ids(const nlohmann::json& value) {
    std::vector<std::string> ids;

    if (value.is_string()) {
        auto id = value.get<std::string>();
        if (!id.empty()) ids.push_back(id);
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                ids.push_back(item.get<std::string>());
            }
        }
    }

    return ids;
}

std::vector<DerivedEdge> EdgeDerivationTable::derive_edges(
    const Entity& entity,
    const EntityIndex& index
) const {
    std::vector<DerivedEdge> edges;

    auto apply = [&](const EdgeRule& rule) {
        auto attr_it = entity.attributes.find(rule.attribute);
        if (attr_it == entity.attributes.end()) {
            return;
        }

        for (const auto& target_id : target_ids(attr_it->second)) {
            const Entity* target = index.lookup(rule.target_type, target_id);
            if (!target) {
                continue;  // dangling reference
            }
            edges.push_back({rule.relation, target_id, rule.target_type, target});
        }
    };

    auto it = type_rules_.find(entity.type);
    if (it != type_rules_.end()) {
        for (const auto& rule : it->second) {
            apply(rule);
        }
    }
    for (const auto& rule : global_rules_) {
        apply(rule);
    }
    auto trailing = trailing_rules_.find(entity.type);
    if (trailing != trailing_rules_.end()) {
        for (const auto& rule : trailing->second) {
            apply(rule);
        }
    }

    return edges;
}

// ==========================================
// Default relationship layout
// ==========================================

EdgeDerivationTable EdgeDerivationTable::default_table() {
    EdgeDerivationTable table;

    // Task -> capability
    table.add_rule(EntityType::AI_TASK,
        {"requiresCapability", RelationType::REQUIRES_CAPABILITY, EntityType::CAPABILITY});

    // Capability -> tasks, implementations, hierarchy
    table.add_rule(EntityType::CAPABILITY,
        {"requiredByTask", RelationType::REQUIRED_BY_TASK, EntityType::AI_TASK});
    table.add_rule(EntityType::CAPABILITY,
        {"implementedByAdapter", RelationType::IMPLEMENTED_BY_ADAPTER, EntityType::ADAPTER});
    table.add_rule(EntityType::CAPABILITY,
        {"implementedByIntrinsic", RelationType::IMPLEMENTED_BY_INTRINSIC, EntityType::LLM_INTRINSIC});
    table.add_rule(EntityType::CAPABILITY,
        {"isPartOf", RelationType::IS_PART_OF, EntityType::CAPABILITY_GROUP});

    // Inverse mappings land in type-qualified attributes
    table.add_rule(EntityType::ADAPTER,
        {"implementsCapability_adapter", RelationType::IMPLEMENTS_CAPABILITY, EntityType::CAPABILITY});
    table.add_rule(EntityType::LLM_INTRINSIC,
        {"implementsCapability_intrinsic", RelationType::IMPLEMENTS_CAPABILITY, EntityType::CAPABILITY});

    table.add_rule(EntityType::RISK,
        {"hasRelatedAction", RelationType::HAS_RELATED_ACTION, EntityType::ACTION});
    table.add_rule(EntityType::RISK,
        {"isDetectedBy", RelationType::IS_DETECTED_BY, EntityType::RISK_CONTROL});

    // SKOS matches stay within a type
    const std::vector<std::pair<std::string, RelationType>> skos = {
        {"exactMatch", RelationType::EXACT_MATCH},
        {"closeMatch", RelationType::CLOSE_MATCH},
        {"broadMatch", RelationType::BROAD_MATCH},
        {"narrowMatch", RelationType::NARROW_MATCH},
        {"relatedMatch", RelationType::RELATED_MATCH},
    };
    for (EntityType type : {EntityType::RISK, EntityType::CAPABILITY}) {
        for (const auto& [attribute, relation] : skos) {
            table.add_rule(type, {attribute, relation, type});
        }
    }

    table.add_rule(EntityType::CAPABILITY_GROUP,
        {"hasPart", RelationType::HAS_PART, EntityType::CAPABILITY});
    table.add_rule(EntityType::CAPABILITY_GROUP,
        {"belongsToDomain", RelationType::BELONGS_TO_DOMAIN, EntityType::CAPABILITY_DOMAIN});
    table.add_rule(EntityType::CAPABILITY_DOMAIN,
        {"hasPart", RelationType::HAS_PART, EntityType::CAPABILITY_GROUP});

    // Any entity may carry documentation and a license
    table.add_global_rule({"hasDocumentation", RelationType::HAS_DOCUMENTATION, EntityType::DOCUMENT});
    table.add_global_rule({"hasLicense", RelationType::HAS_LICENSE, EntityType::LICENSE});

    // These follow documentation and license in edge order
    table.add_trailing_rule(EntityType::AI_TASK,
        {"hasRelatedLLMIntrinsic", RelationType::HAS_RELATED_LLMINTRINSIC, EntityType::LLM_INTRINSIC});
    table.add_trailing_rule(EntityType::POLICY,
        {"hasRule", RelationType::HAS_RULE, EntityType::RULE});

    return table;
}

}  // namespace atlas
