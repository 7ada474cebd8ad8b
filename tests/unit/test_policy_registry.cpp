#include <gtest/gtest.h>
#include "navigator/policy_registry.hpp"

using namespace atlas;

TEST(PolicyRegistryTest, ListsAllPatterns) {
    auto patterns = list_named_policies();

    EXPECT_EQ(patterns.size(), 12);
    for (const char* name : {"capabilities_for_task", "intrinsics_for_capability",
                             "tasks_for_capability", "capability_hierarchy",
                             "end_to_end_task_to_intrinsics", "controls_for_risk",
                             "actions_for_risk", "related_risks", "risk_neighborhood",
                             "intrinsics_for_task", "documentation_for_entity", "skos_matches"}) {
        EXPECT_EQ(patterns.count(name), 1) << name;
        EXPECT_TRUE(has_named_policy(name)) << name;
        EXPECT_FALSE(patterns[name].empty()) << name;
    }
}

TEST(PolicyRegistryTest, CapabilitiesForTask) {
    TraversalPolicy policy = get_named_policy("capabilities_for_task");

    EXPECT_EQ(policy.max_depth(), 1);
    EXPECT_TRUE(policy.allows_relationship(RelationType::REQUIRES_CAPABILITY));
    EXPECT_FALSE(policy.allows_relationship(RelationType::HAS_DOCUMENTATION));
    EXPECT_TRUE(policy.allows_entity_type(EntityType::CAPABILITY));
    EXPECT_FALSE(policy.allows_entity_type(EntityType::AI_TASK));
}

TEST(PolicyRegistryTest, EndToEndIsTwoHops) {
    TraversalPolicy policy = get_named_policy("end_to_end_task_to_intrinsics");

    EXPECT_EQ(policy.max_depth(), 2);
    EXPECT_TRUE(policy.allows_relationship(RelationType::IMPLEMENTED_BY_ADAPTER));
    EXPECT_TRUE(policy.allows_entity_type(EntityType::ADAPTER));
    EXPECT_TRUE(policy.allows_entity_type(EntityType::LLM_INTRINSIC));
}

TEST(PolicyRegistryTest, SkosMatchesHasNoTypeRestriction) {
    TraversalPolicy policy = get_named_policy("skos_matches");

    EXPECT_FALSE(policy.included_entity_types().has_value());
    EXPECT_TRUE(policy.allows_relationship(RelationType::NARROW_MATCH));
    EXPECT_FALSE(policy.allows_relationship(RelationType::IS_PART_OF));
}

TEST(PolicyRegistryTest, UnknownPatternListsAvailable) {
    EXPECT_FALSE(has_named_policy("no_such_pattern"));

    try {
        get_named_policy("no_such_pattern");
        FAIL() << "Expected PolicyNotFoundError";
    } catch (const PolicyNotFoundError& e) {
        EXPECT_EQ(e.requested(), "no_such_pattern");
        EXPECT_EQ(e.available().size(), 12);

        std::string message = e.what();
        EXPECT_NE(message.find("no_such_pattern"), std::string::npos);
        EXPECT_NE(message.find("capabilities_for_task"), std::string::npos);
        EXPECT_NE(message.find("skos_matches"), std::string::npos);
    }

    EXPECT_THROW(get_named_policy(""), std::out_of_range);
}
