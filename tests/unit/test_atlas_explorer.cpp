#include <gtest/gtest.h>
#include "explorer/atlas_explorer.hpp"
#include "sample_ontology.hpp"

using namespace atlas;

class AtlasExplorerTest : public ::testing::Test {
protected:
    Ontology ontology = fixtures::sample_ontology();
    AtlasExplorer explorer{ontology};

    static std::vector<std::string> ids(const std::vector<const Entity*>& entities) {
        std::vector<std::string> result;
        for (const auto* entity : entities) {
            result.push_back(entity->id);
        }
        return result;
    }
};

// ==========================================
// Capability Queries
// ==========================================

TEST_F(AtlasExplorerTest, CapabilitiesForTask) {
    EXPECT_EQ(ids(explorer.get_capabilities_for_task("t1")), (std::vector<std::string>{"c1", "c2"}));
    EXPECT_EQ(ids(explorer.get_capabilities_for_task("t1", "tax-a")), std::vector<std::string>{"c1"});
    EXPECT_TRUE(explorer.get_capabilities_for_task("unknown").empty());
}

TEST_F(AtlasExplorerTest, IntrinsicsForCapability) {
    EXPECT_EQ(ids(explorer.get_intrinsics_for_capability("c1")),
              (std::vector<std::string>{"a1", "i1"}));
    EXPECT_EQ(ids(explorer.get_intrinsics_for_capability("c1", false)),
              std::vector<std::string>{"i1"});
    EXPECT_EQ(ids(explorer.get_intrinsics_for_capability("c2")),
              std::vector<std::string>{"i2"});
}

TEST_F(AtlasExplorerTest, TasksAndIntrinsicsForTask) {
    EXPECT_EQ(ids(explorer.get_tasks_for_capability("c1")), std::vector<std::string>{"t1"});
    EXPECT_EQ(ids(explorer.get_intrinsics_for_task("t1")), std::vector<std::string>{"i1"});
    EXPECT_TRUE(explorer.get_intrinsics_for_task("t2").empty());
}

TEST_F(AtlasExplorerTest, TraceTaskToIntrinsics) {
    auto trace = explorer.trace_task_to_intrinsics("t1");
    ASSERT_TRUE(trace.has_value());

    ASSERT_NE(trace->task, nullptr);
    EXPECT_EQ(trace->task->id, "t1");
    EXPECT_EQ(ids(trace->capabilities), (std::vector<std::string>{"c1", "c2"}));
    EXPECT_EQ(ids(trace->intrinsics_by_capability.at("c1")), (std::vector<std::string>{"a1", "i1"}));
    EXPECT_EQ(ids(trace->intrinsics_by_capability.at("c2")), std::vector<std::string>{"i2"});
    EXPECT_EQ(trace->all_intrinsics.size(), 3);

    auto j = trace->to_json();
    EXPECT_EQ(j["task"], "t1");
    EXPECT_EQ(j["intrinsics_by_capability"]["c2"], nlohmann::json::array({"i2"}));

    EXPECT_FALSE(explorer.trace_task_to_intrinsics("unknown").has_value());
}

TEST_F(AtlasExplorerTest, TraceWithCapabilityWithoutImplementations) {
    auto trace = explorer.trace_task_to_intrinsics("t2");
    ASSERT_TRUE(trace.has_value());

    EXPECT_EQ(ids(trace->capabilities), std::vector<std::string>{"shared"});
    EXPECT_TRUE(trace->intrinsics_by_capability.at("shared").empty());
    EXPECT_TRUE(trace->all_intrinsics.empty());
}

// ==========================================
// Risk Queries
// ==========================================

TEST_F(AtlasExplorerTest, RelatedRisksExcludeStart) {
    EXPECT_EQ(ids(explorer.get_related_risks("r1")), (std::vector<std::string>{"r3", "r2"}));
    EXPECT_EQ(ids(explorer.get_related_risks("r1", "risk-tax")), std::vector<std::string>{"r2"});
}

TEST_F(AtlasExplorerTest, ControlsAndActions) {
    EXPECT_EQ(ids(explorer.get_controls_for_risk("r1")), std::vector<std::string>{"ctl1"});
    EXPECT_EQ(ids(explorer.get_actions_for_risk("r1")), std::vector<std::string>{"act1"});
    EXPECT_TRUE(explorer.get_controls_for_risk("r2").empty());
}

// ==========================================
// Generic Navigation and Lookup
// ==========================================

TEST_F(AtlasExplorerTest, GetRelated) {
    EXPECT_EQ(ids(explorer.get_related("r1", EntityType::RISK, RelationType::IS_DETECTED_BY)),
              std::vector<std::string>{"ctl1"});
    EXPECT_EQ(ids(explorer.get_related("t1", EntityType::AI_TASK, RelationType::REQUIRES_CAPABILITY,
                                       EntityType::CAPABILITY, 1, "tax-b")),
              std::vector<std::string>{"c2"});
    EXPECT_TRUE(explorer.get_related("t1", EntityType::AI_TASK, RelationType::HAS_RULE).empty());
}

TEST_F(AtlasExplorerTest, NavigateByPattern) {
    auto result = explorer.navigate("dom1", EntityType::CAPABILITY_DOMAIN, "capability_hierarchy");

    EXPECT_NE(result.get_node(EntityType::CAPABILITY_DOMAIN, "dom1"), nullptr);
    EXPECT_NE(result.get_node(EntityType::CAPABILITY_GROUP, "g1"), nullptr);
    EXPECT_EQ(result.get_nodes_by_type(EntityType::CAPABILITY).size(), 2);

    EXPECT_THROW(explorer.navigate("dom1", EntityType::CAPABILITY_DOMAIN, "bogus"), PolicyNotFoundError);
}

TEST_F(AtlasExplorerTest, Lookup) {
    const Entity* c2 = explorer.find_by_attribute(EntityType::CAPABILITY, "name", "Cap two");
    ASSERT_NE(c2, nullptr);
    EXPECT_EQ(c2->id, "c2");
    EXPECT_EQ(explorer.find_by_attribute(EntityType::CAPABILITY, "name", "nope"), nullptr);

    EXPECT_NE(explorer.find_entity(EntityType::RISK, "r3"), nullptr);
    EXPECT_EQ(explorer.all_entities(EntityType::CAPABILITY).size(), 3);
    EXPECT_EQ(ids(explorer.all_entities(EntityType::CAPABILITY, "tax-b")), std::vector<std::string>{"c2"});
}

TEST_F(AtlasExplorerTest, ClearCache) {
    explorer.get_capabilities_for_task("t1");
    EXPECT_GT(explorer.navigator().cache_size(), 0);

    explorer.clear_cache();
    EXPECT_EQ(explorer.navigator().cache_size(), 0);
}
