#include <gtest/gtest.h>
#include "ontology/entity_index.hpp"
#include "ontology/ontology.hpp"
#include "sample_ontology.hpp"
#include <filesystem>
#include <fstream>

using namespace atlas;

namespace fs = std::filesystem;

// ==========================================
// Enum Conversion Tests
// ==========================================

TEST(EntityTypeTest, NamesRoundTrip) {
    EXPECT_EQ(to_string(EntityType::AI_TASK), "AiTask");
    EXPECT_EQ(to_string(EntityType::LLM_INTRINSIC), "LLMIntrinsic");
    EXPECT_EQ(entity_type_from_string("Capability"), EntityType::CAPABILITY);
    EXPECT_FALSE(entity_type_from_string("capability").has_value());

    for (EntityType type : all_entity_types()) {
        EXPECT_EQ(entity_type_from_string(to_string(type)), type);
    }
    EXPECT_EQ(all_entity_types().size(), 28);
}

TEST(EntityTypeTest, CollectionKeys) {
    EXPECT_EQ(collection_key(EntityType::CAPABILITY), "capabilities");
    EXPECT_EQ(entity_type_from_collection_key("aitasks"), EntityType::AI_TASK);
    EXPECT_EQ(entity_type_from_collection_key("AiTask"), EntityType::AI_TASK);
    EXPECT_FALSE(entity_type_from_collection_key("widgets").has_value());
}

TEST(RelationTypeTest, NamesRoundTrip) {
    EXPECT_EQ(to_string(RelationType::REQUIRES_CAPABILITY), "requiresCapability");
    EXPECT_EQ(relation_type_from_string("hasDocumentation"), RelationType::HAS_DOCUMENTATION);
    EXPECT_FALSE(relation_type_from_string("requires").has_value());

    for (RelationType relation : all_relation_types()) {
        EXPECT_EQ(relation_type_from_string(to_string(relation)), relation);
    }
    EXPECT_EQ(all_relation_types().size(), 30);
}

// ==========================================
// Entity Tests
// ==========================================

TEST(EntityTest, Attributes) {
    Entity entity = Entity::from_json(EntityType::CAPABILITY,
        {{"id", "c1"}, {"name", "Cap one"}, {"score", 3}});

    EXPECT_EQ(entity.type, EntityType::CAPABILITY);
    EXPECT_EQ(entity.id, "c1");
    EXPECT_EQ(entity.attribute("id"), "c1");
    EXPECT_EQ(entity.attribute("score"), 3);
    EXPECT_TRUE(entity.attribute("missing").is_null());
    EXPECT_TRUE(entity.has_attribute("name"));
    EXPECT_FALSE(entity.has_attribute("missing"));
    EXPECT_EQ(entity.attribute_string("name"), "Cap one");
    EXPECT_EQ(entity.attribute_string("score", "n/a"), "n/a");
}

TEST(EntityTest, MissingIdThrows) {
    EXPECT_THROW(Entity::from_json(EntityType::RISK, {{"name", "no id"}}), nlohmann::json::exception);
}

// ==========================================
// Ontology Tests
// ==========================================

TEST(OntologyTest, FromJson) {
    Ontology ontology = fixtures::sample_ontology();

    EXPECT_EQ(ontology.size(EntityType::AI_TASK), 2);
    EXPECT_EQ(ontology.size(EntityType::CAPABILITY), 3);
    EXPECT_EQ(ontology.size(EntityType::DOCUMENT), 2);
    EXPECT_EQ(ontology.size(EntityType::BENCHMARK), 0);
    EXPECT_TRUE(ontology.entities(EntityType::BENCHMARK).empty());
    EXPECT_EQ(ontology.total_entities(), 17);

    // Load order is preserved
    const auto& capabilities = ontology.entities(EntityType::CAPABILITY);
    EXPECT_EQ(capabilities[0].id, "c1");
    EXPECT_EQ(capabilities[1].id, "c2");
}

TEST(OntologyTest, ClassNameKeysAndUnknownCollections) {
    Ontology ontology = Ontology::from_json({
        {"Capability", {{{"id", "c1"}}}},
        {"widgets", {{{"id", "w1"}}}}
    });

    EXPECT_EQ(ontology.size(EntityType::CAPABILITY), 1);
    EXPECT_EQ(ontology.total_entities(), 1);
}

TEST(OntologyTest, CombinesRecordsWithSameId) {
    Ontology ontology;
    ontology.merge_json({{"capabilities", {
        {{"id", "c1"}, {"name", "Cap one"}, {"requiredByTask", "t1"}}
    }}});
    ontology.merge_json({{"capabilities", {
        {{"id", "c1"}, {"requiredByTask", {"t2", "t3"}}, {"isPartOf", "g1"}}
    }}});

    ASSERT_EQ(ontology.size(EntityType::CAPABILITY), 1);
    const Entity& c1 = ontology.entities(EntityType::CAPABILITY)[0];
    EXPECT_EQ(c1.attribute("requiredByTask"), nlohmann::json::array({"t1", "t2", "t3"}));
    EXPECT_EQ(c1.attribute("isPartOf"), "g1");
    EXPECT_EQ(c1.attribute("name"), "Cap one");
}

TEST(OntologyTest, SameIdDifferentTypesKeptApart) {
    Ontology ontology = fixtures::sample_ontology();

    bool found_capability = false;
    for (const auto& entity : ontology.entities(EntityType::CAPABILITY)) {
        if (entity.id == "shared") found_capability = true;
    }
    bool found_document = false;
    for (const auto& entity : ontology.entities(EntityType::DOCUMENT)) {
        if (entity.id == "shared") found_document = true;
    }
    EXPECT_TRUE(found_capability);
    EXPECT_TRUE(found_document);
}

TEST(OntologyTest, RejectsNonObjectDocument) {
    Ontology ontology;
    EXPECT_THROW(ontology.merge_json(nlohmann::json::array()), std::runtime_error);
}

TEST(OntologyTest, LoadFromMissingFileThrows) {
    EXPECT_THROW(Ontology::load_from_json("/nonexistent/atlas/ontology.json"), std::runtime_error);
}

TEST(OntologyTest, LoadFromDirectory) {
    fs::path dir = fs::temp_directory_path() / "atlas_ontology_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "mappings");

    {
        std::ofstream file(dir / "a_entities.json");
        file << R"({"aitasks": [{"id": "t1"}], "capabilities": [{"id": "c1"}]})";
    }
    {
        std::ofstream file(dir / "mappings" / "task_capability.json");
        file << R"({"aitasks": [{"id": "t1", "requiresCapability": ["c1"]}]})";
    }
    {
        std::ofstream file(dir / "broken.json");
        file << R"({"capabilities": [{"id": "c9"}], )";
    }
    {
        std::ofstream file(dir / "notes.txt");
        file << "not an ontology file";
    }

    Ontology ontology = Ontology::load_from_directory(dir.string());

    EXPECT_EQ(ontology.size(EntityType::AI_TASK), 1);
    EXPECT_EQ(ontology.size(EntityType::CAPABILITY), 1);
    EXPECT_EQ(ontology.entities(EntityType::AI_TASK)[0].attribute("requiresCapability"),
              nlohmann::json::array({"c1"}));

    fs::remove_all(dir);
}

TEST(OntologyTest, LoadFromFileRoundTrip) {
    fs::path path = fs::temp_directory_path() / "atlas_ontology_roundtrip.json";
    Ontology saved = fixtures::sample_ontology();
    {
        std::ofstream file(path);
        file << saved.to_json().dump();
    }

    Ontology loaded = Ontology::load_from_json(path.string());
    EXPECT_EQ(loaded.total_entities(), saved.total_entities());
    EXPECT_EQ(loaded.to_json(), saved.to_json());

    fs::remove(path);
}

// ==========================================
// Entity Index Tests
// ==========================================

TEST(EntityIndexTest, Lookup) {
    Ontology ontology = fixtures::sample_ontology();
    EntityIndex index(ontology);

    EXPECT_EQ(index.size(), ontology.total_entities());

    const Entity* c1 = index.lookup(EntityType::CAPABILITY, "c1");
    ASSERT_NE(c1, nullptr);
    EXPECT_EQ(c1->attribute_string("name"), "Cap one");

    EXPECT_EQ(index.lookup(EntityType::CAPABILITY, "c-missing"), nullptr);
    EXPECT_EQ(index.lookup(EntityType::BENCHMARK, "c1"), nullptr);
    EXPECT_FALSE(index.contains(EntityType::AI_TASK, "c1"));
}

TEST(EntityIndexTest, IdsAreScopedByType) {
    Ontology ontology = fixtures::sample_ontology();
    EntityIndex index(ontology);

    const Entity* capability = index.lookup(EntityType::CAPABILITY, "shared");
    const Entity* document = index.lookup(EntityType::DOCUMENT, "shared");
    ASSERT_NE(capability, nullptr);
    ASSERT_NE(document, nullptr);
    EXPECT_NE(capability, document);
    EXPECT_EQ(document->attribute_string("name"), "Shared id document");
}
