#include <gtest/gtest.h>
#include "config/atlas_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace atlas;

namespace fs = std::filesystem;

class AtlasConfigTest : public ::testing::Test {
protected:
    fs::path ontology_file = fs::temp_directory_path() / "atlas_config_test_ontology.json";

    void SetUp() override {
        std::ofstream file(ontology_file);
        file << "{}";
    }

    void TearDown() override {
        fs::remove(ontology_file);
        unsetenv("ATLAS_ONTOLOGY_PATH");
        unsetenv("ATLAS_VERBOSE");
        unsetenv("ATLAS_JSON_INDENT");
    }
};

TEST_F(AtlasConfigTest, Defaults) {
    AtlasConfig config;
    EXPECT_TRUE(config.ontology_path.empty());
    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(config.json_indent, 2);
    EXPECT_TRUE(config.cache_enabled);
}

TEST_F(AtlasConfigTest, FromJson) {
    AtlasConfig config = AtlasConfig::from_json({
        {"ontology_path", ontology_file.string()},
        {"verbose", true},
        {"json_indent", -1}
    });

    EXPECT_EQ(config.ontology_path, ontology_file.string());
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.json_indent, -1);
    EXPECT_TRUE(config.cache_enabled);
}

TEST_F(AtlasConfigTest, FileRoundTrip) {
    fs::path config_file = fs::temp_directory_path() / "atlas_config_test.json";

    AtlasConfig config;
    config.ontology_path = ontology_file.string();
    config.cache_enabled = false;
    config.to_json_file(config_file.string());

    AtlasConfig loaded = AtlasConfig::from_json_file(config_file.string());
    EXPECT_EQ(loaded.ontology_path, config.ontology_path);
    EXPECT_FALSE(loaded.cache_enabled);

    fs::remove(config_file);

    EXPECT_THROW(AtlasConfig::from_json_file(config_file.string()), std::runtime_error);
}

TEST_F(AtlasConfigTest, Validate) {
    std::string error;

    AtlasConfig config;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("required"), std::string::npos);

    config.ontology_path = "/nonexistent/atlas/ontology.json";
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("does not exist"), std::string::npos);

    config.ontology_path = ontology_file.string();
    EXPECT_TRUE(config.validate(error));

    config.json_indent = 12;
    EXPECT_FALSE(config.validate(error));
}

TEST_F(AtlasConfigTest, FromEnvironment) {
    setenv("ATLAS_ONTOLOGY_PATH", ontology_file.c_str(), 1);
    setenv("ATLAS_VERBOSE", "true", 1);
    setenv("ATLAS_JSON_INDENT", "4", 1);

    AtlasConfig config = AtlasConfig::from_environment();
    EXPECT_EQ(config.ontology_path, ontology_file.string());
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.json_indent, 4);

    setenv("ATLAS_JSON_INDENT", "wide", 1);
    EXPECT_THROW(AtlasConfig::from_environment(), std::invalid_argument);
}
