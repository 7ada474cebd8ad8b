#include "config/atlas_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

bool parse_flag(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

}  // namespace

namespace atlas {

AtlasConfig AtlasConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    return from_json(j);
}

AtlasConfig AtlasConfig::from_json(const nlohmann::json& j) {
    AtlasConfig config;

    if (j.contains("ontology_path")) config.ontology_path = j["ontology_path"].get<std::string>();
    if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();
    if (j.contains("json_indent")) config.json_indent = j["json_indent"].get<int>();
    if (j.contains("cache_enabled")) config.cache_enabled = j["cache_enabled"].get<bool>();

    return config;
}

void AtlasConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2) << "\n";
}

nlohmann::json AtlasConfig::to_json() const {
    nlohmann::json j;
    j["ontology_path"] = ontology_path;
    j["verbose"] = verbose;
    j["json_indent"] = json_indent;
    j["cache_enabled"] = cache_enabled;
    return j;
}

AtlasConfig AtlasConfig::from_environment() {
    AtlasConfig config;

    const char* ontology_path = std::getenv("ATLAS_ONTOLOGY_PATH");
    if (ontology_path) config.ontology_path = ontology_path;

    const char* verbose = std::getenv("ATLAS_VERBOSE");
    if (verbose) config.verbose = parse_flag(verbose);

    const char* indent = std::getenv("ATLAS_JSON_INDENT");
    if (indent) {
        try {
            config.json_indent = std::stoi(indent);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("ATLAS_JSON_INDENT is not a number: ") + indent);
        }
    }

    return config;
}

bool AtlasConfig::validate(std::string& error_message) const {
    if (ontology_path.empty()) {
        error_message = "Ontology path is required";
        return false;
    }

    if (!fs::exists(ontology_path)) {
        error_message = "Ontology path does not exist: " + ontology_path;
        return false;
    }

    if (json_indent < -1 || json_indent > 8) {
        error_message = "JSON indent must be between -1 and 8";
        return false;
    }

    return true;
}

}  // namespace atlas
