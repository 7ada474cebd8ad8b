#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace atlas {

/**
 * @brief Settings for the atlas command line tool
 */
struct AtlasConfig {
    std::string ontology_path;          ///< Ontology JSON file or directory of JSON files
    bool verbose = false;               ///< Print per-query statistics
    int json_indent = 2;                ///< Indent for JSON output (-1 = compact)
    bool cache_enabled = true;          ///< Cache flag for ad-hoc policies

    /**
     * @brief Load configuration from JSON file
     */
    static AtlasConfig from_json_file(const std::string& path);

    static AtlasConfig from_json(const nlohmann::json& j);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Load from environment variables
     *
     * ATLAS_ONTOLOGY_PATH, ATLAS_VERBOSE, ATLAS_JSON_INDENT
     */
    static AtlasConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

}  // namespace atlas
