#include "cli/cli.hpp"
#include "config/atlas_config.hpp"
#include "explorer/atlas_explorer.hpp"
#include "navigator/graph_navigator.hpp"
#include "navigator/policy_registry.hpp"
#include "ontology/ontology.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using namespace atlas;

// ============== Helper Functions ==============

AtlasConfig load_config(const Args& args) {
    AtlasConfig config = args.has("config")
        ? AtlasConfig::from_json_file(args.require("config"))
        : AtlasConfig::from_environment();

    if (args.has("ontology")) config.ontology_path = args.require("ontology");
    if (args.has("verbose")) config.verbose = true;

    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument(error);
    }
    return config;
}

Ontology load_ontology(const std::string& path, std::ostream& log) {
    log << "Loading ontology from: " << path << "\n";
    Ontology ontology = fs::is_directory(path)
        ? Ontology::load_from_directory(path)
        : Ontology::load_from_json(path);
    log << "Loaded " << ontology.total_entities() << " entities across "
        << ontology.populated_types().size() << " types\n";
    return ontology;
}

EntityType parse_entity_type(const std::string& name) {
    auto type = entity_type_from_string(name);
    if (!type) {
        throw std::invalid_argument("Unknown entity type: " + name);
    }
    return *type;
}

std::set<EntityType> parse_entity_types(const std::vector<std::string>& names) {
    std::set<EntityType> types;
    for (const auto& name : names) {
        types.insert(parse_entity_type(name));
    }
    return types;
}

std::set<RelationType> parse_relations(const std::vector<std::string>& names) {
    std::set<RelationType> relations;
    for (const auto& name : names) {
        auto relation = relation_type_from_string(name);
        if (!relation) {
            throw std::invalid_argument("Unknown relationship type: " + name);
        }
        relations.insert(*relation);
    }
    return relations;
}

// --pattern, then --policy file, then individual flags
TraversalPolicy build_policy(const Args& args, const AtlasConfig& config) {
    TraversalPolicyOptions options;

    if (args.has("pattern")) {
        options = get_named_policy(args.require("pattern")).options();
    } else if (args.has("policy")) {
        std::ifstream file(args.require("policy"));
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open policy file: " + args.require("policy"));
        }
        nlohmann::json j;
        file >> j;
        options = TraversalPolicy::from_json(j).options();
    } else {
        options.max_depth = args.get("max-depth", "2").as_int();
        if (args.has("relations")) {
            options.included_relationships = parse_relations(args.get("relations").as_list());
        }
        if (args.has("exclude-relations")) {
            options.excluded_relationships = parse_relations(args.get("exclude-relations").as_list());
        }
        if (args.has("types")) {
            options.included_entity_types = parse_entity_types(args.get("types").as_list());
        }
        if (args.has("exclude-types")) {
            options.excluded_entity_types = parse_entity_types(args.get("exclude-types").as_list());
        }
        for (const auto& filter : args.get("filter").as_list()) {
            auto eq_pos = filter.find('=');
            if (eq_pos == std::string::npos) {
                throw std::invalid_argument("Filter must be key=value: " + filter);
            }
            options.node_property_filters[filter.substr(0, eq_pos)] = filter.substr(eq_pos + 1);
        }
        if (args.has("max-results")) {
            int max_results = args.get("max-results").as_int();
            if (max_results < 0) {
                throw std::invalid_argument("--max-results must be non-negative");
            }
            options.max_results = static_cast<size_t>(max_results);
        }
        if (args.has("no-dedup")) {
            options.deduplicate_results = false;
        }
    }

    options.cache_enabled = config.cache_enabled;
    return TraversalPolicy(options);
}

void write_json(const nlohmann::json& j, const std::string& output_path, int indent) {
    if (output_path.empty()) {
        std::cout << j.dump(indent) << "\n";
        return;
    }

    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write output file: " + output_path);
    }
    file << j.dump(indent) << "\n";
    std::cout << "Saved result to: " << output_path << "\n";
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(d).count();
    std::stringstream ss;
    if (us >= 1000) {
        ss << std::fixed << std::setprecision(2) << (us / 1000.0) << "ms";
    } else {
        ss << us << "us";
    }
    return ss.str();
}

// ============== atlas navigate ==============
int cmd_navigate(const Args& args) {
    AtlasConfig config = load_config(args);
    std::string output_path = args.get("output", "").value;

    // Keep stdout clean when the result goes there
    std::ostream& log = output_path.empty() ? std::cerr : std::cout;

    Ontology ontology = load_ontology(config.ontology_path, log);
    GraphNavigator navigator(ontology);

    std::string start_id = args.require("start");
    EntityType start_type = parse_entity_type(args.require("type"));
    TraversalPolicy policy = build_policy(args, config);

    auto started = std::chrono::steady_clock::now();
    TraversalResult result = navigator.traverse_from_node(start_id, start_type, policy);
    auto elapsed = std::chrono::steady_clock::now() - started;

    if (!navigator.get_node(start_type, start_id)) {
        log << "Start entity not found: " << to_string(start_type) << " '" << start_id << "'\n";
    }

    if (config.verbose) {
        const auto& stats = result.statistics();
        log << "Traversal finished in " << format_duration(elapsed) << "\n";
        log << "  Nodes visited: " << stats.nodes_visited << "\n";
        log << "  Nodes returned: " << stats.nodes_returned << "\n";
        log << "  Max depth reached: " << stats.max_depth_reached << "\n";
        log << "  Relationships traversed: " << stats.relationships_traversed << "\n";
        log << "  Cache key: " << policy.cache_key(start_id, start_type) << "\n";
    }

    write_json(result.to_json(), output_path, config.json_indent);
    return 0;
}

// ============== atlas patterns ==============
int cmd_patterns(const Args& args) {
    bool as_json = args.has("json");

    if (as_json) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [name, description] : list_named_policies()) {
            j[name] = {
                {"description", description},
                {"policy", get_named_policy(name).to_json()}
            };
        }
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << "Named traversal policies:\n";
    for (const auto& [name, description] : list_named_policies()) {
        std::cout << "  " << name;
        for (size_t i = name.length(); i < 32; ++i) std::cout << " ";
        std::cout << description << "\n";
    }
    return 0;
}

// ============== atlas stats ==============
int cmd_stats(const Args& args) {
    AtlasConfig config = load_config(args);
    Ontology ontology = load_ontology(config.ontology_path, std::cout);
    GraphNavigator navigator(ontology);

    size_t total_edges = 0;
    std::map<RelationType, size_t> by_relation;

    std::cout << "\nEntities by type:\n";
    for (EntityType type : ontology.populated_types()) {
        std::cout << "  " << to_string(type);
        for (size_t i = to_string(type).length(); i < 24; ++i) std::cout << " ";
        std::cout << ontology.size(type) << "\n";

        for (const auto& entity : ontology.entities(type)) {
            for (const auto& edge : navigator.get_edges(entity)) {
                ++total_edges;
                ++by_relation[edge.relation];
            }
        }
    }

    std::cout << "\nDerivable edges: " << total_edges << "\n";
    for (const auto& [relation, count] : by_relation) {
        std::cout << "  " << to_string(relation);
        for (size_t i = to_string(relation).length(); i < 32; ++i) std::cout << " ";
        std::cout << count << "\n";
    }

    return 0;
}

// ============== atlas trace ==============
int cmd_trace(const Args& args) {
    AtlasConfig config = load_config(args);
    std::string output_path = args.get("output", "").value;
    std::ostream& log = output_path.empty() ? std::cerr : std::cout;

    Ontology ontology = load_ontology(config.ontology_path, log);
    AtlasExplorer explorer(ontology);

    std::string task_id = args.require("task");
    auto trace = explorer.trace_task_to_intrinsics(task_id);
    if (!trace) {
        std::cerr << "Error: task not found: " << task_id << "\n";
        return 1;
    }

    if (config.verbose) {
        log << "Task " << task_id << " requires " << trace->capabilities.size()
            << " capabilities, implemented by " << trace->all_intrinsics.size()
            << " intrinsics/adapters\n";
    }

    write_json(trace->to_json(), output_path, config.json_indent);
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("atlas", "1.0.0");

    const ArgDef config_arg{"config", "c", "Path to atlas config JSON (default: environment)", "", false, false};
    const ArgDef ontology_arg{"ontology", "i", "Ontology JSON file or directory", "", false, false};
    const ArgDef verbose_arg{"verbose", "v", "Print traversal statistics", "", false, true};

    // atlas navigate
    cli.register_command({
        "navigate",
        "Traverse the knowledge graph from a start entity",
        {
            config_arg,
            ontology_arg,
            {"start", "s", "Start entity id", "", true, false},
            {"type", "t", "Start entity type (e.g. AiTask, Capability)", "", true, false},
            {"pattern", "p", "Named policy (see 'atlas patterns')", "", false, false},
            {"policy", "P", "Policy JSON file", "", false, false},
            {"max-depth", "d", "Maximum traversal depth", "2", false, false},
            {"relations", "r", "Comma-separated relationships to follow", "", false, false},
            {"exclude-relations", "R", "Comma-separated relationships never to follow", "", false, false},
            {"types", "y", "Comma-separated entity types to return", "", false, false},
            {"exclude-types", "Y", "Comma-separated entity types never to return", "", false, false},
            {"filter", "f", "Comma-separated key=value attribute filters", "", false, false},
            {"max-results", "m", "Maximum number of returned nodes", "", false, false},
            {"no-dedup", "", "Revisit already discovered entities", "", false, true},
            {"output", "o", "Output path for the result JSON (default: stdout)", "", false, false},
            verbose_arg
        },
        cmd_navigate
    });

    // atlas patterns
    cli.register_command({
        "patterns",
        "List named traversal policies",
        {
            {"json", "j", "Print policies as JSON", "", false, true}
        },
        cmd_patterns
    });

    // atlas stats
    cli.register_command({
        "stats",
        "Print entity and edge counts for an ontology",
        {
            config_arg,
            ontology_arg,
            verbose_arg
        },
        cmd_stats
    });

    // atlas trace
    cli.register_command({
        "trace",
        "Trace a task to its capabilities and implementing intrinsics",
        {
            config_arg,
            ontology_arg,
            {"task", "k", "AiTask id", "", true, false},
            {"output", "o", "Output path for the trace JSON (default: stdout)", "", false, false},
            verbose_arg
        },
        cmd_trace
    });

    return cli.run(argc, argv);
}
