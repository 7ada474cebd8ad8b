#include "ontology/ontology.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

nlohmann::json as_list(const nlohmann::json& value) {
    if (value.is_array()) return value;
    nlohmann::json list = nlohmann::json::array();
    list.push_back(value);
    return list;
}

}  // namespace

namespace atlas {

void Ontology::add_entity(const Entity& entity) {
    auto& positions = positions_[entity.type];
    auto& collection = collections_[entity.type];

    auto it = positions.find(entity.id);
    if (it != positions.end()) {
        combine_into(collection[it->second], entity);
        return;
    }

    positions[entity.id] = collection.size();
    collection.push_back(entity);
}

void Ontology::combine_into(Entity& existing, const Entity& incoming) {
    for (const auto& [key, value] : incoming.attributes) {
        auto it = existing.attributes.find(key);
        if (it == existing.attributes.end() || it->second.is_null()) {
            existing.attributes[key] = value;
            continue;
        }
        if (value.is_null()) continue;

        // Both sides carry data: concatenate as lists
        nlohmann::json combined = as_list(it->second);
        for (const auto& item : as_list(value)) {
            combined.push_back(item);
        }
        it->second = combined;
    }
}

const std::vector<Entity>& Ontology::entities(EntityType type) const {
    static const std::vector<Entity> empty_collection;
    auto it = collections_.find(type);
    return it != collections_.end() ? it->second : empty_collection;
}

size_t Ontology::size(EntityType type) const {
    return entities(type).size();
}

size_t Ontology::total_entities() const {
    size_t total = 0;
    for (const auto& [type, collection] : collections_) {
        total += collection.size();
    }
    return total;
}

std::vector<EntityType> Ontology::populated_types() const {
    std::vector<EntityType> result;
    for (const auto& [type, collection] : collections_) {
        if (!collection.empty()) {
            result.push_back(type);
        }
    }
    return result;
}

// ==========================================
// Import/Export
// ==========================================

void Ontology::merge_json(const nlohmann::json& j, const std::string& origin) {
    if (!j.is_object()) {
        throw std::runtime_error("Ontology document must be a JSON object" +
                                 (origin.empty() ? std::string() : ": " + origin));
    }

    for (const auto& [key, records] : j.items()) {
        auto type = entity_type_from_collection_key(key);
        if (!type) {
            std::cerr << "Warning: skipping unknown collection '" << key << "'";
            if (!origin.empty()) std::cerr << " in " << origin;
            std::cerr << "\n";
            continue;
        }
        if (records.is_null()) continue;

        for (const auto& record : as_list(records)) {
            add_entity(Entity::from_json(*type, record));
        }
    }
}

Ontology Ontology::from_json(const nlohmann::json& j) {
    Ontology ontology;
    ontology.merge_json(j);
    return ontology;
}

Ontology Ontology::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open ontology file: " + filename);
    }

    nlohmann::json j;
    file >> j;

    Ontology ontology;
    ontology.merge_json(j, filename);
    return ontology;
}

Ontology Ontology::load_from_directory(const std::string& directory) {
    if (!fs::is_directory(directory)) {
        throw std::runtime_error("Not a directory: " + directory);
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(directory)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());

    Ontology ontology;
    for (const auto& path : files) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Warning: ontology file ignored: " << path << " (cannot open)\n";
            continue;
        }
        try {
            nlohmann::json j;
            file >> j;

            // Parse the whole file before touching the snapshot
            Ontology part;
            part.merge_json(j, path);
            for (const auto& [type, collection] : part.collections_) {
                for (const auto& entity : collection) {
                    ontology.add_entity(entity);
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: ontology file ignored: " << path
                      << ". Failed to load. " << e.what() << "\n";
        }
    }

    return ontology;
}

nlohmann::json Ontology::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [type, collection] : collections_) {
        nlohmann::json records = nlohmann::json::array();
        for (const auto& entity : collection) {
            records.push_back(entity.to_json());
        }
        j[collection_key(type)] = records;
    }
    return j;
}

}  // namespace atlas
