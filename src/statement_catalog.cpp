#include "statement_catalog.hpp"
#include "config_manager.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <crow/logging.h>
#include <fstream>
#include <sstream>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace querygate {

StatementCatalog::StatementCatalog()
    : statements(std::make_shared<const StatementMap>())
{}

Result<std::size_t> StatementCatalog::loadDirectory(const std::filesystem::path& directory) {
    auto loaded = readDirectory(directory);
    if (!loaded) {
        CROW_LOG_ERROR << "Statement catalog load failed, keeping " << size() << " statements: "
                       << loaded.error().details;
        return std::move(loaded.error());
    }

    const auto count = loaded->size();
    publish(std::move(*loaded));
    CROW_LOG_INFO << "Loaded " << count << " statements from " << directory;
    return count;
}

Result<StatementCatalog::StatementMap> StatementCatalog::readDirectory(const std::filesystem::path& directory) {
    StatementMap loaded;

    try {
        if (!std::filesystem::is_directory(directory)) {
            throw ConfigurationError("Mapper location is not a directory: " + directory.string());
        }

        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            auto extension = entry.path().extension().string();
            if (entry.is_regular_file() && (extension == ".yaml" || extension == ".yml")) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            std::ifstream stream(file);
            if (!stream) {
                throw ConfigurationError("Cannot read mapper file", file.string());
            }
            std::stringstream buffer;
            buffer << stream.rdbuf();
            parseMapper(buffer.str(), file, loaded);
        }
    } catch (const std::exception& e) {
        return Error::Config("Statement catalog rejected", e.what());
    }

    return loaded;
}

Result<std::size_t> StatementCatalog::loadFromString(const std::string& yaml_content) {
    StatementMap loaded;
    try {
        parseMapper(yaml_content, "<inline>", loaded);
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Statement catalog load failed: " << e.what();
        return Error::Config("Statement catalog rejected", e.what());
    }
    const auto count = loaded.size();
    publish(std::move(loaded));
    return count;
}

std::optional<StatementDefinition> StatementCatalog::find(const std::string& id) const {
    auto current = std::atomic_load(&statements);
    auto it = current->find(id);
    if (it == current->end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t StatementCatalog::size() const {
    return std::atomic_load(&statements)->size();
}

void StatementCatalog::parseMapper(const std::string& content, const std::filesystem::path& source,
                                   StatementMap& target) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid YAML: ") + e.what(), source.string());
    }

    if (!root || !root.IsMap()) {
        throw ConfigurationError("Mapper root must be a map", source.string());
    }
    if (!root["namespace"] || !root["namespace"].IsScalar()) {
        throw ConfigurationError("Missing required key: namespace", source.string());
    }
    const std::string ns = trimString(root["namespace"].as<std::string>());
    if (ns.empty()) {
        throw ConfigurationError("namespace must not be blank", source.string());
    }

    const auto& entries = root["statements"];
    if (!entries || !entries.IsMap()) {
        throw ConfigurationError("'statements' must be a map of name to SQL", source.string());
    }

    for (const auto& entry : entries) {
        const std::string name = entry.first.as<std::string>();
        const std::string yaml_path = source.string() + ":statements." + name;
        if (!entry.second.IsScalar()) {
            throw ConfigurationError("Statement SQL must be a string", yaml_path);
        }

        StatementDefinition statement{ns + "." + name, trimString(entry.second.as<std::string>()), source};
        if (statement.sql.empty()) {
            throw ConfigurationError("Statement SQL must not be blank", yaml_path);
        }
        if (target.count(statement.id) > 0) {
            throw ConfigurationError("Duplicate statement id " + statement.id, yaml_path);
        }
        CROW_LOG_DEBUG << "Registered statement " << statement.id;
        target.emplace(statement.id, std::move(statement));
    }
}

void StatementCatalog::publish(StatementMap loaded) {
    std::atomic_store(&statements, std::shared_ptr<const StatementMap>(
        std::make_shared<StatementMap>(std::move(loaded))));
}

} // namespace querygate
