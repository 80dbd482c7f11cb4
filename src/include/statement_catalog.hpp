#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "error.hpp"

namespace querygate {

struct StatementDefinition {
    std::string id;          // "<namespace>.<name>"
    std::string sql;
    std::filesystem::path source;
};

/**
 * Named SQL statements loaded from mapper files.
 *
 * A mapper file declares a namespace and a map of statement names to SQL:
 *
 *   namespace: users
 *   statements:
 *     findById: SELECT * FROM users WHERE id = $id
 *
 * Loading builds a complete new map before swapping it in, so a broken
 * mapper file leaves the previous statements in place.
 */
class StatementCatalog {
public:
    using StatementMap = std::unordered_map<std::string, StatementDefinition>;

    StatementCatalog();

    // Loads every *.yaml / *.yml file in the directory
    Result<std::size_t> loadDirectory(const std::filesystem::path& directory);

    /**
     * Parses every mapper file in the directory without touching the live
     * catalog. The result can be published later with publish().
     */
    static Result<StatementMap> readDirectory(const std::filesystem::path& directory);

    // Loads a single mapper document, replacing the current catalog
    Result<std::size_t> loadFromString(const std::string& yaml_content);

    std::optional<StatementDefinition> find(const std::string& id) const;
    std::size_t size() const;

    void publish(StatementMap statements);

private:
    static void parseMapper(const std::string& content, const std::filesystem::path& source, StatementMap& target);

    std::shared_ptr<const StatementMap> statements;
};

} // namespace querygate
