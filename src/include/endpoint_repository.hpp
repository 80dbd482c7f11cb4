#pragma once

#include "endpoint_definition.hpp"
#include "error.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace querygate {

/**
 * @brief Outcome of a successful route lookup
 */
struct RouteMatch {
    std::shared_ptr<const EndpointDefinition> endpoint;
    std::map<std::string, std::string> pathVariables;   // template variable name -> path segment
};

/**
 * Immutable routing index built from one configuration generation.
 *
 * Literal paths live in a hash map keyed "METHOD:PATH". Templated paths are
 * kept in registration order together with their compiled pattern. A table
 * is fully built by build() before anyone can see it.
 */
class RoutingTable {
public:
    /**
     * Builds a complete table from parsed endpoints.
     *
     * A later exact route with the same method and path replaces the earlier
     * one, with a warning.
     *
     * @throws std::regex_error if a path template does not compile
     */
    static std::shared_ptr<const RoutingTable> build(const std::vector<EndpointDefinition>& endpoints,
                                                     uint64_t generation);

    /**
     * Exact match first, then the first matching pattern in registration order.
     *
     * @param method Upper-case HTTP method
     * @param path Request path without query string
     */
    std::optional<RouteMatch> resolve(const std::string& method, const std::string& path) const;

    /**
     * @brief Number of endpoints the table was built from
     */
    std::size_t size() const { return endpoints_.size(); }

    std::size_t countExact() const { return exact_.size(); }
    std::size_t countPatterns() const { return patterns_.size(); }

    /**
     * @brief Configuration generation, 0 for the empty startup table
     */
    uint64_t generation() const { return generation_; }
    const std::vector<std::shared_ptr<const EndpointDefinition>>& endpoints() const { return endpoints_; }

private:
    struct PatternEntry {
        std::string method;
        std::regex pattern;
        std::vector<std::string> variableNames;
        std::shared_ptr<const EndpointDefinition> endpoint;
    };

    RoutingTable() = default;

    static std::string makeKey(const std::string& method, const std::string& path);

    std::unordered_map<std::string, std::shared_ptr<const EndpointDefinition>> exact_;
    std::vector<PatternEntry> patterns_;
    std::vector<std::shared_ptr<const EndpointDefinition>> endpoints_;
    uint64_t generation_ = 0;
};

/**
 * Owner of the live routing table.
 *
 * Readers take a snapshot with one atomic load and resolve against it without
 * locks. Reloads parse and build a complete candidate table first and publish
 * it with a single atomic store; a failed reload leaves the live table as is.
 */
class EndpointRegistry {
public:
    /**
     * Starts with an empty generation 0 table; nothing resolves until the
     * first reload.
     */
    EndpointRegistry();

    /**
     * Resolve a request against the live table.
     *
     * @return The endpoint and its path variables, std::nullopt when no route matches
     */
    std::optional<RouteMatch> resolve(const std::string& method, const std::string& path) const;

    /**
     * Parse YAML source and swap in the resulting table.
     *
     * @return Number of endpoints in the new table, or a Configuration error
     */
    Result<std::size_t> reload(const std::string& yaml_source);

    /**
     * Same as reload() with the YAML read from a file.
     */
    Result<std::size_t> reloadFromFile(const std::filesystem::path& path);

    // Publish already parsed endpoints
    void publish(const std::vector<EndpointDefinition>& endpoints);

    /**
     * Compiles a routing table for the next generation without publishing it.
     * Route patterns that fail to compile are reported as a configuration error.
     */
    Result<std::shared_ptr<const RoutingTable>> prepare(const std::vector<EndpointDefinition>& endpoints);

    // Makes a prepared table the live one
    void activate(std::shared_ptr<const RoutingTable> table);

    /**
     * @brief The live table; stays valid for the caller even across a reload
     */
    std::shared_ptr<const RoutingTable> snapshot() const;

    /**
     * @brief Generation of the live table
     */
    uint64_t generation() const;

    // Epoch when no table has been published yet
    std::chrono::system_clock::time_point lastReloadTime() const;

private:
    Result<std::size_t> publishParsed(bool success, const std::vector<EndpointDefinition>& endpoints,
                                      const std::string& error_message, const std::string& origin);

    std::shared_ptr<const RoutingTable> table_;
    std::mutex reload_mutex_;    // serializes writers only
    std::atomic<uint64_t> next_generation_{1};
    std::atomic<std::chrono::system_clock::rep> last_reload_{0};
};

} // namespace querygate
