#pragma once

#include "endpoint_definition.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <optional>
#include <yaml-cpp/yaml.h>

namespace querygate {

/**
 * @brief Parses the endpoint configuration file into endpoint definitions
 *
 * Parsing runs in two passes. A structural pass checks the shape of the
 * document (root map, endpoints list, entry maps, list/map typed sections)
 * before a semantic pass reads and checks individual fields. The first
 * failure of either pass aborts the parse; nothing partial is returned.
 *
 * The same parser is used for the initial load and for every hot reload.
 */
class EndpointConfigParser {
public:
    /**
     * @brief Result of parsing an endpoint configuration document
     */
    struct ParseResult {
        bool success = false;
        std::vector<EndpointDefinition> endpoints;
        std::string error_message;
        std::vector<std::string> warnings;
    };

    /**
     * @brief Construct a parser; it holds no state between calls
     */
    EndpointConfigParser() = default;

    /**
     * @brief Parse endpoint configuration from a YAML file
     *
     * @param yaml_file_path Path to the endpoint configuration file
     * @return ParseResult with the parsed endpoints or error details
     */
    ParseResult parseFromFile(const std::filesystem::path& yaml_file_path) const;

    /**
     * @brief Parse endpoint configuration from YAML content
     *
     * @param yaml_content YAML content as string
     * @return ParseResult with the parsed endpoints or error details
     */
    ParseResult parseFromString(const std::string& yaml_content) const;

    /**
     * @brief Convert a YAML node to a Value
     *
     * Scalars become integers, doubles or booleans where they parse as such,
     * strings otherwise.
     */
    static Value yamlToValue(const YAML::Node& node);

private:
    /**
     * @brief Run both passes over a loaded document and fill the result
     */
    void parseDocument(const YAML::Node& root, ParseResult& result) const;

    // Structural pass, returns a description of the first violation
    std::optional<std::string> checkStructure(const YAML::Node& root) const;

    /**
     * @brief Read one entry of the endpoints list
     *
     * @param node The entry map
     * @param yaml_path Location used in error messages, e.g. "endpoints[2]"
     * @param warnings Collects non-fatal problems such as an unknown response-format
     * @throws ConfigurationError on a missing or invalid field
     */
    EndpointDefinition parseEndpoint(const YAML::Node& node, const std::string& yaml_path,
                                     std::vector<std::string>& warnings) const;

    /**
     * @brief Read the validation section's required and optional parameter lists
     */
    ValidationSpec parseValidation(const YAML::Node& node, const std::string& yaml_path) const;

    /**
     * @brief Read one parameter spec; name is mandatory, type defaults to string
     */
    ParameterSpec parseParameter(const YAML::Node& node, const std::string& yaml_path) const;

    /**
     * @brief Read batch-config; item-key is mandatory, batch-size defaults to 100
     */
    BatchSpec parseBatch(const YAML::Node& node, const std::string& yaml_path) const;

    // Non-blank scalar or ConfigurationError naming the key
    static std::string requireText(const YAML::Node& node, const std::string& key, const std::string& yaml_path);
};

} // namespace querygate
