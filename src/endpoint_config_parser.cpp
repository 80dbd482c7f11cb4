#include "endpoint_config_parser.hpp"
#include "config_manager.hpp"
#include "string_utils.hpp"

#include <crow/logging.h>

namespace querygate {

namespace {

const char* const kParameterLists[] = {"required", "optional"};

template<typename T>
std::optional<T> optionalAs(const YAML::Node& node, const std::string& key, const std::string& yaml_path) {
    if (!node[key]) {
        return std::nullopt;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), yaml_path + "." + key);
    }
}

} // namespace

EndpointConfigParser::ParseResult EndpointConfigParser::parseFromFile(
    const std::filesystem::path& yaml_file_path
) const {
    ParseResult result;

    try {
        if (!std::filesystem::exists(yaml_file_path)) {
            result.error_message = "Endpoint configuration file not found: " + yaml_file_path.string();
            return result;
        }
        YAML::Node root = YAML::LoadFile(yaml_file_path.string());
        parseDocument(root, result);
    } catch (const std::exception& e) {
        result.success = false;
        result.endpoints.clear();
        result.error_message = std::string("Exception during parsing: ") + e.what();
    }

    return result;
}

EndpointConfigParser::ParseResult EndpointConfigParser::parseFromString(
    const std::string& yaml_content
) const {
    ParseResult result;

    try {
        YAML::Node root = YAML::Load(yaml_content);
        parseDocument(root, result);
    } catch (const std::exception& e) {
        result.success = false;
        result.endpoints.clear();
        result.error_message = std::string("Exception during parsing: ") + e.what();
    }

    return result;
}

void EndpointConfigParser::parseDocument(const YAML::Node& root, ParseResult& result) const {
    if (auto violation = checkStructure(root)) {
        result.success = false;
        result.error_message = "Schema validation failed: " + *violation;
        return;
    }

    const auto& entries = root["endpoints"];
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::string yaml_path = "endpoints[" + std::to_string(i) + "]";
        result.endpoints.push_back(parseEndpoint(entries[i], yaml_path, result.warnings));
    }

    for (const auto& warning : result.warnings) {
        CROW_LOG_WARNING << warning;
    }
    result.success = true;
}

std::optional<std::string> EndpointConfigParser::checkStructure(const YAML::Node& root) const {
    if (!root || !root.IsMap()) {
        return std::string("document root must be a map");
    }
    const auto& entries = root["endpoints"];
    if (!entries) {
        return std::string("missing 'endpoints' list");
    }
    if (!entries.IsSequence()) {
        return std::string("'endpoints' must be a list");
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::string yaml_path = "endpoints[" + std::to_string(i) + "]";
        const auto& entry = entries[i];
        if (!entry.IsMap()) {
            return yaml_path + " must be a map";
        }

        for (const char* key : {"path", "method", "sql-id", "sql-type", "description", "response-format"}) {
            if (entry[key] && !entry[key].IsScalar()) {
                return yaml_path + "." + key + " must be a scalar";
            }
        }

        if (const auto& validation = entry["validation"]) {
            if (!validation.IsMap()) {
                return yaml_path + ".validation must be a map";
            }
            for (const char* list : kParameterLists) {
                const auto& params = validation[list];
                if (!params) {
                    continue;
                }
                if (!params.IsSequence()) {
                    return yaml_path + ".validation." + list + " must be a list";
                }
                for (std::size_t p = 0; p < params.size(); ++p) {
                    if (!params[p].IsMap()) {
                        return yaml_path + ".validation." + list + "[" + std::to_string(p) + "] must be a map";
                    }
                }
            }
        }

        if (const auto& batch = entry["batch-config"]) {
            if (!batch.IsMap()) {
                return yaml_path + ".batch-config must be a map";
            }
        }
    }
    return std::nullopt;
}

EndpointDefinition EndpointConfigParser::parseEndpoint(const YAML::Node& node, const std::string& yaml_path,
                                                       std::vector<std::string>& warnings) const {
    EndpointDefinition endpoint;
    endpoint.path = requireText(node, "path", yaml_path);
    endpoint.method = toUpperString(requireText(node, "method", yaml_path));
    endpoint.statementId = requireText(node, "sql-id", yaml_path);

    const std::string sql_type = requireText(node, "sql-type", yaml_path);
    auto parsed_type = parseSqlType(sql_type);
    if (!parsed_type) {
        throw ConfigurationError("Invalid sql-type '" + sql_type +
                                 "', expected one of SELECT, INSERT, UPDATE, DELETE, BATCH",
                                 yaml_path + ".sql-type");
    }
    endpoint.sqlType = *parsed_type;

    if (node["description"]) {
        endpoint.description = node["description"].as<std::string>();
    }

    if (node["response-format"]) {
        const std::string format = node["response-format"].as<std::string>();
        if (auto parsed = parseResponseFormat(format)) {
            endpoint.responseFormat = *parsed;
        } else {
            warnings.push_back("Invalid response-format '" + format + "' at " + yaml_path +
                               ", falling back to WRAPPED");
        }
    }

    if (node["validation"]) {
        endpoint.validation = parseValidation(node["validation"], yaml_path + ".validation");
    }

    if (node["batch-config"]) {
        endpoint.batch = parseBatch(node["batch-config"], yaml_path + ".batch-config");
    } else if (endpoint.sqlType == SqlType::BATCH) {
        warnings.push_back("BATCH endpoint " + endpoint.method + " " + endpoint.path +
                           " has no batch-config, requests to it will be rejected");
    }

    CROW_LOG_DEBUG << "Parsed endpoint " << endpoint.method << " " << endpoint.path
                   << " -> " << endpoint.statementId << " (" << sqlTypeName(endpoint.sqlType) << ")";
    return endpoint;
}

ValidationSpec EndpointConfigParser::parseValidation(const YAML::Node& node, const std::string& yaml_path) const {
    ValidationSpec spec;
    if (const auto& required = node["required"]) {
        for (std::size_t i = 0; i < required.size(); ++i) {
            spec.required.push_back(parseParameter(required[i], yaml_path + ".required[" + std::to_string(i) + "]"));
        }
    }
    if (const auto& optional = node["optional"]) {
        for (std::size_t i = 0; i < optional.size(); ++i) {
            spec.optional.push_back(parseParameter(optional[i], yaml_path + ".optional[" + std::to_string(i) + "]"));
        }
    }
    return spec;
}

ParameterSpec EndpointConfigParser::parseParameter(const YAML::Node& node, const std::string& yaml_path) const {
    ParameterSpec param;
    param.name = requireText(node, "name", yaml_path);
    param.type = toLowerString(optionalAs<std::string>(node, "type", yaml_path).value_or("string"));
    param.source = optionalAs<std::string>(node, "source", yaml_path);

    param.minLength = optionalAs<std::size_t>(node, "min-length", yaml_path);
    param.maxLength = optionalAs<std::size_t>(node, "max-length", yaml_path);
    param.pattern = optionalAs<std::string>(node, "pattern", yaml_path);
    if (param.pattern) {
        try {
            param.compiledPattern = std::make_shared<const std::regex>(*param.pattern);
        } catch (const std::regex_error& e) {
            throw ConfigurationError("Invalid pattern '" + *param.pattern + "': " + e.what(), yaml_path + ".pattern");
        }
    }
    param.allowedValues = optionalAs<std::vector<std::string>>(node, "allowed-values", yaml_path)
                              .value_or(std::vector<std::string>{});

    param.min = optionalAs<double>(node, "min", yaml_path);
    param.max = optionalAs<double>(node, "max", yaml_path);
    param.format = optionalAs<std::string>(node, "format", yaml_path);
    param.minItems = optionalAs<std::size_t>(node, "min-items", yaml_path);
    param.maxItems = optionalAs<std::size_t>(node, "max-items", yaml_path);

    if (node["default"] && !node["default"].IsNull()) {
        param.defaultValue = yamlToValue(node["default"]);
    }
    return param;
}

BatchSpec EndpointConfigParser::parseBatch(const YAML::Node& node, const std::string& yaml_path) const {
    BatchSpec batch;
    batch.itemKey = requireText(node, "item-key", yaml_path);
    if (auto size = optionalAs<long long>(node, "batch-size", yaml_path)) {
        if (*size < 1) {
            throw ConfigurationError("batch-size must be at least 1", yaml_path + ".batch-size");
        }
        batch.chunkSize = static_cast<std::size_t>(*size);
    }
    return batch;
}

std::string EndpointConfigParser::requireText(const YAML::Node& node, const std::string& key,
                                              const std::string& yaml_path) {
    if (!node[key] || node[key].IsNull()) {
        throw ConfigurationError("Missing required key: " + key, yaml_path);
    }
    if (!node[key].IsScalar()) {
        throw ConfigurationError("Key must be a scalar: " + key, yaml_path + "." + key);
    }
    std::string value = trimString(node[key].as<std::string>());
    if (value.empty()) {
        throw ConfigurationError("Key must not be blank: " + key, yaml_path + "." + key);
    }
    return value;
}

Value EndpointConfigParser::yamlToValue(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return Value();
    }
    if (node.IsSequence()) {
        Value list = Value::list();
        for (const auto& item : node) {
            list.push_back(yamlToValue(item));
        }
        return list;
    }
    if (node.IsMap()) {
        Value object = Value::object();
        for (const auto& item : node) {
            object.set(item.first.as<std::string>(), yamlToValue(item.second));
        }
        return object;
    }

    const std::string text = node.Scalar();
    // Quoted scalars carry the non-specific tag "!" and stay strings
    if (node.Tag() == "!") {
        return Value(text);
    }
    if (text == "true" || text == "false") {
        return Value(text == "true");
    }
    int64_t integer = 0;
    if (YAML::convert<int64_t>::decode(node, integer)) {
        return Value(integer);
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return Value(number);
    }
    return Value(text);
}

} // namespace querygate
