#include "endpoint_definition.hpp"
#include "string_utils.hpp"

namespace querygate {

std::string sqlTypeName(SqlType type) {
    switch (type) {
        case SqlType::SELECT:
            return "SELECT";
        case SqlType::INSERT:
            return "INSERT";
        case SqlType::UPDATE:
            return "UPDATE";
        case SqlType::DELETE:
            return "DELETE";
        case SqlType::BATCH:
            return "BATCH";
    }
    return "UNKNOWN";
}

std::optional<SqlType> parseSqlType(const std::string& name) {
    const std::string upper = toUpperString(trimString(name));
    if (upper == "SELECT") return SqlType::SELECT;
    if (upper == "INSERT") return SqlType::INSERT;
    if (upper == "UPDATE") return SqlType::UPDATE;
    if (upper == "DELETE") return SqlType::DELETE;
    if (upper == "BATCH") return SqlType::BATCH;
    return std::nullopt;
}

std::optional<ResponseFormat> parseResponseFormat(const std::string& name) {
    const std::string upper = toUpperString(trimString(name));
    if (upper == "WRAPPED") return ResponseFormat::WRAPPED;
    if (upper == "RAW") return ResponseFormat::RAW;
    return std::nullopt;
}

bool EndpointDefinition::isTemplated() const {
    return path.find('{') != std::string::npos;
}

} // namespace querygate
