#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "value.hpp"

namespace querygate {

enum class SqlType {
    SELECT,
    INSERT,
    UPDATE,
    DELETE,
    BATCH
};

enum class ResponseFormat {
    WRAPPED,
    RAW
};

std::string sqlTypeName(SqlType type);
std::optional<SqlType> parseSqlType(const std::string& name);

std::optional<ResponseFormat> parseResponseFormat(const std::string& name);

/**
 * Declared parameter with its type tag and constraints.
 * Constraints that do not apply to the type tag are ignored.
 */
struct ParameterSpec {
    std::string name;
    std::string type = "string";
    std::optional<std::string> source;   // informational hint: path, query or body

    std::optional<size_t> minLength;
    std::optional<size_t> maxLength;
    std::optional<std::string> pattern;
    std::shared_ptr<const std::regex> compiledPattern;
    std::vector<std::string> allowedValues;

    std::optional<double> min;
    std::optional<double> max;

    std::optional<std::string> format;   // strftime style, for date and datetime

    std::optional<size_t> minItems;
    std::optional<size_t> maxItems;

    std::optional<Value> defaultValue;
};

struct ValidationSpec {
    std::vector<ParameterSpec> required;
    std::vector<ParameterSpec> optional;
};

struct BatchSpec {
    std::string itemKey;
    size_t chunkSize = 100;
};

/**
 * One (method, path template) mapped to a catalog statement.
 * Built by the config parser and never mutated afterwards.
 */
struct EndpointDefinition {
    std::string path;
    std::string method;
    std::string statementId;
    SqlType sqlType = SqlType::SELECT;
    std::string description;
    std::optional<ValidationSpec> validation;
    std::optional<BatchSpec> batch;
    ResponseFormat responseFormat = ResponseFormat::WRAPPED;

    bool isTemplated() const;
};

} // namespace querygate
