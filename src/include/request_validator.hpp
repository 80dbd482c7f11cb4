#pragma once

#include <functional>
#include <map>
#include <string>

#include "endpoint_definition.hpp"
#include "error.hpp"
#include "value.hpp"

namespace querygate {

/**
 * Checks merged parameters against an endpoint's declared parameters and
 * converts them to their declared types.
 *
 * All failures are collected before returning, so one response lists every
 * problem. Parameters that are not declared pass through untouched.
 */
class RequestValidator {
public:
    using Converter = std::function<Expected<Value, FieldError>(const Value&, const ParameterSpec&)>;

    RequestValidator();

    Result<Value> validate(const EndpointDefinition& endpoint, const Value& params) const;

    // Converts one present, non-blank value according to its type tag
    Expected<Value, FieldError> convert(const ParameterSpec& spec, const Value& value) const;

    static const std::string DEFAULT_DATE_FORMAT;
    static const std::string DEFAULT_DATETIME_FORMAT;

private:
    std::map<std::string, Converter> converters;

    static Expected<Value, FieldError> convertString(const Value& value, const ParameterSpec& spec);
    static Expected<Value, FieldError> convertInt(const Value& value, const ParameterSpec& spec);
    static Expected<Value, FieldError> convertLong(const Value& value, const ParameterSpec& spec);
    static Expected<Value, FieldError> convertNumber(const Value& value, const ParameterSpec& spec);
    static Expected<Value, FieldError> convertBoolean(const Value& value, const ParameterSpec& spec);
    static Expected<Value, FieldError> convertDate(const Value& value, const ParameterSpec& spec);
    static Expected<Value, FieldError> convertDateTime(const Value& value, const ParameterSpec& spec);
    static Expected<Value, FieldError> convertArray(const Value& value, const ParameterSpec& spec);

    static Expected<Value, FieldError> checkRange(const ParameterSpec& spec, Value converted);
    static Expected<Value, FieldError> parseTimestamp(const Value& value, const ParameterSpec& spec,
                                                      const std::string& default_format,
                                                      const std::string& output_format,
                                                      const std::string& kind);
};

} // namespace querygate
