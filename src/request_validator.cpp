#include "request_validator.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iomanip>
#include <limits>
#include <sstream>

namespace querygate {

const std::string RequestValidator::DEFAULT_DATE_FORMAT = "%Y-%m-%d";
const std::string RequestValidator::DEFAULT_DATETIME_FORMAT = "%Y-%m-%dT%H:%M:%S";

namespace {

FieldError fieldError(const ParameterSpec& spec, std::string message) {
    return FieldError{spec.name, std::move(message)};
}

// Whole-string signed integer, optional leading sign
bool parseInteger(const std::string& text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    std::size_t start = (text[0] == '+' || text[0] == '-') ? 1 : 0;
    if (start == text.size() || text.find_first_not_of("0123456789", start) != std::string::npos) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(parsed);
    return true;
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || *end != '\0') {
        return false;
    }
    out = parsed;
    return true;
}

bool toInteger(const Value& value, int64_t& out) {
    if (value.isDouble()) {
        // 2^63 itself is not representable as int64_t
        const double d = value.asDouble();
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return false;
        }
        out = static_cast<int64_t>(d);
        return true;
    }
    if (value.isInteger()) {
        out = value.asInt();
        return true;
    }
    return parseInteger(trimString(value.toString()), out);
}

bool toDouble(const Value& value, double& out) {
    if (value.isNumber()) {
        out = value.asDouble();
        return true;
    }
    return parseDouble(trimString(value.toString()), out);
}

std::string formatBound(double bound) {
    return fmt::format("{}", bound);
}

std::string joinAllowed(const std::vector<std::string>& values) {
    return "[" + fmt::format("{}", fmt::join(values, ", ")) + "]";
}

} // namespace

RequestValidator::RequestValidator() {
    converters["string"] = &RequestValidator::convertString;
    converters["integer"] = &RequestValidator::convertInt;
    converters["int"] = &RequestValidator::convertInt;
    converters["long"] = &RequestValidator::convertLong;
    converters["double"] = &RequestValidator::convertNumber;
    converters["float"] = &RequestValidator::convertNumber;
    converters["number"] = &RequestValidator::convertNumber;
    converters["boolean"] = &RequestValidator::convertBoolean;
    converters["bool"] = &RequestValidator::convertBoolean;
    converters["date"] = &RequestValidator::convertDate;
    converters["datetime"] = &RequestValidator::convertDateTime;
    converters["array"] = &RequestValidator::convertArray;
    converters["list"] = &RequestValidator::convertArray;
}

Result<Value> RequestValidator::validate(const EndpointDefinition& endpoint, const Value& params) const {
    if (!endpoint.validation) {
        return params;
    }

    Value validated = params;
    std::vector<FieldError> errors;

    for (const auto& spec : endpoint.validation->required) {
        const Value* value = validated.find(spec.name);
        if (!value || value->isBlank()) {
            errors.push_back(fieldError(spec, "Required parameter '" + spec.name + "' is missing"));
            continue;
        }
        auto converted = convert(spec, *value);
        if (!converted) {
            errors.push_back(converted.error());
            continue;
        }
        validated.set(spec.name, std::move(*converted));
    }

    for (const auto& spec : endpoint.validation->optional) {
        const Value* value = validated.find(spec.name);
        if (!value || value->isBlank()) {
            if (spec.defaultValue) {
                validated.set(spec.name, *spec.defaultValue);
            } else if (value) {
                validated.erase(spec.name);
            }
            continue;
        }
        auto converted = convert(spec, *value);
        if (!converted) {
            errors.push_back(converted.error());
            continue;
        }
        validated.set(spec.name, std::move(*converted));
    }

    if (!errors.empty()) {
        return Error::Validation(std::move(errors));
    }
    return validated;
}

Expected<Value, FieldError> RequestValidator::convert(const ParameterSpec& spec, const Value& value) const {
    auto it = converters.find(toLowerString(spec.type));
    if (it == converters.end()) {
        return value;
    }
    return it->second(value, spec);
}

Expected<Value, FieldError> RequestValidator::convertString(const Value& value, const ParameterSpec& spec) {
    const std::string text = value.toString();

    if (spec.minLength && text.size() < *spec.minLength) {
        return fieldError(spec, fmt::format("Parameter '{}' must be at least {} characters (got {})",
                                            spec.name, *spec.minLength, text.size()));
    }
    if (spec.maxLength && text.size() > *spec.maxLength) {
        return fieldError(spec, fmt::format("Parameter '{}' must be at most {} characters (got {})",
                                            spec.name, *spec.maxLength, text.size()));
    }
    if (spec.compiledPattern && !std::regex_match(text, *spec.compiledPattern)) {
        return fieldError(spec, fmt::format("Parameter '{}' does not match required pattern '{}'",
                                            spec.name, spec.pattern.value_or("")));
    }
    if (!spec.allowedValues.empty() &&
        std::find(spec.allowedValues.begin(), spec.allowedValues.end(), text) == spec.allowedValues.end()) {
        return fieldError(spec, fmt::format("Parameter '{}' must be one of: {} (got '{}')",
                                            spec.name, joinAllowed(spec.allowedValues), text));
    }
    return Value(text);
}

Expected<Value, FieldError> RequestValidator::convertInt(const Value& value, const ParameterSpec& spec) {
    int64_t parsed = 0;
    if (!toInteger(value, parsed) || parsed < std::numeric_limits<int32_t>::min() || parsed > std::numeric_limits<int32_t>::max()) {
        return fieldError(spec, fmt::format("Parameter '{}' must be a valid integer (got '{}')",
                                            spec.name, value.toString()));
    }
    return checkRange(spec, Value(parsed));
}

Expected<Value, FieldError> RequestValidator::convertLong(const Value& value, const ParameterSpec& spec) {
    int64_t parsed = 0;
    if (!toInteger(value, parsed)) {
        return fieldError(spec, fmt::format("Parameter '{}' must be a valid long integer (got '{}')",
                                            spec.name, value.toString()));
    }
    return checkRange(spec, Value(parsed));
}

Expected<Value, FieldError> RequestValidator::convertNumber(const Value& value, const ParameterSpec& spec) {
    double parsed = 0.0;
    if (!toDouble(value, parsed)) {
        return fieldError(spec, fmt::format("Parameter '{}' must be a valid number (got '{}')",
                                            spec.name, value.toString()));
    }
    return checkRange(spec, Value(parsed));
}

Expected<Value, FieldError> RequestValidator::checkRange(const ParameterSpec& spec, Value converted) {
    const double number = converted.asDouble();
    if (spec.min && number < *spec.min) {
        return fieldError(spec, fmt::format("Parameter '{}' must be at least {} (got {})",
                                            spec.name, formatBound(*spec.min), converted.toString()));
    }
    if (spec.max && number > *spec.max) {
        return fieldError(spec, fmt::format("Parameter '{}' must be at most {} (got {})",
                                            spec.name, formatBound(*spec.max), converted.toString()));
    }
    return converted;
}

Expected<Value, FieldError> RequestValidator::convertBoolean(const Value& value, const ParameterSpec& spec) {
    if (value.isBool()) {
        return value;
    }
    const std::string text = toLowerString(trimString(value.toString()));
    if (text == "true" || text == "1" || text == "yes" || text == "on") {
        return Value(true);
    }
    if (text == "false" || text == "0" || text == "no" || text == "off") {
        return Value(false);
    }
    return fieldError(spec, fmt::format("Parameter '{}' must be a valid boolean (got '{}')",
                                        spec.name, value.toString()));
}

Expected<Value, FieldError> RequestValidator::convertDate(const Value& value, const ParameterSpec& spec) {
    return parseTimestamp(value, spec, DEFAULT_DATE_FORMAT, "%Y-%m-%d", "date");
}

Expected<Value, FieldError> RequestValidator::convertDateTime(const Value& value, const ParameterSpec& spec) {
    return parseTimestamp(value, spec, DEFAULT_DATETIME_FORMAT, "%Y-%m-%dT%H:%M:%S", "datetime");
}

Expected<Value, FieldError> RequestValidator::parseTimestamp(const Value& value, const ParameterSpec& spec,
                                                             const std::string& default_format,
                                                             const std::string& output_format,
                                                             const std::string& kind) {
    const std::string format = spec.format.value_or(default_format);
    const std::string text = trimString(value.toString());
    auto failure = [&] {
        return fieldError(spec, fmt::format("Parameter '{}' must be a valid {} in format '{}' (got '{}')",
                                            spec.name, kind, format, value.toString()));
    };

    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, format.c_str());
    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        return failure();
    }

    // Reject calendar dates that do not exist, e.g. 2024-02-30
    std::tm normalized = tm;
    normalized.tm_isdst = 0;
    timegm(&normalized);
    if (normalized.tm_mday != tm.tm_mday || normalized.tm_mon != tm.tm_mon || normalized.tm_year != tm.tm_year) {
        return failure();
    }

    std::ostringstream out;
    out << std::put_time(&tm, output_format.c_str());
    return Value(out.str());
}

Expected<Value, FieldError> RequestValidator::convertArray(const Value& value, const ParameterSpec& spec) {
    Value list = Value::list();
    if (value.isList()) {
        list = value;
    } else if (value.isString()) {
        for (auto& piece : splitString(value.asString(), ',')) {
            list.push_back(Value(std::move(piece)));
        }
    } else {
        list.push_back(value);
    }

    if (spec.minItems && list.size() < *spec.minItems) {
        return fieldError(spec, fmt::format("Parameter '{}' must have at least {} items (got {})",
                                            spec.name, *spec.minItems, list.size()));
    }
    if (spec.maxItems && list.size() > *spec.maxItems) {
        return fieldError(spec, fmt::format("Parameter '{}' must have at most {} items (got {})",
                                            spec.name, *spec.maxItems, list.size()));
    }
    return list;
}

} // namespace querygate
