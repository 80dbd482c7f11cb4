#pragma once

#include <map>
#include <string>

#include "error.hpp"
#include "gateway_request.hpp"
#include "value.hpp"

namespace querygate {

/**
 * Builds the single parameter object a statement runs against.
 *
 * Sources are merged in fixed order (path variables, query string, body)
 * and a later source overwrites an earlier one key by key. Query keys
 * seen once map to a string, repeated keys to a list of strings. A blank
 * body contributes nothing. The body is read according to Content-Type:
 * JSON, XML or form-urlencoded, with JSON as the fallback for anything else.
 */
class InputMerger {
public:
    static Result<Value> merge(const GatewayRequest& request,
                               const std::map<std::string, std::string>& path_variables);

    static Value parseQuery(const std::string& raw_url);
    static Result<Value> parseBody(const std::string& body, const std::string& content_type);

private:
    static constexpr std::size_t MAX_PAIRS_PER_PARSE = 256;

    static Result<Value> parseJsonBody(const std::string& body);
    static Value parseFormBody(const std::string& body);
    static Value collectParameters(const std::string& query_text);
    static void mergeInto(Value& target, const Value& source);
};

} // namespace querygate
