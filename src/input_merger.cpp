#include "input_merger.hpp"
#include "string_utils.hpp"
#include "xml_codec.hpp"

#include <crow/json.h>
#include <crow/logging.h>
#include <crow/query_string.h>
#include <algorithm>
#include <set>
#include <vector>

namespace querygate {

Result<Value> InputMerger::merge(const GatewayRequest& request,
                                 const std::map<std::string, std::string>& path_variables) {
    Value params = Value::object();

    for (const auto& [name, value] : path_variables) {
        params.set(name, Value(value));
    }

    mergeInto(params, parseQuery(request.raw_url));

    if (!trimString(request.body).empty()) {
        auto body = parseBody(request.body, request.getHeader("Content-Type"));
        if (!body) {
            return std::move(body.error());
        }
        mergeInto(params, *body);
    }

    return params;
}

Value InputMerger::parseQuery(const std::string& raw_url) {
    auto question = raw_url.find('?');
    if (question == std::string::npos) {
        return Value::object();
    }
    return collectParameters(raw_url.substr(question + 1));
}

Result<Value> InputMerger::parseBody(const std::string& body, const std::string& content_type) {
    const std::string type = toLowerString(content_type);

    if (type.find("json") != std::string::npos) {
        return parseJsonBody(body);
    }
    if (type.find("xml") != std::string::npos) {
        return XmlCodec::parse(body);
    }
    if (type.find("form-urlencoded") != std::string::npos) {
        return parseFormBody(body);
    }

    CROW_LOG_WARNING << "Unsupported content type '" << content_type << "', attempting to read body as JSON";
    return parseJsonBody(body);
}

Result<Value> InputMerger::parseJsonBody(const std::string& body) {
    auto json = crow::json::load(body);
    if (!json) {
        return Error::Parse("Invalid JSON format: malformed document", "application/json");
    }
    if (json.t() != crow::json::type::Object) {
        return Error::Parse("Invalid JSON format: expected an object", "application/json");
    }
    return Value::fromJson(json);
}

Value InputMerger::parseFormBody(const std::string& body) {
    return collectParameters(body);
}

Value InputMerger::collectParameters(const std::string& query_text) {
    std::vector<std::string> order;
    std::map<std::string, std::vector<std::string>> collected;

    // crow::query_string silently keeps only its first 256 pairs, so larger
    // inputs are decoded in slices
    const auto pairs = splitString(query_text, '&');
    for (std::size_t first = 0; first < pairs.size(); first += MAX_PAIRS_PER_PARSE) {
        const std::size_t last = std::min(pairs.size(), first + MAX_PAIRS_PER_PARSE);
        std::string slice = "?";
        for (std::size_t i = first; i < last; ++i) {
            if (i > first) {
                slice += '&';
            }
            slice += pairs[i];
        }

        crow::query_string query(slice);
        std::set<std::string> seen;
        for (const auto& key : query.keys()) {
            if (!seen.insert(key).second) {
                continue;
            }
            auto& values = collected[key];
            if (values.empty()) {
                order.push_back(key);
            }
            auto decoded = query.get_list(key, false);
            if (decoded.empty()) {
                // "?flag" with no '=' carries no value
                values.emplace_back(query.get(key) ? query.get(key) : "");
                continue;
            }
            for (const char* value : decoded) {
                values.emplace_back(value);
            }
        }
    }

    Value result = Value::object();
    for (const auto& key : order) {
        auto& values = collected[key];
        if (values.size() == 1) {
            result.set(key, Value(values.front()));
            continue;
        }
        Value list = Value::list();
        for (auto& value : values) {
            list.push_back(Value(std::move(value)));
        }
        result.set(key, std::move(list));
    }
    return result;
}

void InputMerger::mergeInto(Value& target, const Value& source) {
    if (!source.isObject()) {
        return;
    }
    for (const auto& key : source.keys()) {
        target.set(key, *source.find(key));
    }
}

} // namespace querygate
