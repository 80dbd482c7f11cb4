#include "endpoint_repository.hpp"
#include "endpoint_config_parser.hpp"
#include "route_translator.hpp"

#include <crow/logging.h>

namespace querygate {

std::shared_ptr<const RoutingTable> RoutingTable::build(const std::vector<EndpointDefinition>& endpoints,
                                                        uint64_t generation) {
    std::shared_ptr<RoutingTable> table(new RoutingTable());
    table->generation_ = generation;

    for (const auto& definition : endpoints) {
        auto endpoint = std::make_shared<const EndpointDefinition>(definition);
        table->endpoints_.push_back(endpoint);

        if (endpoint->isTemplated()) {
            auto compiled = RouteTranslator::compile(endpoint->path);
            table->patterns_.push_back(PatternEntry{
                endpoint->method, std::move(compiled.pattern), std::move(compiled.variableNames), endpoint});
            CROW_LOG_DEBUG << "Registered pattern route " << endpoint->method << " " << endpoint->path;
            continue;
        }

        auto key = makeKey(endpoint->method, endpoint->path);
        if (table->exact_.count(key) > 0) {
            CROW_LOG_WARNING << "Duplicate endpoint " << key << ", the later definition replaces the earlier one";
        }
        table->exact_[key] = endpoint;
        CROW_LOG_DEBUG << "Registered exact route " << key;
    }

    return table;
}

std::optional<RouteMatch> RoutingTable::resolve(const std::string& method, const std::string& path) const {
    auto it = exact_.find(makeKey(method, path));
    if (it != exact_.end()) {
        return RouteMatch{it->second, {}};
    }

    std::smatch matches;
    for (const auto& entry : patterns_) {
        if (entry.method != method) {
            continue;
        }
        if (std::regex_match(path, matches, entry.pattern)) {
            RouteMatch match{entry.endpoint, {}};
            for (std::size_t i = 1; i < matches.size() && i <= entry.variableNames.size(); ++i) {
                match.pathVariables[entry.variableNames[i - 1]] = matches[i].str();
            }
            return match;
        }
    }
    return std::nullopt;
}

std::string RoutingTable::makeKey(const std::string& method, const std::string& path) {
    return method + ":" + path;
}

EndpointRegistry::EndpointRegistry()
    : table_(RoutingTable::build({}, 0))
{}

std::optional<RouteMatch> EndpointRegistry::resolve(const std::string& method, const std::string& path) const {
    return snapshot()->resolve(method, path);
}

Result<std::size_t> EndpointRegistry::reload(const std::string& yaml_source) {
    EndpointConfigParser parser;
    auto parsed = parser.parseFromString(yaml_source);
    return publishParsed(parsed.success, parsed.endpoints, parsed.error_message, "inline source");
}

Result<std::size_t> EndpointRegistry::reloadFromFile(const std::filesystem::path& path) {
    EndpointConfigParser parser;
    auto parsed = parser.parseFromFile(path);
    return publishParsed(parsed.success, parsed.endpoints, parsed.error_message, path.string());
}

Result<std::size_t> EndpointRegistry::publishParsed(bool success, const std::vector<EndpointDefinition>& endpoints,
                                                    const std::string& error_message, const std::string& origin) {
    if (!success) {
        CROW_LOG_ERROR << "Endpoint reload from " << origin << " failed, keeping generation "
                       << generation() << ": " << error_message;
        return Error::Config("Endpoint configuration rejected", error_message);
    }

    auto candidate = prepare(endpoints);
    if (!candidate) {
        CROW_LOG_ERROR << "Endpoint reload from " << origin << " failed to compile routes: "
                       << candidate.error().details;
        return std::move(candidate.error());
    }
    activate(std::move(*candidate));

    CROW_LOG_INFO << "Loaded " << endpoints.size() << " endpoints from " << origin
                  << " (generation " << generation() << ")";
    return endpoints.size();
}

void EndpointRegistry::publish(const std::vector<EndpointDefinition>& endpoints) {
    activate(RoutingTable::build(endpoints, next_generation_.fetch_add(1)));
}

Result<std::shared_ptr<const RoutingTable>> EndpointRegistry::prepare(const std::vector<EndpointDefinition>& endpoints) {
    try {
        return RoutingTable::build(endpoints, next_generation_.fetch_add(1));
    } catch (const std::regex_error& e) {
        return Error::Config("Endpoint configuration rejected", e.what());
    }
}

void EndpointRegistry::activate(std::shared_ptr<const RoutingTable> table) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store(&table_, std::move(table));
    last_reload_.store(std::chrono::system_clock::now().time_since_epoch().count());
}

std::shared_ptr<const RoutingTable> EndpointRegistry::snapshot() const {
    return std::atomic_load(&table_);
}

uint64_t EndpointRegistry::generation() const {
    return snapshot()->generation();
}

std::chrono::system_clock::time_point EndpointRegistry::lastReloadTime() const {
    return std::chrono::system_clock::time_point(std::chrono::system_clock::duration(last_reload_.load()));
}

} // namespace querygate
