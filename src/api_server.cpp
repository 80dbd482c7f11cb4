#include "api_server.hpp"
#include "endpoint_config_parser.hpp"
#include "gateway_request.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <optional>
#include <thread>

namespace querygate {

APIServer::APIServer(std::shared_ptr<ConfigManager> cm,
                     std::shared_ptr<StatementCatalog> statement_catalog,
                     std::shared_ptr<DatabaseManager> db_manager)
    : configManager(cm),
      catalog(std::move(statement_catalog)),
      dbManager(std::move(db_manager)),
      admission(cm->getSecurityConfig(), cm->getBackpressureConfig()),
      workers(workerCount(cm->getBackpressureConfig()), "pipeline"),
      dispatcher(workers, cm->getBackpressureConfig().request_timeout),
      requestHandler(dbManager, ResponseSerializer(cm->getErrorHandlingConfig()))
{
    setupRoutes();
    setupCORS();

    CROW_LOG_INFO << "APIServer initialized with " << workers.size() << " pipeline workers, request timeout "
                  << dispatcher.timeout().count() << " ms";
}

APIServer::~APIServer() {
    stop();
}

std::size_t APIServer::workerCount(const BackpressureConfig& config) {
    if (config.enabled && config.max_concurrent_requests > 0) {
        return static_cast<std::size_t>(config.max_concurrent_requests);
    }
    return std::max(4u, std::thread::hardware_concurrency() * 2);
}

void APIServer::setupRoutes() {
    CROW_LOG_INFO << "Setting up routes...";

    CROW_ROUTE(app, "/health")
        .methods("GET"_method)
        ([this](const crow::request& req, crow::response& res) {
            if (!admission.checkNetwork(GatewayRequest::fromCrow(req))) {
                res = Error::NetworkDenied(req.remote_ip_address).toHttpResponse();
            } else {
                res = health();
            }
            res.end();
        });

    CROW_ROUTE(app, "/admin/reload")
        .methods("POST"_method)
        ([this](const crow::request& req, crow::response& res) {
            auto permit = admission.admit(GatewayRequest::fromCrow(req));
            if (!permit) {
                res = permit.error().toHttpResponse();
            } else {
                CROW_LOG_INFO << "Configuration reload requested";
                res = reload();
            }
            res.end();
        });

    // Endpoint route, registered last so the fixed routes above win
    CROW_ROUTE(app, "/<path>")
        .methods("GET"_method, "POST"_method, "PUT"_method, "PATCH"_method, "DELETE"_method)
        ([this](const crow::request& req, crow::response& res, std::string /*path*/) {
            handleGatewayRequest(req, res);
        });

    CROW_LOG_INFO << "Routes set up completed";
}

void APIServer::setupCORS() {
    auto& cors = app.get_middleware<crow::CORSHandler>();
    cors.global()
        .headers("*")
        .methods("GET"_method, "POST"_method, "PUT"_method, "PATCH"_method, "DELETE"_method);
}

void APIServer::setupWatcher() {
    const auto& hot_reload = configManager->getHotReloadConfig();
    if (!hot_reload.enabled) {
        CROW_LOG_INFO << "Hot reload disabled";
        return;
    }

    std::vector<std::filesystem::path> watched{configManager->getEndpointConfigPath()};
    if (!configManager->getMapperLocations().empty()) {
        watched.push_back(configManager->getMapperLocations());
    }

    watcher = std::make_unique<ConfigWatcher>(watched, hot_reload.poll_interval, hot_reload.debounce, [this] {
        auto result = reloadConfiguration();
        if (!result) {
            CROW_LOG_ERROR << "Hot reload rejected, keeping generation " << registry.generation()
                           << ": " << result.error().describe();
        }
    });
    watcher->start();
}

Result<std::size_t> APIServer::reloadConfiguration() {
    std::lock_guard<std::mutex> lock(reload_mutex);

    // Both candidates are built before either goes live
    std::optional<StatementCatalog::StatementMap> statements;
    if (!configManager->getMapperLocations().empty()) {
        auto loaded = StatementCatalog::readDirectory(configManager->getMapperLocations());
        if (!loaded) {
            CROW_LOG_ERROR << "Reload rejected, keeping generation " << registry.generation()
                           << ": " << loaded.error().details;
            return std::move(loaded.error());
        }
        statements = std::move(*loaded);
    }

    EndpointConfigParser parser;
    auto parsed = parser.parseFromFile(configManager->getEndpointConfigPath());
    if (!parsed.success) {
        CROW_LOG_ERROR << "Reload rejected, keeping generation " << registry.generation()
                       << ": " << parsed.error_message;
        return Error::Config("Endpoint configuration rejected", parsed.error_message);
    }

    auto table = registry.prepare(parsed.endpoints);
    if (!table) {
        CROW_LOG_ERROR << "Reload rejected, keeping generation " << registry.generation()
                       << ": " << table.error().details;
        return std::move(table.error());
    }

    if (statements) {
        catalog->publish(std::move(*statements));
    }
    registry.activate(std::move(*table));

    CROW_LOG_INFO << "Configuration generation " << registry.generation() << " active with "
                  << parsed.endpoints.size() << " endpoints and " << catalog->size() << " statements";
    return parsed.endpoints.size();
}

void APIServer::handleGatewayRequest(const crow::request& req, crow::response& res) {
    auto request = GatewayRequest::fromCrow(req);
    request.method = toUpperString(request.method);

    auto permit = admission.admit(request);
    if (!permit) {
        CROW_LOG_WARNING << "Admission rejected " << request.method << " " << request.path
                         << ": " << permit.error().describe();
        res = permit.error().toHttpResponse();
        res.end();
        return;
    }

    auto match = registry.resolve(request.method, request.path);
    if (!match) {
        res = requestHandler.fail(nullptr, request, Error::NotFound(request.method, request.path));
        res.end();
        return;
    }

    auto endpoint = match->endpoint;
    auto path_variables = std::move(match->pathVariables);

    dispatcher.dispatch(
        std::move(*permit),
        [this, endpoint, request, path_variables] {
            return requestHandler.process(*endpoint, request, path_variables);
        },
        [this, endpoint, request] {
            admission.recordTimeout();
            return requestHandler.fail(endpoint.get(), request,
                                       Error::Timeout(dispatcher.timeout().count()));
        },
        [&res](crow::response&& response) {
            res = std::move(response);
            res.end();
        });
}

crow::response APIServer::health() {
    crow::json::wvalue body;
    bool database_up = dbManager && dbManager->ping();

    body["status"] = database_up ? "UP" : "DOWN";
    body["components"]["configuration"] = configurationHealth();
    body["components"]["database"]["status"] = database_up ? "UP" : "DOWN";
    body["components"]["admission"] = admissionHealth();

    return crow::response(database_up ? 200 : 503, body);
}

crow::json::wvalue APIServer::configurationHealth() const {
    auto table = registry.snapshot();
    const auto last_reload = std::chrono::duration_cast<std::chrono::milliseconds>(
        registry.lastReloadTime().time_since_epoch()).count();

    crow::json::wvalue section;
    section["status"] = "UP";
    section["generation"] = table->generation();
    section["endpoints"] = table->size();
    section["exactRoutes"] = table->countExact();
    section["patternRoutes"] = table->countPatterns();
    section["statements"] = catalog ? catalog->size() : 0;
    section["lastReloadEpochMs"] = last_reload;
    section["hotReload"] = watcher != nullptr;
    section["reloadCount"] = watcher ? watcher->reloadCount() : 0;
    return section;
}

crow::json::wvalue APIServer::admissionHealth() const {
    auto stats = admission.stats();

    crow::json::wvalue section;
    section["bounded"] = stats.bounded;
    section["active"] = stats.active;
    section["capacity"] = stats.capacity;
    section["admitted"] = stats.admitted;
    section["rejectedCapacity"] = stats.rejected_capacity;
    section["rejectedNetwork"] = stats.rejected_network;
    section["rejectedAuth"] = stats.rejected_auth;
    section["timedOut"] = stats.timed_out;
    section["lateCompletions"] = dispatcher.lateCompletions();
    return section;
}

crow::response APIServer::reload() {
    auto result = reloadConfiguration();
    crow::json::wvalue body;
    if (!result) {
        CROW_LOG_ERROR << "Failed to reload configuration: " << result.error().describe();
        body["success"] = false;
        body["error"] = result.error().getCategoryName();
        body["message"] = result.error().message;
        body["generation"] = registry.generation();
        return crow::response(500, body);
    }

    body["success"] = true;
    body["endpoints"] = *result;
    body["generation"] = registry.generation();
    return crow::response(200, body);
}

void APIServer::run(int port) {
    if (port > 0) {
        configManager->setHttpPort(port);
    }
    setupWatcher();

    const auto& server = configManager->getServerConfig();
    CROW_LOG_INFO << "Server starting on port " << configManager->getHttpPort() << "...";
    // Process signals are handled by main, which drains the pipeline before stopping
    app.signal_clear();
    app.port(configManager->getHttpPort())
       .server_name(server.name)
       .concurrency(static_cast<std::uint16_t>(std::max(1, server.io_threads)))
       .run();
}

void APIServer::stop() {
    if (watcher) {
        watcher->stop();
    }
    // Drain first so in-flight responses still reach their connections
    workers.shutdown();
    dispatcher.shutdown();
    app.stop();
}

} // namespace querygate
