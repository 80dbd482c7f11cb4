#pragma once

#include <crow.h>
#include "crow/middlewares/cors.h"

#include <memory>
#include <mutex>
#include <string>

#include "admission_controller.hpp"
#include "config_manager.hpp"
#include "config_watcher.hpp"
#include "database_manager.hpp"
#include "endpoint_repository.hpp"
#include "request_dispatcher.hpp"
#include "request_handler.hpp"
#include "statement_catalog.hpp"
#include "worker_pool.hpp"

namespace querygate {

using GatewayApp = crow::App<crow::CORSHandler>;

/**
 * Wires the gateway together and owns its lifetime.
 *
 * Every endpoint request passes admission on the I/O thread, is resolved
 * against the live routing table and then completes asynchronously on the
 * worker pool under the request deadline.
 */
class APIServer
{
public:
    APIServer(std::shared_ptr<ConfigManager> config_manager,
              std::shared_ptr<StatementCatalog> catalog,
              std::shared_ptr<DatabaseManager> db_manager);
    ~APIServer();

    APIServer(const APIServer&) = delete;
    APIServer& operator=(const APIServer&) = delete;

    // Loads statements and endpoints; the initial load must succeed before run()
    Result<std::size_t> reloadConfiguration();

    crow::response health();
    crow::response reload();

    void handleGatewayRequest(const crow::request& req, crow::response& res);

    void run(int port = -1);
    void stop();

    EndpointRegistry& getRegistry() { return registry; }
    AdmissionController& getAdmissionController() { return admission; }

private:
    void setupRoutes();
    void setupCORS();
    void setupWatcher();

    crow::json::wvalue configurationHealth() const;
    crow::json::wvalue admissionHealth() const;

    static std::size_t workerCount(const BackpressureConfig& config);

    std::shared_ptr<ConfigManager> configManager;
    std::shared_ptr<StatementCatalog> catalog;
    std::shared_ptr<DatabaseManager> dbManager;

    EndpointRegistry registry;
    AdmissionController admission;
    WorkerPool workers;
    RequestDispatcher dispatcher;
    RequestHandler requestHandler;
    std::unique_ptr<ConfigWatcher> watcher;
    std::mutex reload_mutex;    // watcher thread and /admin/reload

    GatewayApp app;
};

} // namespace querygate
