#include <argparse/argparse.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <thread>

#include "api_server.hpp"
#include "config_manager.hpp"
#include "database_manager.hpp"
#include "statement_catalog.hpp"

using namespace querygate;

std::atomic<bool> should_exit(false);
std::shared_ptr<APIServer> api_server;

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

std::shared_ptr<ConfigManager> initializeConfig(const std::string& config_file) {
    auto config_manager = std::make_shared<ConfigManager>(std::filesystem::path(config_file));
    try {
        config_manager->loadConfig();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error while loading configuration, Details: " + std::string(e.what()));
    }
    return config_manager;
}

std::shared_ptr<DatabaseManager> initializeDatabase(std::shared_ptr<ConfigManager> config_manager,
                                                    std::shared_ptr<StatementCatalog> catalog) {
    auto db_manager = std::make_shared<DatabaseManager>(config_manager->getDuckDBConfig(),
                                                        config_manager->getSqlLoggingConfig(),
                                                        std::move(catalog));
    try {
        db_manager->initialize();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error creating database, Details: " + std::string(e.what()));
    }
    return db_manager;
}

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! querygate is giving up";

    auto ex = std::current_exception();
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        }
    }
    std::abort();
}

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        should_exit = true;
    }
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    static argparse::ArgumentParser program("querygate");

    program.add_argument("-c", "--config")
        .help("Path to the querygate.yaml configuration file")
        .default_value(std::string("querygate.yaml"));

    program.add_argument("-p", "--port")
        .help("Port number for the web server")
        .default_value(-1)
        .scan<'i', int>();

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string("info"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string config_file = program.get<std::string>("--config");
    int cmd_port = program.get<int>("--port");
    std::string log_level = program.get<std::string>("--log-level");

    set_log_level(log_level);

    std::shared_ptr<ConfigManager> config_manager;
    std::shared_ptr<DatabaseManager> db_manager;
    auto catalog = std::make_shared<StatementCatalog>();
    try {
        config_manager = initializeConfig(config_file);
        db_manager = initializeDatabase(config_manager, catalog);
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << e.what();
        return 1;
    }

    if (cmd_port != -1) {
        config_manager->setHttpPort(cmd_port);
    }

    api_server = std::make_shared<APIServer>(config_manager, catalog, db_manager);

    auto loaded = api_server->reloadConfiguration();
    if (!loaded) {
        CROW_LOG_ERROR << "Initial configuration load failed: " << loaded.error().describe();
        return 1;
    }

    std::thread server_thread([server = api_server]() {
        server->run();
        should_exit = true;
    });

    CROW_LOG_INFO << "querygate started on port " << config_manager->getHttpPort();

    // Signal handlers only flip the flag; shutdown runs here, outside signal context
    while (!should_exit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    CROW_LOG_INFO << "Shutdown requested, draining in-flight requests...";
    api_server->stop();
    server_thread.join();
    api_server.reset();

    return 0;
}
