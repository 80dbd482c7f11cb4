#include "config_manager.hpp"

#include <crow.h>

namespace querygate {

ConfigManager::ConfigManager(const std::filesystem::path& config_file)
    : config_file(config_file)
{}

void ConfigManager::loadConfig() {
    try {
        CROW_LOG_INFO << "Loading configuration file: " << config_file;

        if (!std::filesystem::exists(config_file)) {
            throw ConfigurationError("File does not exist: " + config_file.string());
        }
        config = YAML::LoadFile(config_file.string());
        if (!config.IsMap()) {
            throw ConfigurationError("Root element must be a map", config_file.string());
        }

        parseMainConfig();
        CROW_LOG_INFO << "Configuration loaded successfully";
    } catch (const YAML::Exception& e) {
        std::ostringstream error_msg;
        error_msg << "Error loading configuration file: " << config_file << ", Error: " << e.what();
        CROW_LOG_ERROR << error_msg.str();
        throw ConfigurationError(error_msg.str());
    }
}

void ConfigManager::parseMainConfig() {
    try {
        base_path = std::filesystem::absolute(config_file).parent_path();

        endpoint_config_path = resolvePath(safeGet<std::string>(
            config, "endpoint-config-path", "endpoint-config-path", std::string("./config/endpoint-config.yaml")));
        mapper_locations = resolvePath(safeGet<std::string>(
            config, "mapper-locations", "mapper-locations", std::string("./config/mappers")));

        CROW_LOG_DEBUG << "Endpoint config: " << endpoint_config_path;
        CROW_LOG_DEBUG << "Mapper locations: " << mapper_locations;

        parseServerConfig();
        parseDuckDBConfig();
        parseSecurityConfig();
        parseBackpressureConfig();
        parseHotReloadConfig();
        parseErrorHandlingConfig();
        parseSqlLoggingConfig();
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Error in parseMainConfig: " << e.what();
        throw;
    }
}

void ConfigManager::parseServerConfig() {
    auto node = config["server"];
    if (!node) {
        return;
    }
    server_config.name = safeGet<std::string>(node, "name", "server.name", server_config.name);
    server_config.port = safeGet<int>(node, "port", "server.port", server_config.port);
    server_config.io_threads = safeGet<int>(node, "io-threads", "server.io-threads", server_config.io_threads);

    if (server_config.port <= 0 || server_config.port > 65535) {
        throw ConfigurationError("Port must be between 1 and 65535", "server.port");
    }
    if (server_config.io_threads < 1) {
        throw ConfigurationError("At least one I/O thread is required", "server.io-threads");
    }
    CROW_LOG_DEBUG << "HTTP Port: " << server_config.port << ", I/O threads: " << server_config.io_threads;
}

void ConfigManager::parseDuckDBConfig() {
    auto node = config["duckdb"];
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigurationError("Expected a map", "duckdb");
    }

    for (const auto& setting : node) {
        std::string key = setting.first.as<std::string>();
        if (key == "db_path") {
            std::string db_path = setting.second.as<std::string>();
            duckdb_config.db_path = db_path == ":memory:" ? db_path : resolvePath(db_path).string();
            continue;
        }
        if (key == "init") {
            duckdb_config.init_sql = setting.second.as<std::string>();
            continue;
        }
        duckdb_config.settings[key] = setting.second.as<std::string>();
        CROW_LOG_DEBUG << "DuckDB setting: " << key << " = " << duckdb_config.settings[key];
    }
}

void ConfigManager::parseSecurityConfig() {
    auto node = config["security"];
    if (!node) {
        return;
    }
    security_config.enabled = safeGet<bool>(node, "enabled", "security.enabled", security_config.enabled);
    security_config.api_key_header = safeGet<std::string>(
        node, "api-key-header", "security.api-key-header", security_config.api_key_header);
    security_config.scheme_prefix = safeGet<std::string>(
        node, "scheme-prefix", "security.scheme-prefix", security_config.scheme_prefix);
    security_config.api_keys = safeGet<std::vector<std::string>>(
        node, "api-keys", "security.api-keys", security_config.api_keys);
    security_config.allowed_networks = safeGet<std::vector<std::string>>(
        node, "allowed-networks", "security.allowed-networks", security_config.allowed_networks);

    if (security_config.api_key_header.empty()) {
        throw ConfigurationError("Header name must not be empty", "security.api-key-header");
    }
    if (security_config.enabled && security_config.api_keys.empty()) {
        CROW_LOG_WARNING << "Security is enabled but no API keys are configured, all requests will be rejected";
    }
}

void ConfigManager::parseBackpressureConfig() {
    auto node = config["backpressure"];
    if (!node) {
        return;
    }
    auto& bp = backpressure_config;
    bp.enabled = safeGet<bool>(node, "enabled", "backpressure.enabled", bp.enabled);
    bp.max_concurrent_requests = safeGet<int>(
        node, "max-concurrent-requests", "backpressure.max-concurrent-requests", bp.max_concurrent_requests);
    bp.acquire_timeout = std::chrono::milliseconds(safeGet<long long>(
        node, "acquire-timeout-ms", "backpressure.acquire-timeout-ms", bp.acquire_timeout.count()));
    bp.request_timeout = std::chrono::milliseconds(safeGet<long long>(
        node, "request-timeout-ms", "backpressure.request-timeout-ms", bp.request_timeout.count()));
    bp.retry_after_seconds = safeGet<int>(
        node, "retry-after-seconds", "backpressure.retry-after-seconds", bp.retry_after_seconds);

    if (bp.max_concurrent_requests < 1) {
        throw ConfigurationError("Must be at least 1", "backpressure.max-concurrent-requests");
    }
    if (bp.acquire_timeout.count() < 0) {
        throw ConfigurationError("Must not be negative", "backpressure.acquire-timeout-ms");
    }
    if (bp.request_timeout.count() <= 0) {
        throw ConfigurationError("Must be positive", "backpressure.request-timeout-ms");
    }
}

void ConfigManager::parseHotReloadConfig() {
    auto node = config["hot-reload"];
    if (!node) {
        return;
    }
    auto& hr = hot_reload_config;
    hr.enabled = safeGet<bool>(node, "enabled", "hot-reload.enabled", hr.enabled);
    hr.poll_interval = std::chrono::milliseconds(safeGet<long long>(
        node, "poll-interval-ms", "hot-reload.poll-interval-ms", hr.poll_interval.count()));
    hr.debounce = std::chrono::milliseconds(safeGet<long long>(
        node, "debounce-ms", "hot-reload.debounce-ms", hr.debounce.count()));

    if (hr.poll_interval.count() <= 0) {
        throw ConfigurationError("Must be positive", "hot-reload.poll-interval-ms");
    }
}

void ConfigManager::parseErrorHandlingConfig() {
    auto node = config["error-handling"];
    if (!node) {
        return;
    }
    error_handling_config.expose_details = safeGet<bool>(
        node, "expose-details", "error-handling.expose-details", false);
    error_handling_config.expose_stack_trace = safeGet<bool>(
        node, "expose-stack-trace", "error-handling.expose-stack-trace", false);
}

void ConfigManager::parseSqlLoggingConfig() {
    auto node = config["sql-logging"];
    if (!node) {
        return;
    }
    auto& sl = sql_logging_config;
    sl.enabled = safeGet<bool>(node, "enabled", "sql-logging.enabled", sl.enabled);
    sl.log_parameters = safeGet<bool>(node, "log-parameters", "sql-logging.log-parameters", sl.log_parameters);
    sl.slow_query_threshold = std::chrono::milliseconds(safeGet<long long>(
        node, "slow-query-threshold-ms", "sql-logging.slow-query-threshold-ms", sl.slow_query_threshold.count()));
}

std::filesystem::path ConfigManager::resolvePath(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p.lexically_normal();
    }
    return (base_path / p).lexically_normal();
}

template<typename T>
T ConfigManager::safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const {
    if (!node[key]) {
        return defaultValue;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), path);
    }
}

} // namespace querygate
