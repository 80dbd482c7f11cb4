#pragma once

#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace querygate {

struct ServerConfig {
    std::string name = "querygate";
    int port = 8080;
    int io_threads = 2;
};

struct DuckDBConfig {
    std::string db_path = ":memory:";
    std::string init_sql;    // run once after the database is opened
    std::unordered_map<std::string, std::string> settings;
};

struct SecurityConfig {
    bool enabled = true;
    std::string api_key_header = "X-API-Key";
    std::string scheme_prefix = "Key ";
    std::vector<std::string> api_keys;
    std::vector<std::string> allowed_networks = {"127.0.0.1", "::1"};
};

struct BackpressureConfig {
    bool enabled = true;
    int max_concurrent_requests = 100;
    std::chrono::milliseconds acquire_timeout{100};
    std::chrono::milliseconds request_timeout{30000};
    int retry_after_seconds = 5;
};

struct HotReloadConfig {
    bool enabled = true;
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds debounce{100};
};

struct ErrorHandlingConfig {
    bool expose_details = false;
    bool expose_stack_trace = false;
};

struct SqlLoggingConfig {
    bool enabled = true;
    bool log_parameters = true;
    std::chrono::milliseconds slow_query_threshold{1000};
};

/**
 * Loads the gateway file (querygate.yaml).
 *
 * Relative paths are resolved against the directory of the gateway file.
 * Sections that are absent keep their defaults; keys with the wrong type
 * raise a ConfigurationError naming the YAML path.
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_file);

    void loadConfig();

    const ServerConfig& getServerConfig() const { return server_config; }
    const DuckDBConfig& getDuckDBConfig() const { return duckdb_config; }
    const SecurityConfig& getSecurityConfig() const { return security_config; }
    const BackpressureConfig& getBackpressureConfig() const { return backpressure_config; }
    const HotReloadConfig& getHotReloadConfig() const { return hot_reload_config; }
    const ErrorHandlingConfig& getErrorHandlingConfig() const { return error_handling_config; }
    const SqlLoggingConfig& getSqlLoggingConfig() const { return sql_logging_config; }

    std::filesystem::path getEndpointConfigPath() const { return endpoint_config_path; }
    std::filesystem::path getMapperLocations() const { return mapper_locations; }
    std::filesystem::path getBasePath() const { return base_path; }

    int getHttpPort() const { return server_config.port; }
    void setHttpPort(int port) { server_config.port = port; }

private:
    std::filesystem::path config_file;
    std::filesystem::path base_path;
    YAML::Node config;

    ServerConfig server_config;
    DuckDBConfig duckdb_config;
    SecurityConfig security_config;
    BackpressureConfig backpressure_config;
    HotReloadConfig hot_reload_config;
    ErrorHandlingConfig error_handling_config;
    SqlLoggingConfig sql_logging_config;
    std::filesystem::path endpoint_config_path;
    std::filesystem::path mapper_locations;

    void parseMainConfig();
    void parseServerConfig();
    void parseDuckDBConfig();
    void parseSecurityConfig();
    void parseBackpressureConfig();
    void parseHotReloadConfig();
    void parseErrorHandlingConfig();
    void parseSqlLoggingConfig();

    std::filesystem::path resolvePath(const std::string& path) const;

    template<typename T>
    T safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const;
};

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message, const std::string& yamlPath = "")
        : std::runtime_error(formatMessage(message, yamlPath)) {}

private:
    static std::string formatMessage(const std::string& message, const std::string& yamlPath) {
        std::ostringstream oss;
        oss << "Configuration error";
        if (!yamlPath.empty()) {
            oss << " at " << yamlPath;
        }
        oss << ": " << message;
        return oss.str();
    }
};

} // namespace querygate
