#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "config_manager.hpp"
#include "test_utils.hpp"

using namespace querygate;
using namespace querygate::test;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ConfigManager: defaults for absent sections", "[config][config_manager]") {
    TempTestConfig env;
    auto mgr = env.createConfigManager();

    REQUIRE(mgr->getHttpPort() == 8080);
    REQUIRE(mgr->getServerConfig().io_threads == 2);
    REQUIRE(mgr->getDuckDBConfig().db_path == ":memory:");

    const auto& security = mgr->getSecurityConfig();
    REQUIRE(security.enabled);
    REQUIRE(security.api_key_header == "X-API-Key");
    REQUIRE(security.scheme_prefix == "Key ");
    REQUIRE(security.allowed_networks == std::vector<std::string>{"127.0.0.1", "::1"});

    const auto& bp = mgr->getBackpressureConfig();
    REQUIRE(bp.enabled);
    REQUIRE(bp.max_concurrent_requests == 100);
    REQUIRE(bp.acquire_timeout == std::chrono::milliseconds(100));
    REQUIRE(bp.request_timeout == std::chrono::milliseconds(30000));
    REQUIRE(bp.retry_after_seconds == 5);

    REQUIRE(mgr->getHotReloadConfig().enabled);
    REQUIRE(mgr->getHotReloadConfig().debounce == std::chrono::milliseconds(100));
    REQUIRE_FALSE(mgr->getErrorHandlingConfig().expose_details);
    REQUIRE_FALSE(mgr->getErrorHandlingConfig().expose_stack_trace);
    REQUIRE(mgr->getSqlLoggingConfig().slow_query_threshold == std::chrono::milliseconds(1000));
}

TEST_CASE("ConfigManager: relative paths resolve against the config file", "[config][config_manager]") {
    TempTestConfig env;
    auto mgr = env.createConfigManager();

    auto base = std::filesystem::absolute(env.dirPath()).lexically_normal();
    REQUIRE(mgr->getEndpointConfigPath() == base / "endpoint-config.yaml");
    REQUIRE(mgr->getMapperLocations() == base / "mappers");
}

TEST_CASE("ConfigManager: full configuration", "[config][config_manager]") {
    TempTestConfig env(R"(
server:
  name: edge-gateway
  port: 9090
  io-threads: 4
endpoint-config-path: /etc/querygate/endpoints.yaml
mapper-locations: ./mappers
duckdb:
  db_path: ":memory:"
  threads: 2
  init: CREATE TABLE t (id INTEGER)
security:
  enabled: false
  api-key-header: Authorization
  scheme-prefix: "Bearer "
  api-keys: [alpha, beta]
  allowed-networks: [10.0.0.0/8]
backpressure:
  enabled: true
  max-concurrent-requests: 8
  acquire-timeout-ms: 0
  request-timeout-ms: 2500
  retry-after-seconds: 2
hot-reload:
  enabled: false
  poll-interval-ms: 250
  debounce-ms: 50
error-handling:
  expose-details: true
  expose-stack-trace: true
sql-logging:
  enabled: false
  log-parameters: false
  slow-query-threshold-ms: 20
)", "querygate_full");

    auto mgr = env.createConfigManager();

    REQUIRE(mgr->getServerConfig().name == "edge-gateway");
    REQUIRE(mgr->getHttpPort() == 9090);
    REQUIRE(mgr->getServerConfig().io_threads == 4);
    REQUIRE(mgr->getEndpointConfigPath() == std::filesystem::path("/etc/querygate/endpoints.yaml"));

    REQUIRE(mgr->getDuckDBConfig().settings.at("threads") == "2");
    REQUIRE(mgr->getDuckDBConfig().settings.count("init") == 0);
    REQUIRE(mgr->getDuckDBConfig().init_sql == "CREATE TABLE t (id INTEGER)");

    const auto& security = mgr->getSecurityConfig();
    REQUIRE_FALSE(security.enabled);
    REQUIRE(security.api_key_header == "Authorization");
    REQUIRE(security.scheme_prefix == "Bearer ");
    REQUIRE(security.api_keys == std::vector<std::string>{"alpha", "beta"});
    REQUIRE(security.allowed_networks == std::vector<std::string>{"10.0.0.0/8"});

    const auto& bp = mgr->getBackpressureConfig();
    REQUIRE(bp.max_concurrent_requests == 8);
    REQUIRE(bp.acquire_timeout.count() == 0);
    REQUIRE(bp.request_timeout == std::chrono::milliseconds(2500));
    REQUIRE(bp.retry_after_seconds == 2);

    REQUIRE_FALSE(mgr->getHotReloadConfig().enabled);
    REQUIRE(mgr->getHotReloadConfig().poll_interval == std::chrono::milliseconds(250));
    REQUIRE(mgr->getErrorHandlingConfig().expose_details);
    REQUIRE(mgr->getErrorHandlingConfig().expose_stack_trace);
    REQUIRE_FALSE(mgr->getSqlLoggingConfig().enabled);
    REQUIRE(mgr->getSqlLoggingConfig().slow_query_threshold == std::chrono::milliseconds(20));

    SECTION("Command line port override") {
        mgr->setHttpPort(7000);
        REQUIRE(mgr->getHttpPort() == 7000);
    }
}

TEST_CASE("ConfigManager: invalid configuration", "[config][config_manager]") {
    auto load_fails = [](const std::string& yaml, const std::string& fragment) {
        TempTestConfig env(yaml, "querygate_invalid");
        ConfigManager mgr(env.configPath());
        try {
            mgr.loadConfig();
            FAIL("Expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE_THAT(e.what(), ContainsSubstring(fragment));
        }
    };

    SECTION("Wrong value type names the YAML path") {
        load_fails("server:\n  port: eighty\n", "server.port");
        load_fails("backpressure:\n  max-concurrent-requests: many\n", "backpressure.max-concurrent-requests");
        load_fails("security:\n  api-keys: single-key\n", "security.api-keys");
    }

    SECTION("Out of range values") {
        load_fails("server:\n  port: 70000\n", "server.port");
        load_fails("server:\n  io-threads: 0\n", "server.io-threads");
        load_fails("backpressure:\n  max-concurrent-requests: 0\n", "backpressure.max-concurrent-requests");
        load_fails("backpressure:\n  request-timeout-ms: 0\n", "backpressure.request-timeout-ms");
        load_fails("hot-reload:\n  poll-interval-ms: 0\n", "hot-reload.poll-interval-ms");
    }

    SECTION("Root must be a map") {
        load_fails("- a\n- b\n", "Root element must be a map");
    }
}

TEST_CASE("ConfigManager: missing file", "[config][config_manager]") {
    ConfigManager mgr("/nonexistent/querygate.yaml");
    REQUIRE_THROWS_AS(mgr.loadConfig(), ConfigurationError);
}
