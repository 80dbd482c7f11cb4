#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include <crow/json.h>

#include "api_server.hpp"
#include "test_utils.hpp"

using namespace querygate;
using namespace querygate::test;
using Catch::Matchers::ContainsSubstring;

namespace {

const char* const kGatewayConfig = R"(
endpoint-config-path: ./endpoint-config.yaml
mapper-locations: ./mappers
duckdb:
  db_path: ":memory:"
  init: CREATE TABLE users (id INTEGER, name VARCHAR)
security:
  enabled: true
  api-keys: [test-key]
  allowed-networks: [127.0.0.1]
backpressure:
  max-concurrent-requests: 2
  acquire-timeout-ms: 0
hot-reload:
  enabled: false
)";

const char* const kEndpoints = R"(
endpoints:
  - path: /api/users
    method: GET
    sql-id: users.findAll
    sql-type: SELECT
  - path: /api/users/{id}
    method: DELETE
    sql-id: users.delete
    sql-type: DELETE
)";

const char* const kMapper = R"(
namespace: users
statements:
  findAll: SELECT * FROM users
  delete: DELETE FROM users WHERE id = $id
)";

struct ServerFixture {
    ServerFixture() : env(kGatewayConfig, "querygate_server") {
        env.writeEndpoints(kEndpoints);
        env.writeMapper("users.yaml", kMapper);

        config = env.createConfigManager();
        catalog = std::make_shared<StatementCatalog>();
        db = std::make_shared<DatabaseManager>(config->getDuckDBConfig(), config->getSqlLoggingConfig(), catalog);
        db->initialize();
        server = std::make_unique<APIServer>(config, catalog, db);
    }

    crow::request request(crow::HTTPMethod method, const std::string& url, bool with_key = true) {
        crow::request req;
        req.method = method;
        req.raw_url = url;
        req.url = url.substr(0, url.find('?'));
        req.remote_ip_address = "127.0.0.1";
        if (with_key) {
            req.headers.emplace("X-API-Key", "test-key");
        }
        return req;
    }

    TempTestConfig env;
    std::shared_ptr<ConfigManager> config;
    std::shared_ptr<StatementCatalog> catalog;
    std::shared_ptr<DatabaseManager> db;
    std::unique_ptr<APIServer> server;
};

} // namespace

TEST_CASE("APIServer: configuration loading", "[server]") {
    ServerFixture fx;
    REQUIRE(fx.server->getRegistry().generation() == 0);

    auto loaded = fx.server->reloadConfiguration();
    REQUIRE(loaded);
    REQUIRE(*loaded == 2);
    REQUIRE(fx.catalog->size() == 2);
    REQUIRE(fx.server->getRegistry().generation() == 1);

    SECTION("Admin reload reports the new generation") {
        auto res = fx.server->reload();
        REQUIRE(res.code == 200);
        auto json = crow::json::load(res.body);
        REQUIRE(json["success"].b());
        REQUIRE(json["endpoints"].i() == 2);
        REQUIRE(json["generation"].i() == 2);
    }

    SECTION("A broken endpoint file keeps the live table") {
        fx.env.writeEndpoints("endpoints:\n  - path: /api/broken\n");
        auto res = fx.server->reload();
        REQUIRE(res.code == 500);
        auto json = crow::json::load(res.body);
        REQUIRE_FALSE(json["success"].b());
        REQUIRE(json["generation"].i() == 1);
        REQUIRE(fx.server->getRegistry().resolve("GET", "/api/users"));
    }

    SECTION("Statements and endpoints are published together") {
        fx.env.writeMapper("users.yaml", R"(
namespace: users
statements:
  listAll: SELECT * FROM users
  delete: DELETE FROM users WHERE id = $id
)");
        fx.env.writeEndpoints("endpoints:\n  - path: /api/users\n    method: GET\n    sql-id: users.listAll\n");

        REQUIRE_FALSE(fx.server->reloadConfiguration());
        REQUIRE(fx.server->getRegistry().generation() == 1);
        REQUIRE(fx.catalog->find("users.findAll"));
        REQUIRE_FALSE(fx.catalog->find("users.listAll"));

        auto match = fx.server->getRegistry().resolve("GET", "/api/users");
        REQUIRE(match);
        auto rows = fx.db->execute(match->endpoint->statementId, Value::object());
        REQUIRE(rows);
        REQUIRE(rows->producedRows);
    }

    SECTION("A broken mapper aborts the reload") {
        fx.env.writeMapper("users.yaml", "statements: {}\n");
        REQUIRE_FALSE(fx.server->reloadConfiguration());
        REQUIRE(fx.catalog->size() == 2);
        REQUIRE(fx.server->getRegistry().generation() == 1);
    }
}

TEST_CASE("APIServer: health", "[server]") {
    ServerFixture fx;
    REQUIRE(fx.server->reloadConfiguration());

    auto res = fx.server->health();
    REQUIRE(res.code == 200);
    auto json = crow::json::load(res.body);
    REQUIRE(json);
    REQUIRE(std::string(json["status"].s()) == "UP");
    REQUIRE(json["components"]["configuration"]["endpoints"].i() == 2);
    REQUIRE(json["components"]["configuration"]["generation"].i() == 1);
    REQUIRE(json["components"]["admission"]["capacity"].i() == 2);
    REQUIRE(std::string(json["components"]["database"]["status"].s()) == "UP");
}

TEST_CASE("APIServer: requests rejected before dispatch", "[server]") {
    ServerFixture fx;
    REQUIRE(fx.server->reloadConfiguration());

    SECTION("Missing API key") {
        auto req = fx.request(crow::HTTPMethod::Get, "/api/users", false);
        crow::response res;
        fx.server->handleGatewayRequest(req, res);
        REQUIRE(res.code == 401);
        REQUIRE(res.is_completed());
        REQUIRE(fx.server->getAdmissionController().stats().rejected_auth == 1);
    }

    SECTION("Disallowed network") {
        auto req = fx.request(crow::HTTPMethod::Get, "/api/users");
        req.remote_ip_address = "198.51.100.7";
        crow::response res;
        fx.server->handleGatewayRequest(req, res);
        REQUIRE(res.code == 403);
    }

    SECTION("Unknown route releases its permit") {
        auto req = fx.request(crow::HTTPMethod::Get, "/api/orders");
        crow::response res;
        fx.server->handleGatewayRequest(req, res);
        REQUIRE(res.code == 404);
        REQUIRE_THAT(res.body, ContainsSubstring("Endpoint Not Found"));
        REQUIRE(fx.server->getAdmissionController().stats().active == 0);
    }

    SECTION("Method is part of the route") {
        auto req = fx.request(crow::HTTPMethod::Post, "/api/users");
        crow::response res;
        fx.server->handleGatewayRequest(req, res);
        REQUIRE(res.code == 404);
    }
}
