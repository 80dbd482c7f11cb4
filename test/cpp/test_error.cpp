#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "error.hpp"

using namespace querygate;

TEST_CASE("Error construction", "[error]") {
    SECTION("Validation error keeps every field error") {
        auto err = Error::Validation({{"id", "Required parameter 'id' is missing"},
                                      {"limit", "Parameter 'limit' must be at most 100 (got 500)"}});
        REQUIRE(err.category == ErrorCategory::Validation);
        REQUIRE(err.http_status_code == 400);
        REQUIRE(err.field_errors.size() == 2);
        REQUIRE(err.field_errors[1].field == "limit");
    }

    SECTION("Database error separates client message from engine message") {
        auto err = Error::Database("users.insert", "Constraint Error: duplicate key");
        REQUIRE(err.category == ErrorCategory::Database);
        REQUIRE(err.http_status_code == 500);
        REQUIRE(err.message == "SQL execution failed");
        REQUIRE(err.details == "Constraint Error: duplicate key");
        REQUIRE(err.statement_id == "users.insert");
    }

    SECTION("Parse error carries the content type") {
        auto err = Error::Parse("Invalid XML format", "application/xml");
        REQUIRE(err.http_status_code == 400);
        REQUIRE(err.content_type == "application/xml");
    }

    SECTION("Not found error names the route") {
        auto err = Error::NotFound("GET", "/api/missing");
        REQUIRE(err.http_status_code == 404);
        REQUIRE(err.method == "GET");
        REQUIRE(err.path == "/api/missing");
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("/api/missing"));
    }

    SECTION("Admission layer statuses") {
        REQUIRE(Error::AdmissionRejected(5).http_status_code == 429);
        REQUIRE(Error::NetworkDenied("10.1.2.3").http_status_code == 403);
        REQUIRE(Error::AuthFailed("Missing API key").http_status_code == 401);
        REQUIRE(Error::Timeout(30000).http_status_code == 504);
    }

    SECTION("Configuration and internal errors") {
        REQUIRE(Error::Config("Invalid config").http_status_code == 500);
        REQUIRE(Error::Internal("Unexpected").http_status_code == 500);
        REQUIRE(Error::BadRequest("Batch items must be a list").http_status_code == 400);
    }
}

TEST_CASE("Error::getCategoryName", "[error]") {
    REQUIRE(Error::Validation({}).getCategoryName() == "Validation");
    REQUIRE(Error::Parse("x", "application/json").getCategoryName() == "Parse");
    REQUIRE(Error::Database("id", "x").getCategoryName() == "Database");
    REQUIRE(Error::Config("test").getCategoryName() == "Configuration");
    REQUIRE(Error::AuthFailed("test").getCategoryName() == "AuthFailed");
    REQUIRE(Error::NotFound("GET", "/").getCategoryName() == "NotFound");
    REQUIRE(Error::AdmissionRejected(1).getCategoryName() == "AdmissionRejected");
    REQUIRE(Error::Timeout(1).getCategoryName() == "Timeout");
    REQUIRE(Error::Internal("test").getCategoryName() == "Internal");
}

TEST_CASE("Error::toHttpResponse", "[error]") {
    SECTION("Body never includes details") {
        auto res = Error::NetworkDenied("10.9.9.9").toHttpResponse();
        REQUIRE(res.code == 403);
        REQUIRE_THAT(res.body, Catch::Matchers::ContainsSubstring("Access denied"));
        REQUIRE_THAT(res.body, !Catch::Matchers::ContainsSubstring("10.9.9.9"));
    }

    SECTION("Capacity rejection carries Retry-After") {
        auto res = Error::AdmissionRejected(7).toHttpResponse();
        REQUIRE(res.code == 429);
        REQUIRE(res.get_header_value("Retry-After") == "7");
    }
}

TEST_CASE("Error::describe", "[error]") {
    auto err = Error::Database("users.delete", "Catalog Error: table users does not exist");
    auto text = err.describe();
    REQUIRE_THAT(text, Catch::Matchers::StartsWith("Database (500)"));
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("sqlId=users.delete"));
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("table users does not exist"));
}

TEST_CASE("Expected holds either a value or an error", "[error][expected]") {
    Result<int> ok = 42;
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 42);
    REQUIRE_THROWS_AS(ok.error(), std::runtime_error);

    Result<int> failed = Error::Internal("boom");
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error().message == "boom");
    REQUIRE_THROWS_AS(failed.value(), std::runtime_error);

    SECTION("Move keeps the active member") {
        Result<std::string> moved_from = std::string("payload");
        Result<std::string> moved_to = std::move(moved_from);
        REQUIRE(*moved_to == "payload");
    }
}
