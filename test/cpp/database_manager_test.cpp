#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "database_manager.hpp"

using namespace querygate;
using Catch::Matchers::ContainsSubstring;

namespace {

const char* const kMapper = R"(
namespace: users
statements:
  findAll: SELECT id, name, active, score FROM users ORDER BY id
  findById: SELECT id, name, created FROM users WHERE id = $id
  insert: INSERT INTO users (name, active, score) VALUES ($name, $active, $score) RETURNING id
  rename: UPDATE users SET name = $name WHERE id = $id
  delete: DELETE FROM users WHERE id = $id
  insertName: INSERT INTO users (name) VALUES ($name)
  insertTag: INSERT INTO tags (tag) VALUES ($item)
  broken: SELEC nothing
)";

std::shared_ptr<DatabaseManager> openDatabase() {
    auto catalog = std::make_shared<StatementCatalog>();
    REQUIRE(catalog->loadFromString(kMapper));

    DuckDBConfig config;
    config.db_path = ":memory:";
    config.init_sql =
        "CREATE SEQUENCE users_seq START 1;"
        "CREATE TABLE users (id INTEGER PRIMARY KEY DEFAULT nextval('users_seq'), name VARCHAR NOT NULL,"
        " active BOOLEAN DEFAULT true, score DOUBLE, created DATE DEFAULT DATE '2024-01-15');"
        "CREATE TABLE tags (tag VARCHAR PRIMARY KEY);"
        "INSERT INTO users (name, score) VALUES ('Ada', 9.5), ('Bob', 7.0);";

    auto db = std::make_shared<DatabaseManager>(config, SqlLoggingConfig{}, catalog);
    db->initialize();
    return db;
}

Value params(std::initializer_list<std::pair<std::string, Value>> entries) {
    Value result = Value::object();
    for (const auto& [key, value] : entries) {
        result.set(key, value);
    }
    return result;
}

} // namespace

TEST_CASE("DatabaseManager: queries", "[database]") {
    auto db = openDatabase();
    REQUIRE(db->isInitialized());
    REQUIRE(db->ping());

    SECTION("Rows come back as typed objects") {
        auto outcome = db->execute("users.findAll", Value::object());
        REQUIRE(outcome);
        REQUIRE(outcome->producedRows);
        REQUIRE(outcome->rows.size() == 2);

        const Value& ada = outcome->rows[0];
        REQUIRE(*ada.find("id") == Value(int64_t{1}));
        REQUIRE(*ada.find("name") == Value("Ada"));
        REQUIRE(*ada.find("active") == Value(true));
        REQUIRE(*ada.find("score") == Value(9.5));
    }

    SECTION("Named parameters bind by name") {
        auto outcome = db->execute("users.findById", params({{"id", Value(int64_t{2})}, {"unused", Value("x")}}));
        REQUIRE(outcome);
        REQUIRE(outcome->rows.size() == 1);
        REQUIRE(*outcome->rows[0].find("name") == Value("Bob"));
        REQUIRE(*outcome->rows[0].find("created") == Value("2024-01-15"));
    }

    SECTION("Missing parameters bind as NULL") {
        auto outcome = db->execute("users.findById", Value::object());
        REQUIRE(outcome);
        REQUIRE(outcome->rows.empty());
    }
}

TEST_CASE("DatabaseManager: modifications", "[database]") {
    auto db = openDatabase();

    SECTION("INSERT RETURNING yields the new key") {
        auto outcome = db->execute("users.insert", params({{"name", Value("Cy")}, {"active", Value(false)},
                                                           {"score", Value(1.25)}}));
        REQUIRE(outcome);
        REQUIRE(outcome->producedRows);
        REQUIRE(*outcome->rows[0].find("id") == Value(int64_t{3}));
    }

    SECTION("UPDATE and DELETE report affected rows") {
        auto renamed = db->execute("users.rename", params({{"id", Value(int64_t{1})}, {"name", Value("Ada L.")}}));
        REQUIRE(renamed);
        REQUIRE_FALSE(renamed->producedRows);
        REQUIRE(renamed->affectedRows == 1);

        auto missing = db->execute("users.delete", params({{"id", Value(int64_t{99})}}));
        REQUIRE(missing);
        REQUIRE(missing->affectedRows == 0);
    }
}

TEST_CASE("DatabaseManager: errors", "[database]") {
    auto db = openDatabase();

    SECTION("Unknown statement id") {
        auto outcome = db->execute("users.nope", Value::object());
        REQUIRE_FALSE(outcome);
        REQUIRE(outcome.error().category == ErrorCategory::Database);
        REQUIRE(outcome.error().statement_id == "users.nope");
        REQUIRE_THAT(outcome.error().details, ContainsSubstring("Unknown statement id"));
    }

    SECTION("Syntax errors carry the engine message") {
        auto outcome = db->execute("users.broken", Value::object());
        REQUIRE_FALSE(outcome);
        REQUIRE_FALSE(outcome.error().details.empty());
        REQUIRE(outcome.error().message == "SQL execution failed");
    }

    SECTION("Constraint violations") {
        auto outcome = db->execute("users.insertName", Value::object());
        REQUIRE_FALSE(outcome);
        REQUIRE_THAT(outcome.error().details, ContainsSubstring("NOT NULL"));
    }
}

TEST_CASE("DatabaseManager: batch chunks", "[database][batch]") {
    auto db = openDatabase();

    SECTION("Object items bind by name") {
        auto affected = db->executeBatchChunk("users.insertName",
                                              {params({{"name", Value("Cy")}}), params({{"name", Value("Di")}})});
        REQUIRE(affected);
        REQUIRE(*affected == 2);
        REQUIRE(db->execute("users.findAll", Value::object())->rows.size() == 4);
    }

    SECTION("Scalar items bind as $item") {
        auto affected = db->executeBatchChunk("users.insertTag", {Value("red"), Value("blue")});
        REQUIRE(affected);
        REQUIRE(*affected == 2);
    }

    SECTION("A failing item rolls back its whole chunk") {
        auto failed = db->executeBatchChunk("users.insertTag", {Value("green"), Value("green")});
        REQUIRE_FALSE(failed);
        REQUIRE(failed.error().category == ErrorCategory::Database);

        // The first "green" was rolled back with the chunk
        auto retried = db->executeBatchChunk("users.insertTag", {Value("green")});
        REQUIRE(retried);
        REQUIRE(*retried == 1);
    }
}

TEST_CASE("DatabaseManager: initialization failures", "[database]") {
    auto catalog = std::make_shared<StatementCatalog>();

    SECTION("Broken init SQL") {
        DuckDBConfig config;
        config.init_sql = "CREATE TABLE (";
        DatabaseManager db(config, SqlLoggingConfig{}, catalog);
        REQUIRE_THROWS_WITH(db.initialize(), ContainsSubstring("DuckDB init SQL failed"));
    }

    SECTION("Use before initialize") {
        DatabaseManager db(DuckDBConfig{}, SqlLoggingConfig{}, catalog);
        REQUIRE_FALSE(db.ping());
        REQUIRE_FALSE(db.execute("users.findAll", Value::object()));
    }
}
