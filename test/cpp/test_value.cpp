#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include <cmath>
#include <stdexcept>

#include "value.hpp"

using namespace querygate;

TEST_CASE("Value kinds and accessors", "[value]") {
    SECTION("Scalars") {
        REQUIRE(Value().isNull());
        REQUIRE(Value(true).asBool());
        REQUIRE(Value(42).asInt() == 42);
        REQUIRE(Value(int64_t{1} << 40).asInt() == (int64_t{1} << 40));
        REQUIRE(Value(2.5).asDouble() == 2.5);
        REQUIRE(Value("text").asString() == "text");
    }

    SECTION("Integers read as doubles and back") {
        REQUIRE(Value(7).asDouble() == 7.0);
        REQUIRE(Value(7.9).asInt() == 7);
        REQUIRE(Value(3).isNumber());
        REQUIRE_THROWS_AS(Value(1e300).asInt(), std::out_of_range);
        REQUIRE_THROWS_AS(Value(std::nan("")).asInt(), std::out_of_range);
    }

    SECTION("Wrong kind access throws") {
        REQUIRE_THROWS_AS(Value("x").asBool(), std::logic_error);
        REQUIRE_THROWS_AS(Value(1).asString(), std::logic_error);
        REQUIRE_THROWS_AS(Value(1).keys(), std::logic_error);
    }

    SECTION("Blank detection") {
        REQUIRE(Value().isBlank());
        REQUIRE(Value("   ").isBlank());
        REQUIRE(Value("").isBlank());
        REQUIRE_FALSE(Value("a").isBlank());
        REQUIRE_FALSE(Value(0).isBlank());
        REQUIRE_FALSE(Value::list().isBlank());
    }
}

TEST_CASE("Value objects keep insertion order", "[value]") {
    Value obj = Value::object();
    obj.set("zeta", 1);
    obj.set("alpha", 2);
    obj.set("mid", 3);

    REQUIRE(obj.keys() == std::vector<std::string>{"zeta", "alpha", "mid"});

    SECTION("Overwriting keeps the original position") {
        obj.set("zeta", "replaced");
        REQUIRE(obj.keys().front() == "zeta");
        REQUIRE(obj.find("zeta")->asString() == "replaced");
        REQUIRE(obj.size() == 3);
    }

    SECTION("Erase removes key and value together") {
        REQUIRE(obj.erase("alpha"));
        REQUIRE_FALSE(obj.erase("alpha"));
        REQUIRE(obj.keys() == std::vector<std::string>{"zeta", "mid"});
        REQUIRE(obj.find("mid")->asInt() == 3);
    }

    SECTION("Lookup on a non-object yields nothing") {
        REQUIRE(Value(5).find("x") == nullptr);
        REQUIRE_FALSE(Value("s").contains("x"));
    }
}

TEST_CASE("Value text form", "[value]") {
    REQUIRE(Value().toString().empty());
    REQUIRE(Value(false).toString() == "false");
    REQUIRE(Value(12).toString() == "12");
    REQUIRE(Value("abc").toString() == "abc");
    REQUIRE(Value::list({Value(1), Value(2)}).toString() == "[1,2]");
}

TEST_CASE("Value JSON conversion", "[value][json]") {
    auto parsed = crow::json::load(R"({"name":"Ada","age":36,"score":9.5,"admin":false,"tags":["a","b"],"manager":null})");
    REQUIRE(parsed);

    Value value = Value::fromJson(parsed);
    REQUIRE(value.isObject());
    REQUIRE(value.find("name")->asString() == "Ada");
    REQUIRE(value.find("age")->isInteger());
    REQUIRE(value.find("age")->asInt() == 36);
    REQUIRE(value.find("score")->isDouble());
    REQUIRE_FALSE(value.find("admin")->asBool());
    REQUIRE(value.find("tags")->size() == 2);
    REQUIRE(value.find("manager")->isNull());

    SECTION("Dump parses back to an equal value") {
        auto reparsed = crow::json::load(value.dump());
        REQUIRE(reparsed);
        REQUIRE(Value::fromJson(reparsed) == value);
    }
}

TEST_CASE("Value equality", "[value]") {
    REQUIRE(Value(1) == Value(int64_t{1}));
    REQUIRE(Value(1) != Value(1.0));
    REQUIRE(Value("a") != Value("b"));

    Value a = Value::object();
    a.set("k", Value::list({Value("x")}));
    Value b = Value::object();
    b.set("k", Value::list({Value("x")}));
    REQUIRE(a == b);
    b.find("k")->push_back(Value("y"));
    REQUIRE(a != b);
}
