#include <catch2/catch_test_macros.hpp>
#include "string_utils.hpp"

using namespace querygate;

TEST_CASE("String trimming and case", "[string_utils]") {
    REQUIRE(trimString("  padded\t\n") == "padded");
    REQUIRE(trimString("   ").empty());
    REQUIRE(trimString("").empty());
    REQUIRE(toLowerString("MiXeD") == "mixed");
    REQUIRE(toUpperString("delete") == "DELETE");
}

TEST_CASE("splitString keeps empty pieces", "[string_utils]") {
    REQUIRE(splitString("a,,b", ',') == std::vector<std::string>{"a", "", "b"});
    REQUIRE(splitString("single", ',') == std::vector<std::string>{"single"});
    REQUIRE(splitString("", ',') == std::vector<std::string>{""});
    REQUIRE(splitString(" x ; y", ';') == std::vector<std::string>{" x ", " y"});
}

TEST_CASE("Case-insensitive matching", "[string_utils]") {
    REQUIRE(containsIgnoreCase("Application/JSON", "json"));
    REQUIRE_FALSE(containsIgnoreCase("text/plain", "xml"));
    REQUIRE(startsWithIgnoreCase("key abc", "Key "));
    REQUIRE_FALSE(startsWithIgnoreCase("Ke", "Key "));
}

TEST_CASE("sanitizeHeaderValue strips control characters", "[string_utils]") {
    REQUIRE(sanitizeHeaderValue("line one\r\nX-Injected: yes") == "line one  X-Injected: yes");
    REQUIRE(sanitizeHeaderValue("\ttabbed\x01") == "tabbed");
    REQUIRE(sanitizeHeaderValue("clean") == "clean");
}
