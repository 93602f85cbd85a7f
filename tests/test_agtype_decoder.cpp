#include <catch2/catch_test_macros.hpp>
#include "parser/agtype_decoder.hpp"

using namespace cypherbridge;
using namespace std::string_view_literals;

TEST_CASE("AgtypeDecoder scalars", "[agtype]") {
    REQUIRE(AgtypeDecoder::decode(std::optional<std::string>{}).is_null());
    REQUIRE(AgtypeDecoder::decode("1"sv) == 1);
    REQUIRE(AgtypeDecoder::decode("2.5"sv) == 2.5);
    REQUIRE(AgtypeDecoder::decode("true"sv) == true);
    REQUIRE(AgtypeDecoder::decode("null"sv).is_null());
    REQUIRE(AgtypeDecoder::decode("\"Alice\""sv) == "Alice");
}

TEST_CASE("AgtypeDecoder graph entities", "[agtype]") {

    SECTION("Vertex") {
        const auto v = AgtypeDecoder::decode(
            R"({"id": 844424930131969, "label": "Person", "properties": {"name": "Ann"}}::vertex)"sv);
        REQUIRE(v.is_object());
        REQUIRE(v["label"] == "Person");
        REQUIRE(v["properties"]["name"] == "Ann");
    }

    SECTION("Path with nested annotations") {
        const auto p = AgtypeDecoder::decode(
            R"([{"id": 1, "label": "A", "properties": {}}::vertex, )"
            R"({"id": 3, "label": "R", "end_id": 2, "start_id": 1, "properties": {}}::edge, )"
            R"({"id": 2, "label": "B", "properties": {}}::vertex]::path)"sv);
        REQUIRE(p.is_array());
        REQUIRE(p.size() == 3);
        REQUIRE(p[1]["label"] == "R");
    }

    SECTION("Annotation text inside strings is preserved") {
        const auto v = AgtypeDecoder::decode(
            R"({"id": 1, "label": "N", "properties": {"note": "a::vertex \"b\""}}::vertex)"sv);
        REQUIRE(v["properties"]["note"] == "a::vertex \"b\"");
    }

    SECTION("Numeric annotation") {
        REQUIRE(AgtypeDecoder::decode("3.14::numeric"sv) == 3.14);
    }
}

TEST_CASE("AgtypeDecoder keeps unparseable text as a string", "[agtype]") {
    REQUIRE(AgtypeDecoder::decode("NaN"sv) == "NaN");
    REQUIRE(AgtypeDecoder::decode("-Infinity"sv) == "-Infinity");
    REQUIRE(AgtypeDecoder::strip_annotations("x::vertexes") == "x::vertexes");
}
