#include <catch2/catch_test_macros.hpp>
#include "parser/schema_inferencer.hpp"

#include <string>
#include <vector>

using namespace cypherbridge;

namespace {

const ColumnSpec kDefault = ColumnSpec::default_schema();

std::vector<std::string> inferred_names(const std::string& query) {
    return SchemaInferencer::infer_schema(query, kDefault).names();
}

} // anonymous namespace

TEST_CASE("SchemaInferencer falls back to the default schema", "[schema]") {

    SECTION("No RETURN clause") {
        REQUIRE(SchemaInferencer::infer_schema("CREATE (:Person {name: 'Ann'})", kDefault) == kDefault);
        REQUIRE_FALSE(SchemaInferencer::extract_projection("CREATE (:A)").has_value());
    }

    SECTION("Single projected item") {
        REQUIRE(SchemaInferencer::infer_schema("MATCH (p:Person) RETURN count(p)", kDefault) == kDefault);
        REQUIRE(SchemaInferencer::infer_schema("MATCH (n) RETURN n AS node", kDefault) == kDefault);
        REQUIRE(SchemaInferencer::infer_schema("MATCH (n) RETURN n LIMIT 5", kDefault) == kDefault);
    }

    SECTION("Custom default schema is returned unchanged") {
        const auto custom = ColumnSpec::default_schema("value");
        const auto schema = SchemaInferencer::infer_schema("MATCH (n) RETURN n", custom);
        REQUIRE(schema == custom);
        REQUIRE(schema.to_sql() == "(value agtype)");
    }

    SECTION("RETURN must be a whole word") {
        REQUIRE_FALSE(SchemaInferencer::extract_projection("MATCH (n:RETURNS) SET n.x = 1").has_value());
    }
}

TEST_CASE("SchemaInferencer names multi-item projections", "[schema]") {

    SECTION("Aliases win") {
        const auto schema = SchemaInferencer::infer_schema(
            "MATCH (n) RETURN n AS node, n.name AS name LIMIT 5", kDefault);
        REQUIRE(schema.size() == 2);
        REQUIRE(schema.names() == std::vector<std::string>{"node", "name"});
        REQUIRE(schema.to_sql() == "(node agtype, name agtype)");
        for (const auto& col : schema.columns()) {
            REQUIRE(col.type_name == kGraphValueType);
        }
    }

    SECTION("Alias keyword is case-insensitive") {
        REQUIRE(inferred_names("match (a) return a.x as first, a.y As second")
                == std::vector<std::string>{"first", "second"});
    }

    SECTION("First identifier token without alias") {
        REQUIRE(inferred_names("MATCH (a)-[r]->(b) RETURN a, r, b.name")
                == std::vector<std::string>{"a", "r", "b"});
        REQUIRE(inferred_names("MATCH (p) RETURN count(p), max(p.age)")
                == std::vector<std::string>{"count", "max"});
    }

    SECTION("col<N> when an item has no identifier") {
        REQUIRE(inferred_names("MATCH (n) RETURN n, ")
                == std::vector<std::string>{"n", "col2"});
        REQUIRE(inferred_names("RETURN a, +, b")
                == std::vector<std::string>{"a", "col2", "b"});
    }

    SECTION("Clause keywords end the projection") {
        REQUIRE(inferred_names("MATCH (n) RETURN n.a AS a, n.b AS b ORDER BY a")
                == std::vector<std::string>{"a", "b"});
        REQUIRE(inferred_names("MATCH (n) RETURN n.a AS a, n.b AS b SKIP 2 LIMIT 3")
                == std::vector<std::string>{"a", "b"});
        REQUIRE(inferred_names("MATCH (n) RETURN n.a AS a, n.b AS b UNION MATCH (m) RETURN m.a AS a, m.b AS b")
                == std::vector<std::string>{"a", "b"});
    }

    SECTION("Projection spanning lines") {
        REQUIRE(inferred_names("MATCH (n)\nRETURN n.name AS name,\n       n.age AS age\nORDER BY age")
                == std::vector<std::string>{"name", "age"});
    }

    SECTION("Column count equals comma-separated item count") {
        for (size_t n = 2; n <= 6; ++n) {
            std::string query = "MATCH (x) RETURN ";
            for (size_t i = 0; i < n; ++i) {
                if (i > 0) query += ", ";
                query += "x.p" + std::to_string(i);
            }
            CHECK(SchemaInferencer::infer_schema(query, kDefault).size() == n);
        }
    }
}

TEST_CASE("SchemaInferencer splits on every comma", "[schema]") {
    // Nested commas are not tracked: a map literal counts as several items
    const auto items = SchemaInferencer::split_items("{a: 1, b: 2}");
    REQUIRE(items.size() == 2);
    REQUIRE(items[0] == "{a: 1");
    REQUIRE(items[1] == "b: 2}");

    REQUIRE(inferred_names("RETURN {a: 1, b: 2}")
            == std::vector<std::string>{"a", "b"});
}

TEST_CASE("SchemaInferencer column_name", "[schema]") {
    REQUIRE(SchemaInferencer::column_name("n.name AS person_name", 1) == "person_name");
    REQUIRE(SchemaInferencer::column_name("n.name", 1) == "n");
    REQUIRE(SchemaInferencer::column_name("", 4) == "col4");
    REQUIRE(SchemaInferencer::column_name("*", 2) == "col2");
}

TEST_CASE("SchemaInferencer handles very long projections", "[schema]") {

    SECTION("Long alias") {
        const std::string alias(100000, 'x');
        const auto schema = SchemaInferencer::infer_schema(
            "MATCH (n) RETURN n.a AS a, n.b AS " + alias, kDefault);
        REQUIRE(schema.size() == 2);
        REQUIRE(schema.names()[0] == "a");
        REQUIRE(schema.names()[1] == alias);
    }

    SECTION("Long literal followed by a clause keyword") {
        const std::string literal = "'" + std::string(100000, 'y') + "'";
        REQUIRE(inferred_names("MATCH (n) RETURN n.a AS a, " + literal + " AS big ORDER BY a")
                == std::vector<std::string>{"a", "big"});
    }

    SECTION("Large list literal") {
        // Naive comma splitting: every list element becomes an item
        std::string query = "RETURN [";
        for (int i = 0; i < 20000; ++i) {
            if (i > 0) query += ", ";
            query += std::to_string(i);
        }
        query += "] AS xs";
        const auto schema = SchemaInferencer::infer_schema(query, kDefault);
        REQUIRE(schema.size() == 20000);
        REQUIRE(schema.names().front() == "0");
        REQUIRE(schema.names().back() == "xs");
    }
}
