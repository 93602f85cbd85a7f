#include <catch2/catch_test_macros.hpp>
#include "db/age_bridge.hpp"
#include "mocks/mock_db_connection.hpp"

#include <memory>

using namespace cypherbridge;
using cypherbridge::testing::MockDbConnection;

TEST_CASE("AgeBridge renders the cypher() wrapper", "[age_bridge]") {

    SECTION("Default schema") {
        REQUIRE(AgeBridge::build_cypher_sql("demo", "MATCH (n) RETURN n",
                                            ColumnSpec::default_schema())
                == "SELECT * FROM cypher('demo', $$ MATCH (n) RETURN n $$) AS (result agtype);");
    }

    SECTION("Inferred schema") {
        const auto schema = ColumnSpec::from_names({"a", "b"});
        REQUIRE(AgeBridge::build_cypher_sql("g", "MATCH (a)-->(b) RETURN a, b", schema)
                == "SELECT * FROM cypher('g', $$ MATCH (a)-->(b) RETURN a, b $$) AS (a agtype, b agtype);");
    }

    SECTION("Body containing $$ gets a tagged quote") {
        REQUIRE(AgeBridge::build_cypher_sql("g", "RETURN '$$'", ColumnSpec::default_schema())
                == "SELECT * FROM cypher('g', $cypher$ RETURN '$$' $cypher$) AS (result agtype);");
        REQUIRE(AgeBridge::build_cypher_sql("g", "RETURN '$$ $cypher$'", ColumnSpec::default_schema())
                == "SELECT * FROM cypher('g', $cypher1$ RETURN '$$ $cypher$' $cypher1$) AS (result agtype);");
    }

    SECTION("Literal quoting") {
        REQUIRE(AgeBridge::quote_literal("demo") == "'demo'");
        REQUIRE(AgeBridge::quote_literal("it's") == "'it''s'");
    }
}

TEST_CASE("AgeBridge transaction handling", "[age_bridge]") {
    auto conn = std::make_shared<MockDbConnection>();
    AgeBridge bridge(conn);

    SECTION("BEGIN before the first invocation, then COMMIT") {
        auto result = bridge.run_cypher("demo", "CREATE (:A)", ColumnSpec::default_schema());
        REQUIRE(result.success);
        REQUIRE(bridge.in_transaction());

        REQUIRE(bridge.commit().success);
        REQUIRE_FALSE(bridge.in_transaction());

        const auto& sql = conn->executed();
        REQUIRE(sql.size() == 3);
        REQUIRE(sql[0] == "BEGIN");
        REQUIRE(sql[1].starts_with("SELECT * FROM cypher('demo'"));
        REQUIRE(sql[2] == "COMMIT");
    }

    SECTION("Failed invocation, then ROLLBACK") {
        conn->set_handler([](const std::string& sql) {
            if (sql.starts_with("SELECT")) {
                return MockDbConnection::error_result(
                    "ERROR:  syntax error at or near \"RETRN\"\nLINE 1: ...");
            }
            DbResultSet ok;
            ok.success = true;
            return ok;
        });

        auto result = bridge.run_cypher("demo", "MATCH (n) RETRN n", ColumnSpec::default_schema());
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("syntax error") != std::string::npos);

        REQUIRE(bridge.rollback().success);
        REQUIRE(conn->executed().back() == "ROLLBACK");
        REQUIRE_FALSE(bridge.in_transaction());
    }

    SECTION("Commit without an open transaction is a no-op") {
        REQUIRE(bridge.commit().success);
        REQUIRE(bridge.rollback().success);
        REQUIRE(conn->executed().empty());
    }

    SECTION("Failed COMMIT is reported and closes the transaction") {
        conn->set_handler([](const std::string& sql) {
            if (sql == "COMMIT") {
                return MockDbConnection::error_result("could not serialize access");
            }
            DbResultSet ok;
            ok.success = true;
            return ok;
        });

        REQUIRE(bridge.run_cypher("demo", "CREATE (:A)", ColumnSpec::default_schema()).success);
        auto committed = bridge.commit();
        REQUIRE_FALSE(committed.success);
        REQUIRE(committed.error_message == "could not serialize access");
        REQUIRE_FALSE(bridge.in_transaction());
    }

    SECTION("Null connection") {
        AgeBridge detached(nullptr);
        auto result = detached.run_cypher("demo", "RETURN 1", ColumnSpec::default_schema());
        REQUIRE_FALSE(result.success);
    }
}

TEST_CASE("AgeBridge decodes rows", "[age_bridge]") {
    auto conn = std::make_shared<MockDbConnection>();
    AgeBridge bridge(conn);

    SECTION("Rows keyed by declared column names") {
        conn->set_handler([](const std::string& sql) {
            if (!sql.starts_with("SELECT")) {
                DbResultSet ok;
                ok.success = true;
                return ok;
            }
            // Server folds unquoted identifiers to lower case
            return MockDbConnection::rows_result({"personname", "age"}, {
                {std::string("\"Ann\""), std::string("31")},
                {std::string("\"Bob\""), std::nullopt},
            });
        });

        const auto schema = ColumnSpec::from_names({"personName", "age"});
        auto result = bridge.run_cypher("demo", "MATCH (p) RETURN p.name AS personName, p.age AS age", schema);
        REQUIRE(result.success);
        REQUIRE(result.rows.size() == 2);

        const auto& first = result.rows[0];
        REQUIRE(first.columns == std::vector<std::string>{"personName", "age"});
        REQUIRE(first.find("personName") != nullptr);
        REQUIRE(*first.find("personName") == "Ann");
        REQUIRE(*first.find("age") == 31);

        REQUIRE(result.rows[1].find("age")->is_null());
        REQUIRE(result.rows[1].find("missing") == nullptr);
    }

    SECTION("Vertex values become objects") {
        conn->set_handler([](const std::string& sql) {
            if (!sql.starts_with("SELECT")) {
                DbResultSet ok;
                ok.success = true;
                return ok;
            }
            return MockDbConnection::rows_result({"result"}, {
                {std::string(R"({"id": 1, "label": "Person", "properties": {"name": "Ann"}}::vertex)")},
            });
        });

        auto result = bridge.run_cypher("demo", "MATCH (n) RETURN n", ColumnSpec::default_schema());
        REQUIRE(result.success);
        REQUIRE(result.rows.size() == 1);
        const auto* value = result.rows[0].find("result");
        REQUIRE(value != nullptr);
        REQUIRE((*value)["label"] == "Person");
    }
}

TEST_CASE("AgeBridge session bootstrap", "[age_bridge]") {
    auto conn = std::make_shared<MockDbConnection>();
    AgeBridge bridge(conn);

    SECTION("Statements") {
        const auto stmts = AgeBridge::bootstrap_statements("demo");
        REQUIRE(stmts.size() == 4);
        REQUIRE(stmts[0] == "CREATE EXTENSION IF NOT EXISTS age;");
        REQUIRE(stmts[1] == "LOAD 'age';");
        REQUIRE(stmts[3] == "SELECT create_graph('demo');");
    }

    SECTION("All statements succeed") {
        REQUIRE(bridge.initialize("demo") == 4);
        size_t commits = 0;
        for (const auto& sql : conn->executed()) {
            if (sql == "COMMIT") ++commits;
        }
        REQUIRE(commits == 4);
        REQUIRE_FALSE(bridge.in_transaction());
    }

    SECTION("Existing graph is rolled back and skipped") {
        conn->set_handler([](const std::string& sql) {
            if (sql.starts_with("SELECT create_graph")) {
                return MockDbConnection::error_result("graph \"demo\" already exists");
            }
            DbResultSet ok;
            ok.success = true;
            return ok;
        });

        REQUIRE(bridge.initialize("demo") == 3);
        REQUIRE(conn->executed().back() == "ROLLBACK");
    }
}
