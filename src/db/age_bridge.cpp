#include "db/age_bridge.hpp"
#include "parser/agtype_decoder.hpp"
#include "core/utils.hpp"

#include <format>

namespace cypherbridge {

AgeBridge::AgeBridge(std::shared_ptr<IDbConnection> conn)
    : conn_(std::move(conn)) {}

// ============================================================================
// Invocation
// ============================================================================

BridgeResult AgeBridge::run_cypher(
    const std::string& graph_name,
    const std::string& query,
    const ColumnSpec& schema) {

    if (!conn_) {
        return BridgeResult::error("Connection is null");
    }

    if (!in_transaction_) {
        auto begin = conn_->execute("BEGIN");
        if (!begin.success) {
            return BridgeResult::error(begin.error_message);
        }
        in_transaction_ = true;
    }

    auto db_result = conn_->execute(build_cypher_sql(graph_name, query, schema));
    if (!db_result.success) {
        return BridgeResult::error(db_result.error_message);
    }

    // Key rows by the declared names; the server folds unquoted names to lower case
    const auto declared = schema.names();
    const auto& columns = (db_result.column_names.size() == declared.size())
        ? declared : db_result.column_names;

    RowSet rows;
    rows.reserve(db_result.rows.size());
    for (const auto& db_row : db_result.rows) {
        Row row;
        row.columns = columns;
        row.values.reserve(db_row.size());
        for (const auto& cell : db_row) {
            row.values.push_back(AgtypeDecoder::decode(cell));
        }
        rows.push_back(std::move(row));
    }

    return BridgeResult::ok(std::move(rows));
}

BridgeResult AgeBridge::commit() {
    return end_transaction("COMMIT");
}

BridgeResult AgeBridge::rollback() {
    return end_transaction("ROLLBACK");
}

BridgeResult AgeBridge::end_transaction(const char* sql) {
    if (!in_transaction_) {
        return BridgeResult::ok();
    }
    // The server leaves the transaction block even when COMMIT fails
    in_transaction_ = false;

    if (!conn_) {
        return BridgeResult::error("Connection is null");
    }

    auto db_result = conn_->execute(sql);
    if (!db_result.success) {
        return BridgeResult::error(db_result.error_message);
    }
    return BridgeResult::ok();
}

// ============================================================================
// Session bootstrap
// ============================================================================

size_t AgeBridge::initialize(const std::string& graph_name) {
    size_t succeeded = 0;
    if (!conn_) {
        utils::log::error("AGE bootstrap skipped: connection is null");
        return succeeded;
    }

    for (const auto& stmt : bootstrap_statements(graph_name)) {
        auto begin = conn_->execute("BEGIN");
        if (!begin.success) {
            utils::log::warn(std::format("AGE bootstrap: BEGIN failed: {}",
                utils::first_line(begin.error_message)));
            continue;
        }

        auto result = conn_->execute(stmt);
        if (result.success) {
            auto commit_result = conn_->execute("COMMIT");
            if (commit_result.success) {
                ++succeeded;
            } else {
                utils::log::warn(std::format("AGE bootstrap: COMMIT failed after '{}': {}",
                    stmt, utils::first_line(commit_result.error_message)));
            }
        } else {
            utils::log::debug(std::format("AGE bootstrap: '{}' skipped: {}",
                stmt, utils::first_line(result.error_message)));
            auto rollback_result = conn_->execute("ROLLBACK");
            if (!rollback_result.success) {
                utils::log::warn(std::format("AGE bootstrap: ROLLBACK failed: {}",
                    utils::first_line(rollback_result.error_message)));
            }
        }
    }

    in_transaction_ = false;
    return succeeded;
}

// ============================================================================
// SQL rendering
// ============================================================================

std::string AgeBridge::build_cypher_sql(
    const std::string& graph_name,
    const std::string& query,
    const ColumnSpec& schema) {

    // Pick a dollar-quote tag that does not occur in the body
    std::string tag = "$$";
    for (int n = 0; query.find(tag) != std::string::npos; ++n) {
        tag = (n == 0) ? "$cypher$" : std::format("$cypher{}$", n);
    }

    return std::format("SELECT * FROM cypher({}, {} {} {}) AS {};",
        quote_literal(graph_name), tag, query, tag, schema.to_sql());
}

std::vector<std::string> AgeBridge::bootstrap_statements(const std::string& graph_name) {
    return {
        "CREATE EXTENSION IF NOT EXISTS age;",
        "LOAD 'age';",
        "SET search_path = ag_catalog, \"$user\", public;",
        std::format("SELECT create_graph({});", quote_literal(graph_name)),
    };
}

std::string AgeBridge::quote_literal(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

} // namespace cypherbridge
