#pragma once

#include "db/igraph_bridge.hpp"
#include "db/idb_connection.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cypherbridge {

/**
 * @brief Apache AGE implementation of IGraphBridge
 *
 * Renders each invocation as
 *   SELECT * FROM cypher('<graph>', $$ <query> $$) AS (<cols>);
 * on a PostgreSQL connection. A transaction is opened with BEGIN before
 * the first invocation after a commit/rollback, so every invocation
 * needs an explicit commit() or rollback().
 */
class AgeBridge : public IGraphBridge {
public:
    explicit AgeBridge(std::shared_ptr<IDbConnection> conn);

    BridgeResult run_cypher(
        const std::string& graph_name,
        const std::string& query,
        const ColumnSpec& schema) override;

    BridgeResult commit() override;
    BridgeResult rollback() override;

    /**
     * @brief Load AGE into the session and create the graph
     *
     * Each bootstrap statement is committed on success or rolled back on
     * failure; failures are logged and skipped (e.g. graph already exists).
     * @return Number of bootstrap statements that succeeded
     */
    size_t initialize(const std::string& graph_name);

    [[nodiscard]] bool in_transaction() const { return in_transaction_; }

    /**
     * @brief Render the relational wrapper for a Cypher query
     */
    [[nodiscard]] static std::string build_cypher_sql(
        const std::string& graph_name,
        const std::string& query,
        const ColumnSpec& schema);

    [[nodiscard]] static std::vector<std::string> bootstrap_statements(
        const std::string& graph_name);

    // Single-quoted SQL string literal ('' escaping)
    [[nodiscard]] static std::string quote_literal(const std::string& value);

private:
    BridgeResult end_transaction(const char* sql);

    std::shared_ptr<IDbConnection> conn_;
    bool in_transaction_ = false;
};

} // namespace cypherbridge
