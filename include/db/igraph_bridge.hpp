#pragma once

#include "core/types.hpp"
#include <string>

namespace cypherbridge {

/**
 * @brief Outcome of one bridge call (invocation, commit or rollback)
 *
 * error_message may span several lines (server diagnostics, LINE n: ...).
 */
struct BridgeResult {
    bool success = false;
    std::string error_message;
    RowSet rows;

    static BridgeResult ok(RowSet rows = {}) {
        BridgeResult r;
        r.success = true;
        r.rows = std::move(rows);
        return r;
    }

    static BridgeResult error(std::string message) {
        BridgeResult r;
        r.success = false;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Graph execution bridge
 *
 * Executes Cypher through a relational function that needs the result
 * columns declared up front. The bridge does NOT manage transactions:
 * callers commit after a successful invocation and roll back after a
 * failed one. Not thread-safe.
 */
class IGraphBridge {
public:
    virtual ~IGraphBridge() = default;

    /**
     * @brief Run Cypher against a graph with a declared column schema
     * @param graph_name Target graph
     * @param query Pure Cypher (no wrapper, no terminator)
     * @param schema Declared result columns
     * @return Rows keyed by the declared column names, or an error
     */
    [[nodiscard]] virtual BridgeResult run_cypher(
        const std::string& graph_name,
        const std::string& query,
        const ColumnSpec& schema) = 0;

    [[nodiscard]] virtual BridgeResult commit() = 0;

    [[nodiscard]] virtual BridgeResult rollback() = 0;
};

} // namespace cypherbridge
