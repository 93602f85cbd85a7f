#pragma once

#include "core/types.hpp"
#include "db/igraph_bridge.hpp"
#include "parser/query_sanitizer.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cypherbridge {

// Per-statement states (explicit state machine, used for trace logging)
enum class StatementState : uint8_t {
    START,
    SANITIZED,
    SCHEMA_CHOSEN,
    INVOKED,
    COMMITTED,
    ROLLED_BACK,
    DONE
};

[[nodiscard]] inline const char* statement_state_to_string(StatementState s) {
    switch (s) {
        case StatementState::START:         return "START";
        case StatementState::SANITIZED:     return "SANITIZED";
        case StatementState::SCHEMA_CHOSEN: return "SCHEMA_CHOSEN";
        case StatementState::INVOKED:       return "INVOKED";
        case StatementState::COMMITTED:     return "COMMITTED";
        case StatementState::ROLLED_BACK:   return "ROLLED_BACK";
        case StatementState::DONE:          return "DONE";
        default:                            return "UNKNOWN";
    }
}

/**
 * @brief Per-call options (no ambient toggles)
 */
struct ExecutionOptions {
    // Trace generated SQL, row counts and retries at info level
    bool verbose = false;

    // Called once per executed statement of a multi-statement batch
    // (1-based index), in order, after the batch has finished and without
    // the coordinator lock held. Statements after a failure are not reported.
    std::function<void(size_t index, const std::string& statement, const Outcome& outcome)> on_statement;
};

/**
 * @brief Runs Cypher statements through the graph bridge
 *
 * Per statement:
 *   sanitize -> infer schema -> invoke -> commit | rollback
 *   -> (inferred schema failed) retry once with the default schema
 *      (not when the COMMIT itself failed)
 *   -> Failure("Cypher error: <first line of bridge error>")
 *
 * Batches run statements in order and stop at the first failure. Every
 * statement commits on its own, so statements before a failure stay
 * committed.
 *
 * Thread-safety: public operations are serialized on an internal mutex,
 * a whole batch runs under one lock and the bridge is only touched while it
 * is held. No exception escapes a public operation.
 */
class ExecutionCoordinator {
public:
    struct Config {
        std::string graph_name = "demo";
        ColumnSpec default_schema = ColumnSpec::default_schema();
        std::string bridge_function = QuerySanitizer::kDefaultFunction;
    };

    static constexpr const char* kErrorPrefix = "Cypher error: ";

    explicit ExecutionCoordinator(std::shared_ptr<IGraphBridge> bridge);
    ExecutionCoordinator(std::shared_ptr<IGraphBridge> bridge, Config config);

    /**
     * @brief Execute a single statement
     * @return Success(rows) or Failure(single-line message)
     */
    [[nodiscard]] Outcome execute_statement(
        const std::string& text, const ExecutionOptions& options = {});

    /**
     * @brief Split text into statements and execute them fail-fast
     * @return Accumulated rows of all statements, or the first Failure
     */
    [[nodiscard]] Outcome execute_batch(
        const std::string& text, const ExecutionOptions& options = {});

    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * @brief Classify a bridge error message
     * @return SCHEMA_MISMATCH for column definition list mismatches, else EXECUTION_ERROR
     */
    [[nodiscard]] static ErrorCategory classify_error(const std::string& message);

    struct Stats {
        uint64_t statements_executed = 0;
        uint64_t bridge_invocations = 0;
        uint64_t retries = 0;
        uint64_t commits = 0;
        uint64_t rollbacks = 0;
        uint64_t failures = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct AttemptResult {
        BridgeResult result;
        bool commit_failed = false;
    };

    // One invocation attempt followed by exactly one commit or rollback
    AttemptResult attempt(const std::string& query, const ColumnSpec& schema,
                         const ExecutionOptions& options);

    Outcome execute_statement_locked(const std::string& text, const ExecutionOptions& options);

    static Outcome failure(const std::string& message);

    std::shared_ptr<IGraphBridge> bridge_;
    Config config_;
    QuerySanitizer sanitizer_;

    std::mutex mutex_;

    // Stats
    std::atomic<uint64_t> statements_executed_{0};
    std::atomic<uint64_t> bridge_invocations_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> commits_{0};
    std::atomic<uint64_t> rollbacks_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace cypherbridge
