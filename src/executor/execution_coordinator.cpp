#include "executor/execution_coordinator.hpp"
#include "parser/schema_inferencer.hpp"
#include "parser/statement_splitter.hpp"
#include "core/utils.hpp"

#include <format>
#include <vector>

namespace cypherbridge {

ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<IGraphBridge> bridge)
    : ExecutionCoordinator(std::move(bridge), Config{}) {}

ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<IGraphBridge> bridge, Config config)
    : bridge_(std::move(bridge)),
      config_(std::move(config)),
      sanitizer_(config_.bridge_function) {}

// ============================================================================
// Public API
// ============================================================================

Outcome ExecutionCoordinator::execute_statement(
    const std::string& text, const ExecutionOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute_statement_locked(text, options);
}

Outcome ExecutionCoordinator::execute_batch(
    const std::string& text, const ExecutionOptions& options) {
    const auto statements = StatementSplitter::split(text);
    if (statements.empty()) {
        return Outcome::ok({});
    }
    if (statements.size() == 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        return execute_statement_locked(statements.front(), options);
    }

    std::vector<Outcome> outcomes;
    outcomes.reserve(statements.size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& statement : statements) {
            outcomes.push_back(execute_statement_locked(statement, options));
            if (outcomes.back().is_error()) {
                break;
            }
        }
    }

    // Unlocked: the observer may call back into the coordinator
    if (options.on_statement) {
        for (size_t i = 0; i < outcomes.size(); ++i) {
            try {
                options.on_statement(i + 1, statements[i], outcomes[i]);
            } catch (const std::exception& e) {
                utils::log::warn(std::format("Statement observer threw: {}", e.what()));
            }
        }
    }

    if (outcomes.back().is_error()) {
        utils::log::debug(std::format("Batch stopped at statement {}/{}",
            outcomes.size(), statements.size()));
        return std::move(outcomes.back());
    }

    RowSet accumulated;
    for (auto& outcome : outcomes) {
        auto& rows = outcome.value();
        accumulated.insert(accumulated.end(),
            std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    }
    return Outcome::ok(std::move(accumulated));
}

ExecutionCoordinator::Stats ExecutionCoordinator::get_stats() const {
    Stats s;
    s.statements_executed = statements_executed_.load(std::memory_order_relaxed);
    s.bridge_invocations = bridge_invocations_.load(std::memory_order_relaxed);
    s.retries = retries_.load(std::memory_order_relaxed);
    s.commits = commits_.load(std::memory_order_relaxed);
    s.rollbacks = rollbacks_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    return s;
}

ErrorCategory ExecutionCoordinator::classify_error(const std::string& message) {
    const std::string lower = utils::to_lower(message);
    if (lower.find("column definition list") != std::string::npos) {
        return ErrorCategory::SCHEMA_MISMATCH;
    }
    return ErrorCategory::EXECUTION_ERROR;
}

// ============================================================================
// Statement state machine
// ============================================================================

Outcome ExecutionCoordinator::execute_statement_locked(
    const std::string& text, const ExecutionOptions& options) {
    statements_executed_.fetch_add(1, std::memory_order_relaxed);

    if (!bridge_) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return Outcome::error(ErrorCategory::INTERNAL_ERROR,
            std::format("{}no graph bridge configured", kErrorPrefix));
    }

    StatementState state = StatementState::START;
    try {
        const std::string clean = sanitizer_.sanitize(text);
        state = StatementState::SANITIZED;
        if (clean.empty()) {
            return Outcome::ok({});
        }

        const ColumnSpec schema = SchemaInferencer::infer_schema(clean, config_.default_schema);
        state = StatementState::SCHEMA_CHOSEN;

        state = StatementState::INVOKED;
        auto attempted = attempt(clean, schema, options);
        state = attempted.result.success ? StatementState::COMMITTED : StatementState::ROLLED_BACK;
        if (attempted.result.success) {
            return Outcome::ok(std::move(attempted.result.rows));
        }

        // A failed COMMIT means the statement already ran; running it again
        // under another schema would repeat its writes
        if (!attempted.commit_failed && schema != config_.default_schema) {
            retries_.fetch_add(1, std::memory_order_relaxed);
            const auto retry_msg = std::format("DB retry with default column definition {} ({})",
                config_.default_schema.to_sql(), utils::first_line(attempted.result.error_message));
            if (options.verbose) {
                utils::log::info(retry_msg);
            } else {
                utils::log::debug(retry_msg);
            }

            state = StatementState::INVOKED;
            attempted = attempt(clean, config_.default_schema, options);
            state = attempted.result.success ? StatementState::COMMITTED : StatementState::ROLLED_BACK;
            if (attempted.result.success) {
                return Outcome::ok(std::move(attempted.result.rows));
            }
        }

        const auto& message = attempted.result.error_message;

        state = StatementState::DONE;
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Cypher execution failed: {}", utils::first_line(message)));
        return Outcome::error(classify_error(message),
            std::format("{}{}", kErrorPrefix, utils::first_line(message)));

    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Cypher execution aborted in state {}: {}",
            statement_state_to_string(state), e.what()));
        return failure(e.what());
    }
}

ExecutionCoordinator::AttemptResult ExecutionCoordinator::attempt(
    const std::string& query, const ColumnSpec& schema, const ExecutionOptions& options) {
    bridge_invocations_.fetch_add(1, std::memory_order_relaxed);

    if (options.verbose) {
        utils::log::info(std::format("DB IN  > graph={} cols={} query={}",
            config_.graph_name, schema.to_sql(), query));
    }

    utils::Timer timer;
    BridgeResult result;
    try {
        result = bridge_->run_cypher(config_.graph_name, query, schema);
    } catch (const std::exception& e) {
        result = BridgeResult::error(e.what());
    }

    if (result.success) {
        commits_.fetch_add(1, std::memory_order_relaxed);
        BridgeResult committed;
        try {
            committed = bridge_->commit();
        } catch (const std::exception& e) {
            committed = BridgeResult::error(e.what());
        }
        if (!committed.success) {
            if (options.verbose) {
                utils::log::info(std::format("DB OUT < commit error={}",
                    utils::first_line(committed.error_message)));
            }
            return AttemptResult{BridgeResult::error(committed.error_message), true};
        }

        if (options.verbose) {
            utils::log::info(std::format("DB OUT < rows={} ({}us)",
                result.rows.size(), timer.elapsed_us().count()));
        }
        return AttemptResult{std::move(result), false};
    }

    rollbacks_.fetch_add(1, std::memory_order_relaxed);
    try {
        auto rolled_back = bridge_->rollback();
        if (!rolled_back.success) {
            utils::log::warn(std::format("Rollback failed: {}",
                utils::first_line(rolled_back.error_message)));
        }
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Rollback failed: {}", e.what()));
    }

    if (options.verbose) {
        utils::log::info(std::format("DB OUT < error={}", utils::first_line(result.error_message)));
    }
    return AttemptResult{std::move(result), false};
}

Outcome ExecutionCoordinator::failure(const std::string& message) {
    return Outcome::error(ErrorCategory::INTERNAL_ERROR,
        std::format("{}{}", kErrorPrefix, utils::first_line(message)));
}

} // namespace cypherbridge
