#pragma once

#include "executor/execution_coordinator.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cypherbridge {

/**
 * @brief Result of running one Cypher file
 */
struct FileReport {
    std::string path;
    bool opened = false;
    size_t statements_total = 0;
    size_t statements_failed = 0;
    std::string error_message;
};

/**
 * @brief Runs Cypher script files through an ExecutionCoordinator
 *
 * Files run in the given order; inside a file every statement runs even
 * if an earlier one failed. A missing file is reported and skipped.
 */
class BatchFileLoader {
public:
    using StatementObserver = std::function<void(
        const std::string& path, size_t index,
        const std::string& statement, const Outcome& outcome)>;

    explicit BatchFileLoader(ExecutionCoordinator& coordinator);

    [[nodiscard]] std::vector<FileReport> run_files(
        const std::vector<std::string>& paths,
        const ExecutionOptions& options = {},
        const StatementObserver& observer = nullptr);

    [[nodiscard]] FileReport run_file(
        const std::string& path,
        const ExecutionOptions& options = {},
        const StatementObserver& observer = nullptr);

    /**
     * @brief Run statements already read from a file
     */
    [[nodiscard]] FileReport run_content(
        const std::string& path,
        const std::string& content,
        const ExecutionOptions& options = {},
        const StatementObserver& observer = nullptr);

private:
    ExecutionCoordinator& coordinator_;
};

} // namespace cypherbridge
