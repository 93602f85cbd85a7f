#include "loader/batch_file_loader.hpp"
#include "parser/statement_splitter.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <iterator>

namespace cypherbridge {

BatchFileLoader::BatchFileLoader(ExecutionCoordinator& coordinator)
    : coordinator_(coordinator) {}

std::vector<FileReport> BatchFileLoader::run_files(
    const std::vector<std::string>& paths,
    const ExecutionOptions& options,
    const StatementObserver& observer) {

    std::vector<FileReport> reports;
    reports.reserve(paths.size());
    for (const auto& path : paths) {
        reports.push_back(run_file(path, options, observer));
    }
    return reports;
}

FileReport BatchFileLoader::run_file(
    const std::string& path,
    const ExecutionOptions& options,
    const StatementObserver& observer) {

    std::ifstream file(path);
    if (!file.is_open()) {
        FileReport report;
        report.path = path;
        report.error_message = std::format("File '{}' not found", path);
        utils::log::error(report.error_message);
        return report;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        FileReport report;
        report.path = path;
        report.error_message = std::format("Error reading file '{}'", path);
        utils::log::error(report.error_message);
        return report;
    }

    return run_content(path, content, options, observer);
}

FileReport BatchFileLoader::run_content(
    const std::string& path,
    const std::string& content,
    const ExecutionOptions& options,
    const StatementObserver& observer) {

    FileReport report;
    report.path = path;
    report.opened = true;

    const auto statements = StatementSplitter::split(content);
    report.statements_total = statements.size();
    utils::log::info(std::format("Executing file {} ({} statements)", path, statements.size()));

    // One statement per call: a failure here must not stop the rest of the file
    ExecutionOptions per_statement = options;
    per_statement.on_statement = nullptr;

    for (size_t i = 0; i < statements.size(); ++i) {
        const auto outcome = coordinator_.execute_batch(statements[i], per_statement);
        if (outcome.is_error()) {
            ++report.statements_failed;
        }
        if (observer) {
            observer(path, i + 1, statements[i], outcome);
        }
    }

    if (report.statements_failed > 0) {
        utils::log::warn(std::format("File {}: {}/{} statements failed",
            path, report.statements_failed, report.statements_total));
    }
    return report;
}

} // namespace cypherbridge
