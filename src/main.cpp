#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/age_bridge.hpp"
#include "executor/execution_coordinator.hpp"
#include "loader/batch_file_loader.hpp"
#include "cli/result_formatter.hpp"
#include "parser/statement_splitter.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace cypherbridge;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitStatementFailed = 1;
constexpr int kExitSetupFailed = 2;

struct CliArgs {
    std::optional<std::string> config_file;
    std::optional<std::string> execute_text;
    std::vector<std::string> files;
    bool verbose = false;
    bool initialize = true;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cout << std::format(
        "Usage: {} [-c config.toml] [-v] [-e \"<cypher>\"] [--no-init] [files...]\n"
        "\n"
        "  -c, --config FILE    TOML configuration (default: PG* / AGE_GRAPH environment)\n"
        "  -e, --execute TEXT   Cypher statements to run after the files\n"
        "  -v, --verbose        Trace bridge calls\n"
        "      --no-init        Skip the AGE session bootstrap\n"
        "  -h, --help           Show this help\n"
        "\n"
        "Without -e or files, statements are read from standard input.\n",
        prog);
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--no-init") {
            args.initialize = false;
        } else if (arg == "-c" || arg == "--config" || arg == "-e" || arg == "--execute") {
            if (i + 1 >= argc) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return std::nullopt;
            }
            if (arg == "-c" || arg == "--config") {
                args.config_file = argv[++i];
            } else {
                args.execute_text = argv[++i];
            }
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << std::format("Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            args.files.push_back(arg);
        }
    }
    return args;
}

void print_outcome(const Outcome& outcome) {
    if (outcome.is_ok()) {
        std::cout << ResultFormatter::format_rows(outcome.value()) << "\n";
    } else {
        std::cout << outcome.error_message() << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return kExitSetupFailed;
    }
    if (args->help) {
        print_usage(argv[0]);
        return kExitOk;
    }

    try {
        // Configuration
        BridgeConfig config = ConfigLoader::defaults_from_env();
        if (args->config_file) {
            auto config_result = ConfigLoader::load_from_file(*args->config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return kExitSetupFailed;
            }
            config = std::move(config_result.config);
        } else if (const auto errors = ConfigLoader::validate_config(config); !errors.empty()) {
            for (const auto& err : errors) {
                utils::log::error(err);
            }
            return kExitSetupFailed;
        }

        const bool verbose = args->verbose || config.logging.verbose;
        auto level = utils::log::parse_level(config.logging.level).value_or(utils::log::Level::WARN);
        if (verbose && level > utils::log::Level::INFO) {
            level = utils::log::Level::INFO;
        }
        utils::log::set_level(level);

        std::cout << std::format("Cypher bridge for AGE/PostgreSQL - graph: {}\n", config.graph.name);

        // Connection
        PgConnectionFactory factory;
        std::shared_ptr<IDbConnection> conn = factory.create(config.database.conninfo());
        if (!conn) {
            std::cerr << "Database connection failed. "
                         "Please ensure the PostgreSQL server is running and accessible.\n";
            return kExitSetupFailed;
        }
        if (config.database.query_timeout_ms > 0 &&
            !conn->set_query_timeout(config.database.query_timeout_ms)) {
            utils::log::warn(std::format("Could not set statement_timeout to {}ms",
                config.database.query_timeout_ms));
        }

        auto bridge = std::make_shared<AgeBridge>(conn);
        if (args->initialize && config.graph.initialize) {
            const size_t ok = bridge->initialize(config.graph.name);
            utils::log::info(std::format("AGE bootstrap: {}/{} statements succeeded",
                ok, AgeBridge::bootstrap_statements(config.graph.name).size()));
        }

        ExecutionCoordinator::Config coordinator_config;
        coordinator_config.graph_name = config.graph.name;
        coordinator_config.default_schema = ColumnSpec::default_schema(config.graph.default_column);
        ExecutionCoordinator coordinator(bridge, coordinator_config);

        ExecutionOptions options;
        options.verbose = verbose;
        options.on_statement = [](size_t index, const std::string& /*statement*/,
                                  const Outcome& outcome) {
            std::cout << std::format("\n--- Statement {} ---\n", index);
            print_outcome(outcome);
        };

        bool any_failed = false;

        // Files
        if (!args->files.empty()) {
            BatchFileLoader loader(coordinator);
            const auto reports = loader.run_files(args->files, options,
                [](const std::string& /*path*/, size_t index,
                   const std::string& statement, const Outcome& outcome) {
                    std::cout << std::format("\nStatement {}:\ncypher> {}\n", index, statement);
                    print_outcome(outcome);
                });
            for (const auto& report : reports) {
                if (!report.opened) {
                    std::cout << std::format("Error: {}\n", report.error_message);
                }
                if (!report.opened || report.statements_failed > 0) {
                    any_failed = true;
                }
            }
        }

        // Inline text, or stdin when nothing else was given
        std::optional<std::string> batch_text = args->execute_text;
        if (!batch_text && args->files.empty()) {
            batch_text = std::string((std::istreambuf_iterator<char>(std::cin)),
                                     std::istreambuf_iterator<char>());
        }

        if (batch_text) {
            const auto outcome = coordinator.execute_batch(*batch_text, options);
            // Multi-statement batches were already printed statement by statement
            if (StatementSplitter::split(*batch_text).size() <= 1) {
                print_outcome(outcome);
            }
            if (outcome.is_error()) {
                any_failed = true;
            }
        }

        const auto stats = coordinator.get_stats();
        utils::log::info(std::format(
            "Done: {} statements, {} bridge calls, {} retries, {} failures",
            stats.statements_executed, stats.bridge_invocations, stats.retries, stats.failures));

        return any_failed ? kExitStatementFailed : kExitOk;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitSetupFailed;
    }
}
