#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cypherbridge {

// ============================================================================
// Database Config
// ============================================================================

struct DatabaseConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string dbname = "postgres";
    std::string user = "postgres";
    std::string password;

    // Full libpq conninfo/URI; overrides the individual keys when set
    std::string connection_string;

    uint32_t query_timeout_ms = 0;

    /**
     * @brief libpq keyword/value connection string
     *
     * Values are single-quoted with backslash escaping, e.g.
     *   host='localhost' port='5432' dbname='postgres' user='postgres'
     */
    [[nodiscard]] std::string conninfo() const;
};

// ============================================================================
// Graph Config
// ============================================================================

struct GraphConfig {
    std::string name = "demo";
    std::string default_column = "result";

    // Run the AGE session bootstrap (extension, search_path, create_graph)
    bool initialize = true;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "warn";
    bool verbose = false;
};

// ============================================================================
// BridgeConfig - Complete parsed configuration
// ============================================================================

struct BridgeConfig {
    DatabaseConfig database;
    GraphConfig graph;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * Example:
 *   [database]
 *   host = "${PGHOST}"
 *   port = 5432
 *
 *   [graph]
 *   name = "demo"
 *
 *   [logging]
 *   level = "info"
 *
 * ${VAR} in string values is replaced with the environment variable
 * (empty if unset).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        BridgeConfig config;

        static LoadResult ok(BridgeConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to cypher_bridge.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Defaults taken from PGHOST, PGPORT, PGDATABASE, PGUSER,
     *        PGPASSWORD and AGE_GRAPH
     */
    [[nodiscard]] static BridgeConfig defaults_from_env();

    /**
     * @return One message per problem, empty if the config is valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const BridgeConfig& config);

private:
    static LoadResult validate_and_return(BridgeConfig config);
};

} // namespace cypherbridge
