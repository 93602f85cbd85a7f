#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace cypherbridge {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

std::string getenv_or(const char* key, const std::string& default_val) {
    const char* val = std::getenv(key);
    return val ? std::string(val) : default_val;
}

// Quote a libpq conninfo value: 'a b' -> 'a b', it's -> 'it\'s'
std::string quote_conninfo_value(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

// ---- Section extractors ----------------------------------------------------

DatabaseConfig extract_database(const toml::table& root, DatabaseConfig cfg) {
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.host = d["host"].value_or(cfg.host);
    cfg.port = static_cast<int>(d["port"].value_or(static_cast<int64_t>(cfg.port)));
    cfg.dbname = d["dbname"].value_or(cfg.dbname);
    cfg.user = d["user"].value_or(cfg.user);
    cfg.password = d["password"].value_or(cfg.password);
    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.query_timeout_ms = static_cast<uint32_t>(d["query_timeout_ms"].value_or(int64_t{0}));
    return cfg;
}

GraphConfig extract_graph(const toml::table& root, GraphConfig cfg) {
    const auto* graph = root["graph"].as_table();
    if (!graph) return cfg;
    const auto& g = *graph;

    cfg.name = g["name"].value_or(cfg.name);
    cfg.default_column = g["default_column"].value_or(cfg.default_column);
    cfg.initialize = g["initialize"].value_or(cfg.initialize);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root, LoggingConfig cfg) {
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or(cfg.level);
    cfg.verbose = l["verbose"].value_or(cfg.verbose);
    return cfg;
}

BridgeConfig extract_all_sections(const toml::table& root) {
    // Keys absent from the file keep their environment defaults
    BridgeConfig cfg = ConfigLoader::defaults_from_env();
    cfg.database = extract_database(root, cfg.database);
    cfg.graph = extract_graph(root, cfg.graph);
    cfg.logging = extract_logging(root, cfg.logging);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// DatabaseConfig
// ============================================================================

std::string DatabaseConfig::conninfo() const {
    if (!connection_string.empty()) {
        return connection_string;
    }

    std::string info = std::format("host={} port={} dbname={} user={}",
        quote_conninfo_value(host), quote_conninfo_value(std::to_string(port)),
        quote_conninfo_value(dbname), quote_conninfo_value(user));
    if (!password.empty()) {
        info += std::format(" password={}", quote_conninfo_value(password));
    }
    return info;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

BridgeConfig ConfigLoader::defaults_from_env() {
    BridgeConfig cfg;
    cfg.database.host = getenv_or("PGHOST", cfg.database.host);
    cfg.database.port = utils::parse_int<int>(
        getenv_or("PGPORT", std::to_string(cfg.database.port)), cfg.database.port);
    cfg.database.dbname = getenv_or("PGDATABASE", cfg.database.dbname);
    cfg.database.user = getenv_or("PGUSER", cfg.database.user);
    cfg.database.password = getenv_or("PGPASSWORD", cfg.database.password);
    cfg.graph.name = getenv_or("AGE_GRAPH", cfg.graph.name);
    return cfg;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(BridgeConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const BridgeConfig& config) {
    std::vector<std::string> errors;

    if (config.database.connection_string.empty()) {
        if (config.database.port < 1 || config.database.port > 65535) {
            errors.push_back(std::format("database.port must be 1-65535, got {}",
                config.database.port));
        }
        if (config.database.host.empty()) {
            errors.push_back("database.host must not be empty");
        }
    }

    if (!utils::is_identifier(config.graph.name)) {
        errors.push_back(std::format("graph.name must be an identifier, got '{}'",
            config.graph.name));
    }
    if (!utils::is_identifier(config.graph.default_column)) {
        errors.push_back(std::format("graph.default_column must be an identifier, got '{}'",
            config.graph.default_column));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace cypherbridge
