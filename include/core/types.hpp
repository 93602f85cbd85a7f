#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace cypherbridge {

// ============================================================================
// Graph Value Type
// ============================================================================

// AGE exposes every graph result column as a single dynamically-typed kind.
inline constexpr const char* kGraphValueType = "agtype";
inline constexpr const char* kDefaultColumnName = "result";

// ============================================================================
// Column Schema
// ============================================================================

struct ColumnDef {
    std::string name;
    std::string type_name = kGraphValueType;

    bool operator==(const ColumnDef& other) const = default;
};

/**
 * @brief Ordered, non-empty column schema declared to the bridge
 *
 * Every column uses the GraphValue type. Constructed either as the
 * single-column default schema or from a list of inferred names.
 */
class ColumnSpec {
public:
    /**
     * @brief Single-column schema, e.g. "(result agtype)"
     */
    [[nodiscard]] static ColumnSpec default_schema(const std::string& name = kDefaultColumnName);

    /**
     * @brief Build from column names (falls back to the default schema if empty)
     */
    [[nodiscard]] static ColumnSpec from_names(const std::vector<std::string>& names);

    [[nodiscard]] const std::vector<ColumnDef>& columns() const { return columns_; }
    [[nodiscard]] size_t size() const { return columns_.size(); }
    [[nodiscard]] std::vector<std::string> names() const;

    /**
     * @brief Render the column definition list, e.g. "(a agtype, b agtype)"
     */
    [[nodiscard]] std::string to_sql() const;

    bool operator==(const ColumnSpec& other) const = default;

private:
    ColumnSpec() = default;

    std::vector<ColumnDef> columns_;
};

// ============================================================================
// Rows and Outcomes
// ============================================================================

/**
 * @brief One result row keyed by the declared column names, in declared order
 */
struct Row {
    std::vector<std::string> columns;
    std::vector<nlohmann::json> values;

    [[nodiscard]] size_t size() const { return values.size(); }

    /**
     * @brief Look up a value by column name
     * @return Pointer to the value, or nullptr if the column is not declared
     */
    [[nodiscard]] const nlohmann::json* find(const std::string& column) const;
};

using RowSet = std::vector<Row>;

// Success(rows) or Failure(single-line message)
using Outcome = Result<RowSet>;

} // namespace cypherbridge
