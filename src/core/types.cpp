#include "core/types.hpp"

#include <format>

namespace cypherbridge {

// ============================================================================
// ColumnSpec
// ============================================================================

ColumnSpec ColumnSpec::default_schema(const std::string& name) {
    ColumnSpec spec;
    spec.columns_.push_back(ColumnDef{name, kGraphValueType});
    return spec;
}

ColumnSpec ColumnSpec::from_names(const std::vector<std::string>& names) {
    if (names.empty()) {
        return default_schema();
    }

    ColumnSpec spec;
    spec.columns_.reserve(names.size());
    for (const auto& name : names) {
        spec.columns_.push_back(ColumnDef{name, kGraphValueType});
    }
    return spec;
}

std::vector<std::string> ColumnSpec::names() const {
    std::vector<std::string> result;
    result.reserve(columns_.size());
    for (const auto& col : columns_) {
        result.push_back(col.name);
    }
    return result;
}

std::string ColumnSpec::to_sql() const {
    std::string sql = "(";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += std::format("{} {}", columns_[i].name, columns_[i].type_name);
    }
    sql += ")";
    return sql;
}

// ============================================================================
// Row
// ============================================================================

const nlohmann::json* Row::find(const std::string& column) const {
    for (size_t i = 0; i < columns.size() && i < values.size(); ++i) {
        if (columns[i] == column) {
            return &values[i];
        }
    }
    return nullptr;
}

} // namespace cypherbridge
