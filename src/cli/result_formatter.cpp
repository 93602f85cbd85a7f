#include "cli/result_formatter.hpp"

namespace cypherbridge {

namespace {

std::string join_tabs(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += '\t';
        out += fields[i];
    }
    return out;
}

} // anonymous namespace

std::string ResultFormatter::format_rows(const RowSet& rows) {
    if (rows.empty()) {
        return kNoResults;
    }

    std::string out;
    const std::vector<std::string>* header = nullptr;
    for (const auto& row : rows) {
        if (!header || *header != row.columns) {
            if (header) out += "\n\n";
            header = &row.columns;
            out += join_tabs(*header);
        }

        std::vector<std::string> cells;
        cells.reserve(header->size());
        for (size_t i = 0; i < header->size(); ++i) {
            cells.push_back(i < row.values.size() ? format_value(row.values[i]) : "");
        }
        out += '\n';
        out += join_tabs(cells);
    }
    return out;
}

std::string ResultFormatter::format_value(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

} // namespace cypherbridge
