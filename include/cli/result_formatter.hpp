#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace cypherbridge {

/**
 * @brief Plain-text rendering of result rows for the command line
 *
 * Tab-separated: a header line of column names, then one line per row.
 * Rows of a multi-statement batch may carry different columns; a blank line
 * and a new header are printed wherever the column set changes. Strings
 * print raw, null as "null", anything else as compact JSON.
 */
class ResultFormatter {
public:
    static constexpr const char* kNoResults = "(no results)";

    [[nodiscard]] static std::string format_rows(const RowSet& rows);

    [[nodiscard]] static std::string format_value(const nlohmann::json& value);
};

} // namespace cypherbridge
