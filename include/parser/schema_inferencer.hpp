#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cypherbridge {

/**
 * @brief Derives the bridge column schema from a Cypher RETURN clause
 *
 * Heuristic, not a grammar:
 * - The projection is the text after the first RETURN keyword, up to the
 *   next ORDER / LIMIT / SKIP / UNION keyword or end of input.
 * - Items are split on every comma. Parentheses, brackets and quotes are
 *   not tracked, so "RETURN {a: 1, b: 2}" counts as two items.
 * - No RETURN, or a single item: the default schema. A lone projected value
 *   may be an arbitrarily nested map or path, so it is never named.
 * - Two or more items: one agtype column per item, named by
 *   "AS alias" -> first identifier-like token -> "col<N>" (1-based).
 *
 * Example:
 *   "MATCH (n) RETURN n AS node, n.name AS name LIMIT 5"
 *   -> (node agtype, name agtype)
 */
class SchemaInferencer {
public:
    [[nodiscard]] static ColumnSpec infer_schema(
        const std::string& statement, const ColumnSpec& default_schema);

    /**
     * @brief Extract the raw projection text following RETURN
     * @return Trimmed projection, or nullopt if there is no RETURN clause
     */
    [[nodiscard]] static std::optional<std::string> extract_projection(const std::string& statement);

    /**
     * @brief Split a projection on commas, trimming each item (empty items kept)
     */
    [[nodiscard]] static std::vector<std::string> split_items(const std::string& projection);

    /**
     * @brief Column name for one projected item
     * @param position 1-based item position, used for the col<N> fallback
     */
    [[nodiscard]] static std::string column_name(const std::string& item, size_t position);
};

} // namespace cypherbridge
