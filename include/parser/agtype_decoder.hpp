#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace cypherbridge {

/**
 * @brief Decodes AGE agtype text output into dynamic JSON values
 *
 * agtype is JSON plus type annotations on graph entities:
 *   {"id": 1, "label": "Person", "properties": {}}::vertex
 *   [{...}::vertex, {...}::edge, {...}::vertex]::path
 * Annotations outside string literals are stripped before parsing.
 * Anything that still is not valid JSON (e.g. NaN, Infinity) is kept
 * verbatim as a JSON string. Never throws.
 */
class AgtypeDecoder {
public:
    /**
     * @param text Cell text, nullopt for SQL NULL
     */
    [[nodiscard]] static nlohmann::json decode(const std::optional<std::string>& text);

    [[nodiscard]] static nlohmann::json decode(std::string_view text);

    /**
     * @brief Remove ::vertex / ::edge / ::path / ::numeric annotations
     */
    [[nodiscard]] static std::string strip_annotations(std::string_view text);
};

} // namespace cypherbridge
