#pragma once

#include <optional>
#include <regex>
#include <string>

namespace cypherbridge {

/**
 * @brief Unwraps Cypher text that arrives wrapped in bridge-call syntax
 *
 * Upstream generators sometimes echo the relational wrapper instead of
 * pure Cypher. Patterns are tried against the trimmed input, in order,
 * case-insensitively and across line breaks:
 *   1. SELECT * FROM cypher(<graph>, $$ <body> $$) AS (<cols>);
 *   2. cypher(<graph>, $$ <body> $$)
 *   3. no match: the input itself
 * The result is trimmed with trailing terminators stripped. Tagged dollar
 * quotes ($tag$ ... $tag$) are accepted as well.
 *
 * Only the call prefix is matched with a regex; the body is located with
 * plain string searches, so its length is not bounded by regex recursion.
 *
 * sanitize() is idempotent on its own output.
 */
class QuerySanitizer {
public:
    static constexpr const char* kDefaultFunction = "cypher";

    /**
     * @param function_name Bridge function to recognize (e.g. "cypher")
     */
    explicit QuerySanitizer(const std::string& function_name = kDefaultFunction);

    [[nodiscard]] std::string sanitize(const std::string& text) const;

    /**
     * @brief True if the text matches either wrapper pattern
     */
    [[nodiscard]] bool is_wrapped(const std::string& text) const;

    [[nodiscard]] const std::string& function_name() const { return function_name_; }

private:
    static std::string escape_regex(const std::string& s);

    // Body of the first call starting at a prefix match, or nullopt
    static std::optional<std::string> unwrap(
        const std::string& text, const std::regex& prefix, bool require_alias);

    std::string function_name_;
    std::regex full_prefix_regex_;
    std::regex bare_prefix_regex_;
};

} // namespace cypherbridge
