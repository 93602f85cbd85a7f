#pragma once

#include <string>
#include <vector>

namespace cypherbridge {

/**
 * @brief Splits raw multi-statement text into individual statements
 *
 * Splits on the terminator, trims each piece and drops pieces that are
 * empty after trimming. Terminators inside string literals or nested
 * structures are NOT recognized: "RETURN 'a;b'" splits into two pieces.
 *
 * Example:
 *   Input:  "MATCH (n) RETURN n;\n  ;CREATE (:A);"
 *   Output: ["MATCH (n) RETURN n", "CREATE (:A)"]
 */
class StatementSplitter {
public:
    static constexpr char kTerminator = ';';

    [[nodiscard]] static std::vector<std::string> split(
        const std::string& text, char terminator = kTerminator);
};

} // namespace cypherbridge
