#include "parser/statement_splitter.hpp"
#include "core/utils.hpp"

namespace cypherbridge {

std::vector<std::string> StatementSplitter::split(const std::string& text, char terminator) {
    std::vector<std::string> statements;
    for (const auto& piece : utils::split(text, terminator)) {
        auto stmt = utils::trim(piece);
        if (!stmt.empty()) {
            statements.push_back(std::move(stmt));
        }
    }
    return statements;
}

} // namespace cypherbridge
