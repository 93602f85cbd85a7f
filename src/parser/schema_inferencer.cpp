#include "parser/schema_inferencer.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <format>
#include <regex>
#include <string_view>

namespace cypherbridge {

namespace {

constexpr std::array<std::string_view, 4> kClauseEnds = {"order", "limit", "skip", "union"};

// Compiled once; std::regex construction dominates the cost of a lookup.
// Only the keyword is matched by regex, the projection itself is scanned by
// hand so its length is not bounded by regex recursion depth.
const std::regex& return_keyword_regex() {
    static const std::regex re(R"(\bRETURN\s+)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

size_t skip_spaces(const std::string& s, size_t pos) {
    while (pos < s.size() && is_space(s[pos])) ++pos;
    return pos;
}

// Start of the first whitespace run at or after pos that is followed by a
// clause keyword, else npos
size_t find_clause_end(const std::string& lower, size_t pos) {
    for (size_t i = pos; i < lower.size(); ++i) {
        if (!is_space(lower[i])) continue;
        const size_t word = skip_spaces(lower, i);
        for (const auto kw : kClauseEnds) {
            if (lower.compare(word, kw.size(), kw) == 0) {
                return i;
            }
        }
        i = word;
    }
    return std::string::npos;
}

// Identifier after "\s+AS\s+", else empty
std::string find_alias(const std::string& item) {
    for (size_t i = 0; i < item.size(); ++i) {
        if (!is_space(item[i])) continue;
        const size_t kw = skip_spaces(item, i);
        if (kw + 2 < item.size() &&
            std::tolower(static_cast<unsigned char>(item[kw])) == 'a' &&
            std::tolower(static_cast<unsigned char>(item[kw + 1])) == 's' &&
            is_space(item[kw + 2])) {
            const size_t name = skip_spaces(item, kw + 2);
            size_t name_end = name;
            while (name_end < item.size() && is_word(item[name_end])) ++name_end;
            if (name_end > name) {
                return item.substr(name, name_end - name);
            }
        }
        i = kw - 1;
    }
    return {};
}

std::string first_token(const std::string& item) {
    size_t start = 0;
    while (start < item.size() && !is_word(item[start])) ++start;
    size_t end = start;
    while (end < item.size() && is_word(item[end])) ++end;
    return item.substr(start, end - start);
}

} // anonymous namespace

ColumnSpec SchemaInferencer::infer_schema(
    const std::string& statement, const ColumnSpec& default_schema) {

    const auto projection = extract_projection(statement);
    if (!projection) {
        return default_schema;
    }

    const auto items = split_items(*projection);
    if (items.size() <= 1) {
        return default_schema;
    }

    std::vector<std::string> names;
    names.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        names.push_back(column_name(items[i], i + 1));
    }
    return ColumnSpec::from_names(names);
}

std::optional<std::string> SchemaInferencer::extract_projection(const std::string& statement) {
    const std::string q = utils::trim(statement);

    std::smatch match;
    if (!std::regex_search(q, match, return_keyword_regex())) {
        return std::nullopt;
    }

    const size_t start = static_cast<size_t>(match.position(0) + match.length(0));
    if (start >= q.size()) {
        return std::nullopt;
    }
    // The projection holds at least one character before a clause keyword
    const size_t end = find_clause_end(utils::to_lower(q), start + 1);
    return utils::trim(q.substr(start, end == std::string::npos ? std::string::npos : end - start));
}

std::vector<std::string> SchemaInferencer::split_items(const std::string& projection) {
    std::vector<std::string> items;
    size_t start = 0;
    while (true) {
        const size_t comma = projection.find(',', start);
        if (comma == std::string::npos) {
            items.push_back(utils::trim(projection.substr(start)));
            break;
        }
        items.push_back(utils::trim(projection.substr(start, comma - start)));
        start = comma + 1;
    }
    return items;
}

std::string SchemaInferencer::column_name(const std::string& item, size_t position) {
    if (auto alias = find_alias(item); !alias.empty()) {
        return alias;
    }
    if (auto token = first_token(item); !token.empty()) {
        return token;
    }
    return std::format("col{}", position);
}

} // namespace cypherbridge
