#include "parser/query_sanitizer.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <iterator>

namespace cypherbridge {

namespace {

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

// Matches \s+AS\s*\([^)]+\) at pos
bool alias_list_at(const std::string& s, size_t pos) {
    size_t i = skip_spaces(s, pos);
    if (i == pos || i + 2 > s.size()) return false;
    if (std::tolower(static_cast<unsigned char>(s[i])) != 'a' ||
        std::tolower(static_cast<unsigned char>(s[i + 1])) != 's') {
        return false;
    }
    i = skip_spaces(s, i + 2);
    if (i >= s.size() || s[i] != '(') return false;
    const size_t close = s.find(')', i + 1);
    return close != std::string::npos && close > i + 1;
}

} // anonymous namespace

QuerySanitizer::QuerySanitizer(const std::string& function_name)
    : function_name_(function_name) {
    const auto fn = escape_regex(function_name_);
    const auto flags = std::regex::ECMAScript | std::regex::icase;

    full_prefix_regex_ = std::regex(
        std::format(R"(SELECT\s+\*\s+FROM\s+{}\()", fn), flags);
    bare_prefix_regex_ = std::regex(
        std::format(R"({}\()", fn), flags);
}

std::string QuerySanitizer::sanitize(const std::string& text) const {
    const std::string s = utils::trim(text);

    if (auto body = unwrap(s, full_prefix_regex_, /*require_alias=*/true)) {
        return utils::strip_terminators(*body);
    }
    if (auto body = unwrap(s, bare_prefix_regex_, /*require_alias=*/false)) {
        return utils::strip_terminators(*body);
    }
    return utils::strip_terminators(s);
}

bool QuerySanitizer::is_wrapped(const std::string& text) const {
    const std::string s = utils::trim(text);
    return unwrap(s, full_prefix_regex_, true).has_value() ||
           unwrap(s, bare_prefix_regex_, false).has_value();
}

std::optional<std::string> QuerySanitizer::unwrap(
    const std::string& text, const std::regex& prefix, bool require_alias) {

    const auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), prefix); it != end; ++it) {
        const size_t args = static_cast<size_t>(it->position(0) + it->length(0));

        // Graph argument runs up to the first '$', which must open $tag$
        const size_t open = text.find('$', args);
        if (open == std::string::npos) continue;
        size_t tag_end = open + 1;
        while (tag_end < text.size() && is_word(text[tag_end])) ++tag_end;
        if (tag_end >= text.size() || text[tag_end] != '$') continue;

        const std::string tag = text.substr(open, tag_end - open + 1);
        const std::string closing = tag + ")";
        const size_t body_start = tag_end + 1;

        // First closing quote that leaves a non-empty body (and, for the
        // full wrapper, is followed by the column list)
        size_t search = body_start + 1;
        while (search <= text.size()) {
            const size_t close = text.find(closing, search);
            if (close == std::string::npos) break;
            if (!require_alias || alias_list_at(text, close + closing.size())) {
                return text.substr(body_start, close - body_start);
            }
            search = close + 1;
        }
    }
    return std::nullopt;
}

std::string QuerySanitizer::escape_regex(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 2);
    for (const char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

} // namespace cypherbridge
