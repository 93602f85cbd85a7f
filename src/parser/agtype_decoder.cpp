#include "parser/agtype_decoder.hpp"

#include <array>
#include <cctype>

namespace cypherbridge {

namespace {

constexpr std::array<std::string_view, 4> kAnnotations = {
    "vertex", "edge", "path", "numeric"
};

// Length of a recognized annotation starting at pos ("::vertex" -> 8), else 0
size_t annotation_length(std::string_view text, size_t pos) {
    if (text.substr(pos, 2) != "::") return 0;
    for (const auto name : kAnnotations) {
        if (text.substr(pos + 2, name.size()) != name) continue;
        const size_t end = pos + 2 + name.size();
        if (end < text.size()) {
            const auto next = static_cast<unsigned char>(text[end]);
            if (std::isalnum(next) || next == '_') continue;
        }
        return 2 + name.size();
    }
    return 0;
}

} // anonymous namespace

nlohmann::json AgtypeDecoder::decode(const std::optional<std::string>& text) {
    if (!text) {
        return nullptr;
    }
    return decode(std::string_view(*text));
}

nlohmann::json AgtypeDecoder::decode(std::string_view text) {
    const std::string stripped = strip_annotations(text);
    auto value = nlohmann::json::parse(stripped, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded()) {
        return std::string(text);
    }
    return value;
}

std::string AgtypeDecoder::strip_annotations(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool in_string = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            out += c;
            if (c == '\\' && i + 1 < text.size()) {
                out += text[++i];
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            out += c;
            continue;
        }

        if (const size_t len = annotation_length(text, i); len > 0) {
            i += len - 1;
            continue;
        }
        out += c;
    }
    return out;
}

} // namespace cypherbridge
