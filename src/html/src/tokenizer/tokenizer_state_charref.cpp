/**
 * HTML Tokenizer - character reference handling
 */

#include "quarry/html/tokenizer.hpp"
#include <array>

namespace quarry::html {

namespace {

struct NamedEntity {
    std::string_view name;
    unicode::CodePoint code_point;
};

// Common named references. Matching requires the terminating ';'.
constexpr std::array<NamedEntity, 40> NAMED_ENTITIES = {{
    {"amp", '&'},      {"lt", '<'},        {"gt", '>'},        {"quot", '"'},
    {"apos", '\''},    {"nbsp", 0x00A0},   {"copy", 0x00A9},   {"reg", 0x00AE},
    {"trade", 0x2122}, {"hellip", 0x2026}, {"mdash", 0x2014},  {"ndash", 0x2013},
    {"lsquo", 0x2018}, {"rsquo", 0x2019},  {"ldquo", 0x201C},  {"rdquo", 0x201D},
    {"laquo", 0x00AB}, {"raquo", 0x00BB},  {"bull", 0x2022},   {"middot", 0x00B7},
    {"times", 0x00D7}, {"divide", 0x00F7}, {"deg", 0x00B0},    {"plusmn", 0x00B1},
    {"para", 0x00B6},  {"sect", 0x00A7},   {"cent", 0x00A2},   {"pound", 0x00A3},
    {"euro", 0x20AC},  {"yen", 0x00A5},    {"frac12", 0x00BD}, {"frac14", 0x00BC},
    {"larr", 0x2190},  {"rarr", 0x2192},   {"uarr", 0x2191},   {"darr", 0x2193},
    {"shy", 0x00AD},   {"iexcl", 0x00A1},  {"iquest", 0x00BF}, {"hearts", 0x2665},
}};

inline unicode::CodePoint sanitize_numeric_code(u32 code) {
    if (code == 0 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        return unicode::REPLACEMENT_CHARACTER;
    }

    // Windows-1252 remapping of the C1 range
    switch (code) {
        case 0x80: return 0x20AC;
        case 0x82: return 0x201A;
        case 0x83: return 0x0192;
        case 0x84: return 0x201E;
        case 0x85: return 0x2026;
        case 0x86: return 0x2020;
        case 0x87: return 0x2021;
        case 0x88: return 0x02C6;
        case 0x89: return 0x2030;
        case 0x8A: return 0x0160;
        case 0x8B: return 0x2039;
        case 0x8C: return 0x0152;
        case 0x8E: return 0x017D;
        case 0x91: return 0x2018;
        case 0x92: return 0x2019;
        case 0x93: return 0x201C;
        case 0x94: return 0x201D;
        case 0x95: return 0x2022;
        case 0x96: return 0x2013;
        case 0x97: return 0x2014;
        case 0x98: return 0x02DC;
        case 0x99: return 0x2122;
        case 0x9A: return 0x0161;
        case 0x9B: return 0x203A;
        case 0x9C: return 0x0153;
        case 0x9E: return 0x017E;
        case 0x9F: return 0x0178;
        default:
            break;
    }

    return static_cast<unicode::CodePoint>(code);
}

} // namespace

std::optional<String> Tokenizer::consume_character_reference(bool in_attribute) {
    auto cp = peek();
    if (!cp) {
        return std::nullopt;
    }

    if (*cp == '#') {
        usize pos = m_position + 1;
        bool hex = pos < m_input.size() && (m_input[pos] == 'x' || m_input[pos] == 'X');
        if (hex) {
            ++pos;
        }

        u32 code = 0;
        usize digits_start = pos;
        while (pos < m_input.size()) {
            auto c = static_cast<u8>(m_input[pos]);
            if (hex ? !unicode::is_ascii_hex_digit(c) : !unicode::is_ascii_digit(c)) {
                break;
            }
            u32 digit = unicode::is_ascii_digit(c) ? c - '0' : unicode::to_ascii_lower(c) - 'a' + 10;
            if (code <= 0x10FFFF) {
                code = code * (hex ? 16 : 10) + digit;
            }
            ++pos;
        }

        if (pos == digits_start) {
            parse_error("absence-of-digits-in-numeric-character-reference");
            return std::nullopt;
        }

        if (pos < m_input.size() && m_input[pos] == ';') {
            ++pos;
        } else {
            parse_error("missing-semicolon-after-character-reference");
        }

        m_position = pos;
        return String::from_code_point(sanitize_numeric_code(code));
    }

    for (const auto& entity : NAMED_ENTITIES) {
        std::string_view rest = std::string_view(m_input).substr(m_position);
        if (rest.size() > entity.name.size() &&
            rest.substr(0, entity.name.size()) == entity.name &&
            rest[entity.name.size()] == ';') {
            m_position += entity.name.size() + 1;
            return String::from_code_point(entity.code_point);
        }
    }

    // Unknown names stay literal; in attributes this is not even an error
    if (!in_attribute && unicode::is_ascii_alpha(static_cast<u8>(*cp))) {
        parse_error("unknown-named-character-reference");
    }
    return std::nullopt;
}

} // namespace quarry::html
