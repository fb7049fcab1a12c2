/**
 * CSS selector parser
 */

#include "quarry/css/selector_parser.hpp"
#include "quarry/core/logger.hpp"

namespace quarry::css {

namespace {

inline bool is_name_start(char c) {
    auto u = static_cast<u8>(c);
    return unicode::is_ascii_alpha(u) || c == '_' || u >= 0x80;
}

inline bool is_name_char(char c) {
    auto u = static_cast<u8>(c);
    return unicode::is_ascii_alphanumeric(u) || c == '-' || c == '_' || u >= 0x80;
}

std::string describe(const SelectorError& error, const String& input) {
    StringBuilder sb;
    sb.append(error.message);
    sb.append(" at position ");
    sb.append(static_cast<u64>(error.position));
    sb.append(" in \"");
    sb.append(input);
    sb.append("\"");
    return std::string(sb.view());
}

} // namespace

// ============================================================================
// SelectorParserException
// ============================================================================

SelectorParserException::SelectorParserException(const SelectorError& error, const String& input)
    : std::runtime_error(describe(error, input))
    , m_message(error.message)
    , m_position(error.position)
    , m_input(input)
{
}

// ============================================================================
// SelectorParser
// ============================================================================

Result<SelectorGroup, SelectorError> SelectorParser::parse(const String& input) {
    reset(input);
    auto result = parse_selector_group();
    if (result.is_err()) {
        auto& log = logging::get("css");
        if (log.is_enabled(LogLevel::Debug)) {
            log.debug(describe(result.error(), input));
        }
    }
    return result;
}

Result<Selector, SelectorError> SelectorParser::parse_selector(const String& input) {
    auto group = parse(input);
    if (group.is_err()) {
        return make_error(std::move(group).error());
    }
    if (group.value().size() != 1) {
        auto comma = input.find(',');
        return error_at("expected a single selector, found a group", comma.value_or(0));
    }
    return group.value()[0];
}

Result<SelectorGroup, SelectorError> SelectorParser::parse_selector_group() {
    std::vector<Selector> selectors;

    skip_whitespace();
    if (at_end()) {
        return error("selector group is empty");
    }

    while (true) {
        skip_whitespace();
        if (at_end() || peek() == ',') {
            return error("empty selector in group");
        }

        auto selector = parse_complex_selector();
        if (selector.is_err()) {
            return make_error(std::move(selector).error());
        }
        selectors.push_back(std::move(selector).value());

        // parse_complex_selector stops at end of input or at a comma
        if (at_end()) {
            break;
        }
        consume(); // ,
    }

    return SelectorGroup(std::move(selectors));
}

Result<Selector, SelectorError> SelectorParser::parse_complex_selector() {
    std::vector<SelectorPart> parts;

    if (at_combinator_glyph()) {
        return error("combinator without a preceding selector");
    }

    auto compound = parse_compound_selector();
    if (compound.is_err()) {
        return make_error(std::move(compound).error());
    }

    while (true) {
        bool had_whitespace = skip_whitespace();
        if (at_end() || peek() == ',') {
            parts.push_back({std::move(compound).value(), std::nullopt});
            break;
        }

        Combinator combinator = Combinator::Descendant;
        if (at_combinator_glyph()) {
            char glyph = consume();
            combinator = glyph == '>' ? Combinator::Child
                       : glyph == '+' ? Combinator::NextSibling
                       : Combinator::SubsequentSibling;
            skip_whitespace();
            if (at_end() || peek() == ',') {
                return error("unexpected end at combinator");
            }
            if (at_combinator_glyph()) {
                return error("consecutive combinators");
            }
        } else if (had_whitespace) {
            combinator = Combinator::Descendant;
        } else {
            return error("unexpected character in selector");
        }

        parts.push_back({std::move(compound).value(), combinator});

        compound = parse_compound_selector();
        if (compound.is_err()) {
            return make_error(std::move(compound).error());
        }
    }

    return Selector(std::move(parts));
}

Result<CompoundSelector, SelectorError> SelectorParser::parse_compound_selector() {
    CompoundSelector compound;
    bool any = false;

    if (peek() == '*') {
        consume();
        any = true;
    } else if (at_ident_start()) {
        compound.tag = consume_ident().to_lowercase();
        any = true;
    }

    while (!at_end()) {
        char c = peek();

        if (c == '#') {
            usize start = m_position;
            consume();
            if (compound.id) {
                return error_at("multiple id selectors found", start);
            }
            String id = consume_ident();
            if (id.empty()) {
                return error("expected identifier after '#'");
            }
            compound.id = std::move(id);
        } else if (c == '.') {
            consume();
            String class_name = consume_ident();
            if (class_name.empty()) {
                return error("expected identifier after '.'");
            }
            compound.classes.push_back(std::move(class_name));
        } else if (c == '[') {
            auto attr = parse_attribute_selector();
            if (attr.is_err()) {
                return make_error(std::move(attr).error());
            }
            compound.attributes.push_back(std::move(attr).value());
        } else if (c == ':') {
            if (peek(1) == ':') {
                return error("pseudo-elements not supported");
            }
            return error("pseudo-classes not supported");
        } else if (c == '*' || at_ident_start()) {
            return error("type selector must come first in a compound selector");
        } else {
            break;
        }
        any = true;
    }

    if (!any) {
        return error("expecting simple selector, found none");
    }

    return compound;
}

Result<AttributeSelector, SelectorError> SelectorParser::parse_attribute_selector() {
    usize open = m_position;
    consume(); // [

    skip_whitespace();

    AttributeSelector sel;
    sel.attribute = consume_ident().to_lowercase();
    if (sel.attribute.empty()) {
        if (at_end()) {
            return error_at("unterminated attribute selector", open);
        }
        return error("expected attribute name");
    }

    skip_whitespace();
    if (at_end()) {
        return error_at("unterminated attribute selector", open);
    }

    if (peek() == ']') {
        consume();
        sel.matcher = AttributeSelector::Matcher::Exists;
        return sel;
    }

    // Matcher
    char first = peek();
    if (first == '=') {
        consume();
        sel.matcher = AttributeSelector::Matcher::Equals;
    } else if (peek(1) == '=' && (first == '~' || first == '|' || first == '^' ||
                                  first == '$' || first == '*')) {
        consume();
        consume();
        switch (first) {
            case '~': sel.matcher = AttributeSelector::Matcher::Includes; break;
            case '|': sel.matcher = AttributeSelector::Matcher::DashMatch; break;
            case '^': sel.matcher = AttributeSelector::Matcher::Prefix; break;
            case '$': sel.matcher = AttributeSelector::Matcher::Suffix; break;
            default:  sel.matcher = AttributeSelector::Matcher::Substring; break;
        }
    } else {
        return error("unknown attribute operator");
    }

    skip_whitespace();
    if (at_end()) {
        return error_at("unterminated attribute selector", open);
    }

    // Value
    if (peek() == '"' || peek() == '\'') {
        auto value = parse_quoted_string();
        if (value.is_err()) {
            return make_error(std::move(value).error());
        }
        sel.value = std::move(value).value();
    } else {
        sel.value = consume_bare_token();
        if (sel.value.empty()) {
            return error("missing attribute value");
        }
    }

    skip_whitespace();
    if (at_end()) {
        return error_at("unterminated attribute selector", open);
    }
    if (peek() != ']') {
        return error("expected ']' in attribute selector");
    }
    consume();

    return sel;
}

Result<String, SelectorError> SelectorParser::parse_quoted_string() {
    usize open = m_position;
    char quote = consume();

    StringBuilder value;
    while (!at_end()) {
        char c = consume();
        if (c == quote) {
            return value.build();
        }
        if (c == '\\' && !at_end()) {
            c = consume();
        }
        value.append(c);
    }

    return error_at("unterminated string", open);
}

Error<SelectorError> SelectorParser::error(std::string_view message) const {
    return error_at(message, m_position);
}

Error<SelectorError> SelectorParser::error_at(std::string_view message, usize position) const {
    return make_error(SelectorError{String(message), position});
}

void SelectorParser::reset(const String& input) {
    m_input = input;
    m_position = 0;
}

bool SelectorParser::skip_whitespace() {
    usize start = m_position;
    while (!at_end() && unicode::is_ascii_whitespace(static_cast<u8>(peek()))) {
        consume();
    }
    return m_position != start;
}

bool SelectorParser::at_end() const {
    return m_position >= m_input.length();
}

char SelectorParser::peek(usize offset) const {
    if (m_position + offset >= m_input.length()) return '\0';
    return m_input[m_position + offset];
}

char SelectorParser::consume() {
    if (m_position >= m_input.length()) return '\0';
    return m_input[m_position++];
}

bool SelectorParser::at_combinator_glyph() const {
    char c = peek();
    return c == '>' || c == '+' || c == '~';
}

bool SelectorParser::at_ident_start() const {
    usize offset = peek() == '-' ? 1 : 0;
    char c = peek(offset);
    if (c == '\\') {
        return m_position + offset + 1 < m_input.length();
    }
    return is_name_start(c);
}

String SelectorParser::consume_ident() {
    if (!at_ident_start()) {
        return String();
    }

    StringBuilder result;
    if (peek() == '-') {
        result.append(consume());
    }

    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result.append(consume());
        } else if (c == '\\' && m_position + 1 < m_input.length()) {
            consume();
            result.append(consume());
        } else {
            break;
        }
    }

    return result.build();
}

String SelectorParser::consume_bare_token() {
    StringBuilder result;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result.append(consume());
        } else if (c == '\\' && m_position + 1 < m_input.length()) {
            consume();
            result.append(consume());
        } else {
            break;
        }
    }
    return result.build();
}

} // namespace quarry::css
