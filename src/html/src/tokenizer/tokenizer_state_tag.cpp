/**
 * HTML Tokenizer - tag and attribute states
 */

#include "quarry/html/tokenizer.hpp"

namespace quarry::html {

namespace {

inline bool is_tag_whitespace(char c) {
    return c == '\t' || c == '\n' || c == '\f' || c == ' ' || c == '\r';
}

inline char lower(char c) {
    return static_cast<char>(unicode::to_ascii_lower(static_cast<u8>(c)));
}

} // namespace

void Tokenizer::handle_tag_open_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-before-tag-name");
        append_text("<", m_tag_start);
        emit_eof();
        return;
    }

    if (*cp == '!') {
        consume();
        m_state = TokenizerState::MarkupDeclarationOpen;
    } else if (*cp == '/') {
        consume();
        m_state = TokenizerState::EndTagOpen;
    } else if (unicode::is_ascii_alpha(static_cast<u8>(*cp))) {
        m_tag_is_end = false;
        m_tag_name.clear();
        m_tag_self_closing = false;
        m_tag_attributes.clear();
        m_has_current_attribute = false;
        m_state = TokenizerState::TagName;
    } else if (*cp == '?') {
        parse_error("unexpected-question-mark-instead-of-tag-name");
        m_state = TokenizerState::BogusComment;
    } else {
        parse_error("invalid-first-character-of-tag-name");
        append_text("<", m_tag_start);
        m_state = TokenizerState::Data;
    }
}

void Tokenizer::handle_end_tag_open_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-before-tag-name");
        append_text("</", m_tag_start);
        emit_eof();
        return;
    }

    if (unicode::is_ascii_alpha(static_cast<u8>(*cp))) {
        m_tag_is_end = true;
        m_tag_name.clear();
        m_tag_self_closing = false;
        m_tag_attributes.clear();
        m_has_current_attribute = false;
        m_state = TokenizerState::TagName;
    } else if (*cp == '>') {
        consume();
        parse_error("missing-end-tag-name");
        m_state = TokenizerState::Data;
    } else {
        parse_error("invalid-first-character-of-tag-name");
        m_state = TokenizerState::BogusComment;
    }
}

void Tokenizer::handle_tag_name_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    consume();

    if (is_tag_whitespace(*cp)) {
        m_state = TokenizerState::BeforeAttributeName;
    } else if (*cp == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*cp == '>') {
        emit_current_tag();
    } else {
        char c = lower(*cp);
        m_tag_name.append(std::string_view(&c, 1));
    }
}

void Tokenizer::handle_before_attribute_name_state() {
    auto cp = peek();
    if (!cp) {
        m_state = TokenizerState::AfterAttributeName;
        return;
    }

    if (is_tag_whitespace(*cp)) {
        consume();
    } else if (*cp == '/' || *cp == '>') {
        m_state = TokenizerState::AfterAttributeName;
    } else if (*cp == '=') {
        consume();
        parse_error("unexpected-equals-sign-before-attribute-name");
        start_new_attribute();
        m_current_attribute_name = "="_s;
        m_state = TokenizerState::AttributeName;
    } else {
        start_new_attribute();
        m_state = TokenizerState::AttributeName;
    }
}

void Tokenizer::handle_attribute_name_state() {
    auto cp = peek();
    if (!cp || is_tag_whitespace(*cp) || *cp == '/' || *cp == '>') {
        m_state = TokenizerState::AfterAttributeName;
        return;
    }

    consume();

    if (*cp == '=') {
        m_state = TokenizerState::BeforeAttributeValue;
    } else {
        if (*cp == '"' || *cp == '\'' || *cp == '<') {
            parse_error("unexpected-character-in-attribute-name");
        }
        char c = lower(*cp);
        m_current_attribute_name.append(std::string_view(&c, 1));
    }
}

void Tokenizer::handle_after_attribute_name_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    if (is_tag_whitespace(*cp)) {
        consume();
    } else if (*cp == '/') {
        consume();
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*cp == '=') {
        consume();
        m_state = TokenizerState::BeforeAttributeValue;
    } else if (*cp == '>') {
        consume();
        emit_current_tag();
    } else {
        start_new_attribute();
        m_state = TokenizerState::AttributeName;
    }
}

void Tokenizer::handle_before_attribute_value_state() {
    auto cp = peek();
    if (cp && is_tag_whitespace(*cp)) {
        consume();
        return;
    }

    if (cp && *cp == '"') {
        consume();
        m_state = TokenizerState::AttributeValueDoubleQuoted;
    } else if (cp && *cp == '\'') {
        consume();
        m_state = TokenizerState::AttributeValueSingleQuoted;
    } else if (cp && *cp == '>') {
        consume();
        parse_error("missing-attribute-value");
        emit_current_tag();
    } else {
        m_state = TokenizerState::AttributeValueUnquoted;
    }
}

void Tokenizer::handle_attribute_value_quoted_state(char quote) {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    consume();

    if (*cp == quote) {
        m_state = TokenizerState::AfterAttributeValueQuoted;
    } else if (*cp == '&') {
        if (auto decoded = consume_character_reference(true)) {
            m_current_attribute_value.append(*decoded);
        } else {
            m_current_attribute_value.append(std::string_view("&"));
        }
    } else {
        m_current_attribute_value.append(std::string_view(&*cp, 1));
    }
}

void Tokenizer::handle_attribute_value_unquoted_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    if (is_tag_whitespace(*cp)) {
        consume();
        m_state = TokenizerState::BeforeAttributeName;
        return;
    }
    if (*cp == '>') {
        consume();
        emit_current_tag();
        return;
    }

    consume();

    if (*cp == '&') {
        if (auto decoded = consume_character_reference(true)) {
            m_current_attribute_value.append(*decoded);
        } else {
            m_current_attribute_value.append(std::string_view("&"));
        }
    } else {
        if (*cp == '"' || *cp == '\'' || *cp == '<' || *cp == '=' || *cp == '`') {
            parse_error("unexpected-character-in-unquoted-attribute-value");
        }
        m_current_attribute_value.append(std::string_view(&*cp, 1));
    }
}

void Tokenizer::handle_after_attribute_value_quoted_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    if (is_tag_whitespace(*cp)) {
        consume();
        m_state = TokenizerState::BeforeAttributeName;
    } else if (*cp == '/') {
        consume();
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*cp == '>') {
        consume();
        emit_current_tag();
    } else {
        parse_error("missing-whitespace-between-attributes");
        m_state = TokenizerState::BeforeAttributeName;
    }
}

void Tokenizer::handle_self_closing_start_tag_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    if (*cp == '>') {
        consume();
        m_tag_self_closing = true;
        emit_current_tag();
    } else {
        parse_error("unexpected-solidus-in-tag");
        m_state = TokenizerState::BeforeAttributeName;
    }
}

} // namespace quarry::html
