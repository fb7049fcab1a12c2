/**
 * HTML Tokenizer - core driver and shared helpers
 */

#include "quarry/html/tokenizer.hpp"
#include <algorithm>

namespace quarry::html {

Tokenizer::Tokenizer(std::string_view input) {
    set_input(input);
}

void Tokenizer::set_input(std::string_view input) {
    m_input = std::string(input);
    m_position = 0;
    m_state = TokenizerState::Data;
    m_text.clear();
    m_token_queue.clear();
    m_queue_head = 0;

    m_line_starts.assign(1, 0);
    for (usize i = 0; i < m_input.size(); ++i) {
        if (m_input[i] == '\n') {
            m_line_starts.push_back(i + 1);
        }
    }
}

SourcePosition Tokenizer::position_at(usize offset) const {
    auto it = std::upper_bound(m_line_starts.begin(), m_line_starts.end(), offset);
    auto line = static_cast<usize>(it - m_line_starts.begin());
    return {line, offset - m_line_starts[line - 1] + 1};
}

std::optional<Token> Tokenizer::next_token() {
    while (m_queue_head == m_token_queue.size() && m_state != TokenizerState::Finished) {
        process_state();
    }

    if (m_queue_head < m_token_queue.size()) {
        Token token = std::move(m_token_queue[m_queue_head++]);
        if (m_queue_head == m_token_queue.size()) {
            m_token_queue.clear();
            m_queue_head = 0;
        }
        return token;
    }

    return std::nullopt;
}

std::optional<char> Tokenizer::peek(usize ahead) const {
    if (m_position + ahead >= m_input.size()) {
        return std::nullopt;
    }
    return m_input[m_position + ahead];
}

char Tokenizer::consume() {
    if (m_position >= m_input.size()) {
        return 0;
    }
    return m_input[m_position++];
}

void Tokenizer::reconsume() {
    if (m_position > 0) {
        --m_position;
    }
}

bool Tokenizer::consume_if_match(std::string_view str, bool case_insensitive) {
    if (m_position + str.size() > m_input.size()) {
        return false;
    }

    for (usize i = 0; i < str.size(); ++i) {
        auto c = static_cast<u8>(m_input[m_position + i]);
        auto s = static_cast<u8>(str[i]);
        if (case_insensitive) {
            if (unicode::to_ascii_lower(c) != unicode::to_ascii_lower(s)) {
                return false;
            }
        } else if (c != s) {
            return false;
        }
    }

    m_position += str.size();
    return true;
}

void Tokenizer::emit(Token token) {
    m_token_queue.push_back(std::move(token));
}

void Tokenizer::append_text(std::string_view text, usize offset) {
    if (m_text.empty()) {
        m_text_start = offset;
    }
    m_text.append(text);
}

void Tokenizer::flush_text() {
    if (m_text.empty()) {
        return;
    }
    TextToken token{m_text.build(), position_at(m_text_start)};
    m_text.clear();
    emit(std::move(token));
}

void Tokenizer::emit_current_tag() {
    finish_attribute();
    flush_text();

    if (m_tag_is_end) {
        if (!m_tag_attributes.empty()) {
            parse_error("end-tag-with-attributes");
        }
        emit(EndTagToken{m_tag_name, position_at(m_tag_start)});
        m_state = TokenizerState::Data;
    } else {
        StartTagToken token{m_tag_name, std::move(m_tag_attributes), m_tag_self_closing,
                            position_at(m_tag_start)};
        m_last_start_tag_name = m_tag_name;
        bool raw = !m_tag_self_closing &&
                   (m_tag_name == "script"_s || m_tag_name == "style"_s);
        emit(std::move(token));
        m_state = raw ? TokenizerState::RAWTEXT : TokenizerState::Data;
    }

    m_tag_attributes.clear();
}

void Tokenizer::emit_eof() {
    flush_text();
    emit(EndOfFileToken{position_at(m_input.size())});
    m_position = m_input.size();
    m_state = TokenizerState::Finished;
}

void Tokenizer::parse_error(std::string_view message) {
    if (m_error_callback) {
        m_error_callback(String(message), position_at(m_position));
    }
}

void Tokenizer::process_state() {
    switch (m_state) {
        case TokenizerState::Data:
            handle_data_state();
            break;
        case TokenizerState::RAWTEXT:
            handle_rawtext_state();
            break;
        case TokenizerState::TagOpen:
            handle_tag_open_state();
            break;
        case TokenizerState::EndTagOpen:
            handle_end_tag_open_state();
            break;
        case TokenizerState::TagName:
            handle_tag_name_state();
            break;
        case TokenizerState::BeforeAttributeName:
            handle_before_attribute_name_state();
            break;
        case TokenizerState::AttributeName:
            handle_attribute_name_state();
            break;
        case TokenizerState::AfterAttributeName:
            handle_after_attribute_name_state();
            break;
        case TokenizerState::BeforeAttributeValue:
            handle_before_attribute_value_state();
            break;
        case TokenizerState::AttributeValueDoubleQuoted:
            handle_attribute_value_quoted_state('"');
            break;
        case TokenizerState::AttributeValueSingleQuoted:
            handle_attribute_value_quoted_state('\'');
            break;
        case TokenizerState::AttributeValueUnquoted:
            handle_attribute_value_unquoted_state();
            break;
        case TokenizerState::AfterAttributeValueQuoted:
            handle_after_attribute_value_quoted_state();
            break;
        case TokenizerState::SelfClosingStartTag:
            handle_self_closing_start_tag_state();
            break;
        case TokenizerState::MarkupDeclarationOpen:
            handle_markup_declaration_open_state();
            break;
        case TokenizerState::Comment:
            handle_comment_state();
            break;
        case TokenizerState::BogusComment:
            handle_bogus_comment_state();
            break;
        case TokenizerState::DOCTYPE:
            handle_doctype_state();
            break;
        case TokenizerState::Finished:
            break;
    }
}

bool Tokenizer::is_appropriate_end_tag_ahead() const {
    // Expects m_position at '<'
    usize pos = m_position + 1;
    if (pos >= m_input.size() || m_input[pos] != '/') {
        return false;
    }
    ++pos;

    const auto& name = m_last_start_tag_name.std_string();
    if (pos + name.size() > m_input.size()) {
        return false;
    }
    for (usize i = 0; i < name.size(); ++i) {
        if (unicode::to_ascii_lower(static_cast<u8>(m_input[pos + i])) !=
            static_cast<unicode::CodePoint>(static_cast<u8>(name[i]))) {
            return false;
        }
    }
    pos += name.size();

    if (pos >= m_input.size()) {
        return true;
    }
    auto next = static_cast<u8>(m_input[pos]);
    return unicode::is_ascii_whitespace(next) || next == '/' || next == '>';
}

void Tokenizer::start_new_attribute() {
    finish_attribute();
    m_has_current_attribute = true;
    m_current_attribute_name.clear();
    m_current_attribute_value.clear();
}

void Tokenizer::finish_attribute() {
    if (!m_has_current_attribute) {
        return;
    }
    m_has_current_attribute = false;

    for (const auto& [name, value] : m_tag_attributes) {
        if (name == m_current_attribute_name) {
            parse_error("duplicate-attribute");
            return;
        }
    }
    m_tag_attributes.emplace_back(m_current_attribute_name, m_current_attribute_value);
}

} // namespace quarry::html
