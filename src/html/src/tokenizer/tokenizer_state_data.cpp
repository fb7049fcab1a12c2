/**
 * HTML Tokenizer - data, raw text, comment and doctype states
 */

#include "quarry/html/tokenizer.hpp"

namespace quarry::html {

void Tokenizer::handle_data_state() {
    auto cp = peek();
    if (!cp) {
        emit_eof();
        return;
    }

    usize offset = m_position;
    consume();

    if (*cp == '&') {
        if (auto decoded = consume_character_reference(false)) {
            append_text(decoded->view(), offset);
        } else {
            append_text("&", offset);
        }
    } else if (*cp == '<') {
        m_tag_start = offset;
        m_state = TokenizerState::TagOpen;
    } else {
        // Copy the whole run up to the next markup character
        usize end = m_input.find_first_of("&<", m_position);
        if (end == std::string::npos) {
            end = m_input.size();
        }
        append_text(std::string_view(m_input).substr(offset, end - offset), offset);
        m_position = end;
    }
}

void Tokenizer::handle_rawtext_state() {
    auto cp = peek();
    if (!cp) {
        parse_error("eof-in-raw-text");
        emit_eof();
        return;
    }

    if (*cp == '<' && is_appropriate_end_tag_ahead()) {
        m_tag_start = m_position;
        m_position += 2;
        m_state = TokenizerState::EndTagOpen;
        return;
    }

    usize offset = m_position;
    usize end = m_input.find('<', m_position + 1);
    if (end == std::string::npos) {
        end = m_input.size();
    }
    append_text(std::string_view(m_input).substr(offset, end - offset), offset);
    m_position = end;
}

void Tokenizer::handle_markup_declaration_open_state() {
    if (consume_if_match("--")) {
        m_state = TokenizerState::Comment;
    } else if (consume_if_match("DOCTYPE", true)) {
        m_state = TokenizerState::DOCTYPE;
    } else if (consume_if_match("[CDATA[")) {
        parse_error("cdata-in-html-content");
        m_position -= 7;
        m_state = TokenizerState::BogusComment;
    } else {
        parse_error("incorrectly-opened-comment");
        m_state = TokenizerState::BogusComment;
    }
}

void Tokenizer::handle_comment_state() {
    flush_text();

    if (consume_if_match(">") || consume_if_match("->")) {
        parse_error("abrupt-closing-of-empty-comment");
        emit(CommentToken{String(), position_at(m_tag_start)});
        m_state = TokenizerState::Data;
        return;
    }

    auto start = m_position;
    auto end = m_input.find("-->", m_position);
    String data;
    if (end == std::string::npos) {
        parse_error("eof-in-comment");
        data = String(std::string_view(m_input).substr(start));
        m_position = m_input.size();
    } else {
        data = String(std::string_view(m_input).substr(start, end - start));
        m_position = end + 3;
    }

    emit(CommentToken{std::move(data), position_at(m_tag_start)});
    m_state = TokenizerState::Data;
}

void Tokenizer::handle_bogus_comment_state() {
    flush_text();

    auto start = m_position;
    auto end = m_input.find('>', m_position);
    String data;
    if (end == std::string::npos) {
        data = String(std::string_view(m_input).substr(start));
        m_position = m_input.size();
    } else {
        data = String(std::string_view(m_input).substr(start, end - start));
        m_position = end + 1;
    }

    emit(CommentToken{std::move(data), position_at(m_tag_start)});
    m_state = TokenizerState::Data;
}

void Tokenizer::handle_doctype_state() {
    flush_text();

    auto end = m_input.find('>', m_position);
    std::string_view body = std::string_view(m_input).substr(
        m_position, end == std::string::npos ? std::string::npos : end - m_position);
    if (end == std::string::npos) {
        parse_error("eof-in-doctype");
        m_position = m_input.size();
    } else {
        m_position = end + 1;
    }

    // The name is the first whitespace-delimited word
    auto words = String(body).split_whitespace();
    String name = words.empty() ? String() : words.front().to_lowercase();
    if (name.empty()) {
        parse_error("missing-doctype-name");
    }

    emit(DoctypeToken{std::move(name), position_at(m_tag_start)});
    m_state = TokenizerState::Data;
}

} // namespace quarry::html
