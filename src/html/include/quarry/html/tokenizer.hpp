#pragma once

#include "quarry/core/types.hpp"
#include "quarry/core/string.hpp"
#include <functional>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace quarry::html {

// ============================================================================
// Source positions (1-based, column counted in bytes)
// ============================================================================

struct SourcePosition {
    usize line{1};
    usize column{1};

    [[nodiscard]] bool operator==(const SourcePosition& other) const {
        return line == other.line && column == other.column;
    }
};

// ============================================================================
// HTML Token Types
// ============================================================================

struct DoctypeToken {
    String name;
    SourcePosition position;
};

struct StartTagToken {
    String name;
    std::vector<std::pair<String, String>> attributes;
    bool self_closing{false};
    SourcePosition position;
};

struct EndTagToken {
    String name;
    SourcePosition position;
};

// A whole run of character data with references decoded
struct TextToken {
    String data;
    SourcePosition position;
};

struct CommentToken {
    String data;
    SourcePosition position;
};

struct EndOfFileToken {
    SourcePosition position;
};

using Token = std::variant<
    DoctypeToken,
    StartTagToken,
    EndTagToken,
    TextToken,
    CommentToken,
    EndOfFileToken
>;

// ============================================================================
// Tokenizer States
// ============================================================================

enum class TokenizerState {
    Data,
    RAWTEXT,
    TagOpen,
    EndTagOpen,
    TagName,
    BeforeAttributeName,
    AttributeName,
    AfterAttributeName,
    BeforeAttributeValue,
    AttributeValueDoubleQuoted,
    AttributeValueSingleQuoted,
    AttributeValueUnquoted,
    AfterAttributeValueQuoted,
    SelfClosingStartTag,
    MarkupDeclarationOpen,
    Comment,
    BogusComment,
    DOCTYPE,
    Finished,
};

// ============================================================================
// Tokenizer - HTML text to Token stream
//
// Never fails: malformed markup degrades to text or bogus comments and is
// reported through the error callback. The contents of script and style are
// raw text up to the matching end tag.
// ============================================================================

class Tokenizer {
public:
    using ErrorCallback = std::function<void(const String& message, SourcePosition position)>;

    Tokenizer() = default;
    explicit Tokenizer(std::string_view input);

    void set_input(std::string_view input);

    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }

    // Returns EndOfFileToken once, then nullopt
    [[nodiscard]] std::optional<Token> next_token();

    // Line/column of a byte offset in the current input
    [[nodiscard]] SourcePosition position_at(usize offset) const;

private:
    // Character consumption
    [[nodiscard]] std::optional<char> peek(usize ahead = 0) const;
    char consume();
    void reconsume();
    bool consume_if_match(std::string_view str, bool case_insensitive = false);

    // Token emission
    void emit(Token token);
    void append_text(std::string_view text, usize offset);
    void flush_text();
    void emit_current_tag();
    void emit_eof();

    void parse_error(std::string_view message);

    // State machine
    void process_state();

    void handle_data_state();
    void handle_rawtext_state();
    void handle_tag_open_state();
    void handle_end_tag_open_state();
    void handle_tag_name_state();
    void handle_before_attribute_name_state();
    void handle_attribute_name_state();
    void handle_after_attribute_name_state();
    void handle_before_attribute_value_state();
    void handle_attribute_value_quoted_state(char quote);
    void handle_attribute_value_unquoted_state();
    void handle_after_attribute_value_quoted_state();
    void handle_self_closing_start_tag_state();
    void handle_markup_declaration_open_state();
    void handle_comment_state();
    void handle_bogus_comment_state();
    void handle_doctype_state();

    // Decodes the reference after a consumed '&'. Returns nullopt and consumes
    // nothing when the text is not a recognized reference.
    std::optional<String> consume_character_reference(bool in_attribute);

    [[nodiscard]] bool is_appropriate_end_tag_ahead() const;
    void start_new_attribute();
    void finish_attribute();

    // Input
    std::string m_input;
    usize m_position{0};
    std::vector<usize> m_line_starts{0};

    TokenizerState m_state{TokenizerState::Data};

    // Current tag being built
    bool m_tag_is_end{false};
    usize m_tag_start{0};
    String m_tag_name;
    bool m_tag_self_closing{false};
    std::vector<std::pair<String, String>> m_tag_attributes;
    String m_current_attribute_name;
    String m_current_attribute_value;
    bool m_has_current_attribute{false};
    String m_last_start_tag_name;

    // Pending text run
    StringBuilder m_text;
    usize m_text_start{0};

    ErrorCallback m_error_callback;

    std::vector<Token> m_token_queue;
    usize m_queue_head{0};
};

} // namespace quarry::html
