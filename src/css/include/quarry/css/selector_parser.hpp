#pragma once

#include "selector.hpp"
#include <stdexcept>

namespace quarry::css {

// ============================================================================
// Errors
// ============================================================================

struct SelectorError {
    String message;
    usize position{0};  // byte offset into the input
};

class SelectorParserException : public std::runtime_error {
public:
    SelectorParserException(const SelectorError& error, const String& input);

    [[nodiscard]] const String& message() const { return m_message; }
    [[nodiscard]] usize position() const { return m_position; }
    [[nodiscard]] const String& input() const { return m_input; }

private:
    String m_message;
    usize m_position;
    String m_input;
};

// ============================================================================
// SelectorParser - Recursive descent over the selector grammar
//
//   group      := selector (',' selector)*
//   selector   := compound (combinator compound)*
//   combinator := whitespace | '>' | '+' | '~'
//   compound   := (tag | '*')? ('#' ident | '.' ident | attr)*
//   attr       := '[' ident (op value)? ']'
// ============================================================================

class SelectorParser {
public:
    SelectorParser() = default;

    [[nodiscard]] Result<SelectorGroup, SelectorError> parse(const String& input);

    // Exactly one alternative; a comma is an error
    [[nodiscard]] Result<Selector, SelectorError> parse_selector(const String& input);

private:
    Result<SelectorGroup, SelectorError> parse_selector_group();
    Result<Selector, SelectorError> parse_complex_selector();
    Result<CompoundSelector, SelectorError> parse_compound_selector();
    Result<AttributeSelector, SelectorError> parse_attribute_selector();
    Result<String, SelectorError> parse_quoted_string();

    [[nodiscard]] Error<SelectorError> error(std::string_view message) const;
    [[nodiscard]] Error<SelectorError> error_at(std::string_view message, usize position) const;

    void reset(const String& input);
    bool skip_whitespace();
    [[nodiscard]] bool at_end() const;
    [[nodiscard]] char peek(usize offset = 0) const;
    char consume();
    [[nodiscard]] bool at_combinator_glyph() const;
    [[nodiscard]] bool at_ident_start() const;
    String consume_ident();
    String consume_bare_token();

    String m_input;
    usize m_position{0};
};

} // namespace quarry::css
