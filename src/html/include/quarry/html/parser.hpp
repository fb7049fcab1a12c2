#pragma once

#include "tokenizer.hpp"
#include "dom_builder.hpp"
#include <vector>

namespace quarry::html {

// ============================================================================
// ParseError - A recovered anomaly from the tokenizer or the builder
// ============================================================================

struct ParseError {
    String message;
    SourcePosition position;
};

// ============================================================================
// Parser - High-level HTML parsing interface
// ============================================================================

class Parser {
public:
    Parser() = default;
    explicit Parser(ParseOptions options) : m_options(options) {}

    void set_options(ParseOptions options) { m_options = options; }
    [[nodiscard]] const ParseOptions& options() const { return m_options; }

    // Root element (first top-level element), or null. Throws
    // DOMBuilderException in strict mode.
    [[nodiscard]] RefPtr<dom::Element> parse(std::string_view html);

    // Every top-level node, text included
    [[nodiscard]] std::vector<RefPtr<dom::Node>> parse_fragment(std::string_view html);

    // Error handling
    using ErrorCallback = std::function<void(const String& message, SourcePosition position)>;
    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }

    // Anomalies recovered during the last parse
    [[nodiscard]] const std::vector<ParseError>& errors() const { return m_errors; }

private:
    void run(std::string_view html, DOMBuilder& builder);
    void on_parse_error(const String& message, SourcePosition position);

    ParseOptions m_options;
    ErrorCallback m_error_callback;
    std::vector<ParseError> m_errors;
};

// ============================================================================
// Convenience functions
// ============================================================================

[[nodiscard]] RefPtr<dom::Element> parse_html(std::string_view html, ParseOptions options = {});

[[nodiscard]] std::vector<RefPtr<dom::Node>> parse_html_fragment(std::string_view html,
                                                                 ParseOptions options = {});

} // namespace quarry::html
