#pragma once

#include "tokenizer.hpp"
#include "quarry/dom/element.hpp"
#include "quarry/dom/text.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <vector>

namespace quarry::html {

// ============================================================================
// Parse options
// ============================================================================

struct ParseOptions {
    // Raise DOMBuilderException on spurious end tags, end tags that close
    // other open elements, and elements left open at end of input.
    bool strict{false};
};

// ============================================================================
// DOMBuilderException
// ============================================================================

class DOMBuilderException : public std::runtime_error {
public:
    explicit DOMBuilderException(const String& message,
                                 std::optional<SourcePosition> position = std::nullopt);

    [[nodiscard]] const String& message() const { return m_message; }
    [[nodiscard]] std::optional<SourcePosition> position() const { return m_position; }

private:
    String m_message;
    std::optional<SourcePosition> m_position;
};

// ============================================================================
// DOMBuilder - Builds a node forest from tokens with a stack of open elements
// ============================================================================

class DOMBuilder {
public:
    using ErrorCallback = std::function<void(const String& message, SourcePosition position)>;

    DOMBuilder();
    explicit DOMBuilder(ParseOptions options);

    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }
    [[nodiscard]] const ParseOptions& options() const { return m_options; }

    // Consume one token. EndOfFileToken finishes the build.
    void process_token(const Token& token);

    // Event interface, equivalent to the matching tokens
    void start_tag(const String& name,
                   const std::vector<std::pair<String, String>>& attributes = {},
                   SourcePosition position = {});
    void end_tag(const String& name, SourcePosition position = {});
    void text(const String& data, SourcePosition position = {});
    void comment(const String& data, SourcePosition position = {});

    // Close everything still open. Throws if already finished.
    void finish(SourcePosition position = {});
    [[nodiscard]] bool finished() const { return m_finished; }

    // First top-level element, or null when no start tag was seen
    [[nodiscard]] RefPtr<dom::Element> root() const;

    // All top-level nodes in order (elements and text)
    [[nodiscard]] const std::vector<RefPtr<dom::Node>>& top_level_nodes() const { return m_top_level; }

    // Stack of open elements
    [[nodiscard]] dom::Element* current_node() const;
    [[nodiscard]] usize open_element_count() const { return m_open_elements.size(); }

private:
    void ensure_accepting(SourcePosition position) const;
    void insert_node(const RefPtr<dom::Node>& node);
    void recover(const String& message, SourcePosition position);

    ParseOptions m_options;
    ErrorCallback m_error_callback;

    std::vector<RefPtr<dom::Element>> m_open_elements;
    std::vector<RefPtr<dom::Node>> m_top_level;
    bool m_finished{false};
};

} // namespace quarry::html
