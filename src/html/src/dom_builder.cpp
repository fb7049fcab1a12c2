/**
 * DOM builder implementation
 */

#include "quarry/html/dom_builder.hpp"
#include "quarry/core/logger.hpp"

namespace quarry::html {

namespace {

std::string describe(const String& message, const std::optional<SourcePosition>& position) {
    if (!position) {
        return message.std_string();
    }
    StringBuilder sb;
    sb.append(message);
    sb.append(" at line ");
    sb.append(static_cast<u64>(position->line));
    sb.append(", column ");
    sb.append(static_cast<u64>(position->column));
    return std::string(sb.view());
}

} // namespace

// ============================================================================
// DOMBuilderException
// ============================================================================

DOMBuilderException::DOMBuilderException(const String& message,
                                         std::optional<SourcePosition> position)
    : std::runtime_error(describe(message, position))
    , m_message(message)
    , m_position(position)
{
}

// ============================================================================
// DOMBuilder
// ============================================================================

DOMBuilder::DOMBuilder() = default;

DOMBuilder::DOMBuilder(ParseOptions options)
    : m_options(options)
{
}

void DOMBuilder::process_token(const Token& token) {
    std::visit([this](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, StartTagToken>) {
            start_tag(t.name, t.attributes, t.position);
        } else if constexpr (std::is_same_v<T, EndTagToken>) {
            end_tag(t.name, t.position);
        } else if constexpr (std::is_same_v<T, TextToken>) {
            text(t.data, t.position);
        } else if constexpr (std::is_same_v<T, CommentToken>) {
            comment(t.data, t.position);
        } else if constexpr (std::is_same_v<T, DoctypeToken>) {
            ensure_accepting(t.position);
        } else {
            finish(t.position);
        }
    }, token);
}

void DOMBuilder::start_tag(const String& name,
                           const std::vector<std::pair<String, String>>& attributes,
                           SourcePosition position) {
    ensure_accepting(position);

    std::vector<dom::Attribute> attrs;
    attrs.reserve(attributes.size());
    for (const auto& [attr_name, attr_value] : attributes) {
        attrs.push_back({attr_name, attr_value});
    }

    auto element = make_ref<dom::Element>(name, attrs);
    insert_node(element);

    // Void elements never take children
    if (!element->is_void()) {
        m_open_elements.push_back(element);
    }
}

void DOMBuilder::end_tag(const String& name, SourcePosition position) {
    ensure_accepting(position);

    auto lowered = name.to_lowercase();
    auto it = m_open_elements.rbegin();
    for (; it != m_open_elements.rend(); ++it) {
        if ((*it)->tag_name() == lowered) {
            break;
        }
    }

    if (it == m_open_elements.rend()) {
        StringBuilder sb;
        sb.append("extra end tag: ");
        sb.append(lowered);
        recover(sb.build(), position);
        return;
    }

    // Everything above the match is closed implicitly
    auto match_index = static_cast<usize>(m_open_elements.rend() - it) - 1;
    if (match_index + 1 != m_open_elements.size()) {
        StringBuilder sb;
        sb.append("end tag ");
        sb.append(lowered);
        sb.append(" closes unclosed ");
        sb.append(m_open_elements.back()->tag_name());
        recover(sb.build(), position);
    }

    m_open_elements.resize(match_index);
}

void DOMBuilder::text(const String& data, SourcePosition position) {
    ensure_accepting(position);

    if (data.empty()) {
        return;
    }

    dom::Node* last = nullptr;
    if (auto* parent = current_node()) {
        last = parent->last_child();
    } else if (!m_top_level.empty()) {
        last = m_top_level.back().get();
    }

    if (last && last->is_text()) {
        last->as_text()->append_data(data);
        return;
    }

    insert_node(make_ref<dom::Text>(data));
}

void DOMBuilder::comment(const String&, SourcePosition position) {
    ensure_accepting(position);
}

void DOMBuilder::finish(SourcePosition position) {
    ensure_accepting(position);

    if (!m_open_elements.empty()) {
        StringBuilder sb;
        sb.append("unclosed element at end of input: ");
        sb.append(m_open_elements.back()->tag_name());
        recover(sb.build(), position);
        m_open_elements.clear();
    }

    m_finished = true;

    auto& log = logging::get("html");
    if (log.is_enabled(LogLevel::Trace)) {
        StringBuilder sb;
        sb.append("built ");
        sb.append(static_cast<u64>(m_top_level.size()));
        sb.append(" top-level nodes");
        log.trace(sb.view());
    }
}

RefPtr<dom::Element> DOMBuilder::root() const {
    for (const auto& node : m_top_level) {
        if (node->is_element()) {
            return RefPtr<dom::Element>(node->as_element());
        }
    }
    return nullptr;
}

dom::Element* DOMBuilder::current_node() const {
    return m_open_elements.empty() ? nullptr : m_open_elements.back().get();
}

void DOMBuilder::ensure_accepting(SourcePosition position) const {
    if (m_finished) {
        throw DOMBuilderException("token received after end of input"_s, position);
    }
}

void DOMBuilder::insert_node(const RefPtr<dom::Node>& node) {
    if (auto* parent = current_node()) {
        parent->append_child(node);
    } else {
        m_top_level.push_back(node);
    }
}

void DOMBuilder::recover(const String& message, SourcePosition position) {
    if (m_options.strict) {
        throw DOMBuilderException(message, position);
    }

    auto& log = logging::get("html");
    if (log.is_enabled(LogLevel::Debug)) {
        log.debug(describe(message, position));
    }

    if (m_error_callback) {
        m_error_callback(message, position);
    }
}

} // namespace quarry::html
