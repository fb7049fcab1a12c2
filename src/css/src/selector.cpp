/**
 * CSS Selector model
 */

#include "quarry/css/selector.hpp"
#include "quarry/css/selector_parser.hpp"

namespace quarry::css {

namespace {

void append_quoted(StringBuilder& sb, const String& value) {
    sb.append('"');
    for (char c : value) {
        if (c == '"' || c == '\\') {
            sb.append('\\');
        }
        sb.append(c);
    }
    sb.append('"');
}

} // namespace

// ============================================================================
// AttributeSelector
// ============================================================================

String AttributeSelector::to_string() const {
    StringBuilder sb;
    sb.append('[');
    sb.append(attribute);
    switch (matcher) {
        case Matcher::Exists:
            sb.append(']');
            return sb.build();
        case Matcher::Equals:    sb.append("="); break;
        case Matcher::Includes:  sb.append("~="); break;
        case Matcher::DashMatch: sb.append("|="); break;
        case Matcher::Prefix:    sb.append("^="); break;
        case Matcher::Suffix:    sb.append("$="); break;
        case Matcher::Substring: sb.append("*="); break;
    }
    append_quoted(sb, value);
    sb.append(']');
    return sb.build();
}

bool AttributeSelector::operator==(const AttributeSelector& other) const {
    return attribute == other.attribute && matcher == other.matcher && value == other.value;
}

// ============================================================================
// CompoundSelector
// ============================================================================

String CompoundSelector::to_string() const {
    if (is_universal()) {
        return "*"_s;
    }

    StringBuilder sb;
    if (tag) {
        sb.append(*tag);
    }
    for (const auto& class_name : classes) {
        sb.append('.');
        sb.append(class_name);
    }
    if (id) {
        sb.append('#');
        sb.append(*id);
    }
    for (const auto& attr : attributes) {
        sb.append(attr.to_string());
    }
    return sb.build();
}

bool CompoundSelector::operator==(const CompoundSelector& other) const {
    return tag == other.tag && id == other.id && classes == other.classes &&
           attributes == other.attributes;
}

std::string_view combinator_glyph(Combinator combinator) {
    switch (combinator) {
        case Combinator::Descendant:        return " ";
        case Combinator::Child:             return " > ";
        case Combinator::NextSibling:       return " + ";
        case Combinator::SubsequentSibling: return " ~ ";
    }
    return " ";
}

// ============================================================================
// Selector
// ============================================================================

Selector Selector::from_string(const String& text) {
    SelectorParser parser;
    auto result = parser.parse_selector(text);
    if (result.is_err()) {
        throw SelectorParserException(result.error(), text);
    }
    return std::move(result).value();
}

String Selector::to_string() const {
    StringBuilder sb;
    for (const auto& part : m_parts) {
        sb.append(part.compound.to_string());
        if (part.combinator) {
            sb.append(combinator_glyph(*part.combinator));
        }
    }
    return sb.build();
}

// ============================================================================
// SelectorGroup
// ============================================================================

SelectorGroup SelectorGroup::from_string(const String& text) {
    SelectorParser parser;
    auto result = parser.parse(text);
    if (result.is_err()) {
        throw SelectorParserException(result.error(), text);
    }
    return std::move(result).value();
}

String SelectorGroup::to_string() const {
    StringBuilder sb;
    bool first = true;
    for (const auto& selector : m_selectors) {
        if (!first) {
            sb.append(", ");
        }
        first = false;
        sb.append(selector.to_string());
    }
    return sb.build();
}

} // namespace quarry::css
