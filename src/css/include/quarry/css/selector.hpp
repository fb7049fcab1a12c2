#pragma once

#include "quarry/core/types.hpp"
#include "quarry/core/string.hpp"
#include <optional>
#include <vector>

namespace quarry::css {

// ============================================================================
// Selector Components
// ============================================================================

struct AttributeSelector {
    String attribute;  // lower-cased
    enum class Matcher {
        Exists,      // [attr]
        Equals,      // [attr=value]
        Includes,    // [attr~=value]
        DashMatch,   // [attr|=value]
        Prefix,      // [attr^=value]
        Suffix,      // [attr$=value]
        Substring,   // [attr*=value]
    };
    Matcher matcher{Matcher::Exists};
    String value;  // unused for Exists

    [[nodiscard]] String to_string() const;
    [[nodiscard]] bool operator==(const AttributeSelector& other) const;
};

using AttributeSelectorType = AttributeSelector::Matcher;

// ============================================================================
// Compound Selector
// ============================================================================

// Conjunction of simple selectors. No tag means any element.
struct CompoundSelector {
    std::optional<String> tag;  // lower-cased
    std::optional<String> id;
    std::vector<String> classes;
    std::vector<AttributeSelector> attributes;

    [[nodiscard]] bool is_universal() const {
        return !tag && !id && classes.empty() && attributes.empty();
    }

    // Canonical form: tag, classes, id, attributes; "*" when empty
    [[nodiscard]] String to_string() const;
    [[nodiscard]] bool operator==(const CompoundSelector& other) const;
};

// ============================================================================
// Complex Selector
// ============================================================================

enum class Combinator {
    Descendant,       // space
    Child,            // >
    NextSibling,      // +
    SubsequentSibling // ~
};

[[nodiscard]] std::string_view combinator_glyph(Combinator combinator);

struct SelectorPart {
    CompoundSelector compound;
    std::optional<Combinator> combinator;  // Combinator to next part
};

// Compounds joined by combinators, stored left to right and evaluated right
// to left. The last part carries no combinator.
class Selector {
public:
    Selector() = default;
    explicit Selector(std::vector<SelectorPart> parts) : m_parts(std::move(parts)) {}

    // Throws SelectorParserException on bad syntax or on more than one
    // comma-separated alternative
    [[nodiscard]] static Selector from_string(const String& text);

    [[nodiscard]] const std::vector<SelectorPart>& parts() const { return m_parts; }
    [[nodiscard]] usize size() const { return m_parts.size(); }
    [[nodiscard]] bool empty() const { return m_parts.empty(); }

    // The compound that must match the candidate element itself
    [[nodiscard]] const CompoundSelector& subject() const { return m_parts.back().compound; }

    [[nodiscard]] String to_string() const;

private:
    std::vector<SelectorPart> m_parts;
};

// ============================================================================
// Selector Group
// ============================================================================

// Comma-separated alternatives; matches when any alternative matches
class SelectorGroup {
public:
    using const_iterator = std::vector<Selector>::const_iterator;

    SelectorGroup() = default;
    explicit SelectorGroup(std::vector<Selector> selectors) : m_selectors(std::move(selectors)) {}

    // Throws SelectorParserException on bad syntax
    [[nodiscard]] static SelectorGroup from_string(const String& text);

    [[nodiscard]] usize size() const { return m_selectors.size(); }
    [[nodiscard]] bool empty() const { return m_selectors.empty(); }

    [[nodiscard]] const Selector& operator[](usize index) const { return m_selectors[index]; }
    // Throws std::out_of_range
    [[nodiscard]] const Selector& at(usize index) const { return m_selectors.at(index); }

    [[nodiscard]] const_iterator begin() const { return m_selectors.begin(); }
    [[nodiscard]] const_iterator end() const { return m_selectors.end(); }

    [[nodiscard]] const std::vector<Selector>& selectors() const { return m_selectors; }

    [[nodiscard]] String to_string() const;

private:
    std::vector<Selector> m_selectors;
};

} // namespace quarry::css
