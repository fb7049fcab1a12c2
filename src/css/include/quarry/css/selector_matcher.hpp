#pragma once

#include "selector.hpp"
#include <vector>

namespace quarry::dom {
class Node;
class Element;
} // namespace quarry::dom

namespace quarry::css {

// ============================================================================
// SelectorMatcher - Right-to-left evaluation against the node tree
// ============================================================================

class SelectorMatcher {
public:
    // Text nodes never match. A non-null scope bounds the child and descendant
    // combinators: lookup never climbs above it.
    [[nodiscard]] static bool matches(const dom::Node& node, const SelectorGroup& group,
                                      const dom::Node* scope = nullptr);
    [[nodiscard]] static bool matches(const dom::Node& node, const Selector& selector,
                                      const dom::Node* scope = nullptr);
    [[nodiscard]] static bool matches(const dom::Element& element, const CompoundSelector& compound);
    [[nodiscard]] static bool matches(const dom::Element& element, const AttributeSelector& attribute);

    // Pre-order over the subtree of root, root included
    [[nodiscard]] static std::vector<dom::Element*> select_all(
        dom::Node& root, const SelectorGroup& group);
    [[nodiscard]] static std::vector<dom::Element*> select_all(
        dom::Node& root, const Selector& selector);

    // Stops at the first match in document order
    [[nodiscard]] static dom::Element* select_first(
        dom::Node& root, const SelectorGroup& group);
    [[nodiscard]] static dom::Element* select_first(
        dom::Node& root, const Selector& selector);
};

} // namespace quarry::css
