/**
 * Selector queries on DOM nodes
 */

#include "quarry/dom/node.hpp"
#include "quarry/dom/element.hpp"
#include "quarry/css/selector_matcher.hpp"

namespace quarry::dom {

Element* Node::select(const String& selectors) {
    return select(css::SelectorGroup::from_string(selectors));
}

Element* Node::select(const css::SelectorGroup& group) {
    return css::SelectorMatcher::select_first(*this, group);
}

Element* Node::select(const css::Selector& selector) {
    return css::SelectorMatcher::select_first(*this, selector);
}

std::vector<Element*> Node::select_all(const String& selectors) {
    return select_all(css::SelectorGroup::from_string(selectors));
}

std::vector<Element*> Node::select_all(const css::SelectorGroup& group) {
    return css::SelectorMatcher::select_all(*this, group);
}

std::vector<Element*> Node::select_all(const css::Selector& selector) {
    return css::SelectorMatcher::select_all(*this, selector);
}

bool Node::matched_by(const String& selectors, const Node* scope) const {
    return matched_by(css::SelectorGroup::from_string(selectors), scope);
}

bool Node::matched_by(const css::SelectorGroup& group, const Node* scope) const {
    return css::SelectorMatcher::matches(*this, group, scope);
}

bool Node::matched_by(const css::Selector& selector, const Node* scope) const {
    return css::SelectorMatcher::matches(*this, selector, scope);
}

} // namespace quarry::dom
