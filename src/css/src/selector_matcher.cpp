/**
 * CSS selector matching
 */

#include "quarry/css/selector_matcher.hpp"
#include "quarry/dom/element.hpp"
#include "quarry/dom/text.hpp"
#include <algorithm>

namespace quarry::css {

namespace {

const dom::Element* parent_within(const dom::Element& element, const dom::Node* scope) {
    return &element == scope ? nullptr : element.parent_node();
}

// Matches parts[0..=index] with parts[index] against element
bool matches_chain(const std::vector<SelectorPart>& parts, usize index,
                   const dom::Element& element, const dom::Node* scope) {
    if (!SelectorMatcher::matches(element, parts[index].compound)) {
        return false;
    }
    if (index == 0) {
        return true;
    }

    // The combinator joining parts[index - 1] to parts[index]
    Combinator combinator = parts[index - 1].combinator.value_or(Combinator::Descendant);

    switch (combinator) {
        case Combinator::Descendant:
            for (const dom::Element* ancestor = parent_within(element, scope); ancestor;
                 ancestor = parent_within(*ancestor, scope)) {
                if (matches_chain(parts, index - 1, *ancestor, scope)) {
                    return true;
                }
            }
            return false;
        case Combinator::Child: {
            const dom::Element* parent = parent_within(element, scope);
            return parent && matches_chain(parts, index - 1, *parent, scope);
        }
        case Combinator::NextSibling: {
            const dom::Element* sibling = element.previous_element_sibling();
            return sibling && matches_chain(parts, index - 1, *sibling, scope);
        }
        case Combinator::SubsequentSibling:
            for (const dom::Element* sibling = element.previous_element_sibling(); sibling;
                 sibling = sibling->previous_element_sibling()) {
                if (matches_chain(parts, index - 1, *sibling, scope)) {
                    return true;
                }
            }
            return false;
    }
    return false;
}

// Returns true to stop the traversal
template<typename Predicate, typename Sink>
bool walk(dom::Node& node, const Predicate& predicate, const Sink& sink) {
    if (node.is_element() && predicate(*node.as_element())) {
        if (sink(node.as_element())) {
            return true;
        }
    }
    for (const auto& child : node.child_nodes()) {
        if (walk(*child, predicate, sink)) {
            return true;
        }
    }
    return false;
}

template<typename Predicate>
std::vector<dom::Element*> collect_all(dom::Node& root, const Predicate& predicate) {
    std::vector<dom::Element*> result;
    walk(root, predicate, [&result](dom::Element* element) {
        result.push_back(element);
        return false;
    });
    return result;
}

template<typename Predicate>
dom::Element* find_first(dom::Node& root, const Predicate& predicate) {
    dom::Element* found = nullptr;
    walk(root, predicate, [&found](dom::Element* element) {
        found = element;
        return true;
    });
    return found;
}

} // namespace

bool SelectorMatcher::matches(const dom::Node& node, const SelectorGroup& group, const dom::Node* scope) {
    return std::any_of(group.begin(), group.end(),
        [&node, scope](const Selector& selector) { return matches(node, selector, scope); });
}

bool SelectorMatcher::matches(const dom::Node& node, const Selector& selector, const dom::Node* scope) {
    const dom::Element* element = node.as_element();
    if (!element || selector.empty()) {
        return false;
    }
    return matches_chain(selector.parts(), selector.size() - 1, *element, scope);
}

bool SelectorMatcher::matches(const dom::Element& element, const CompoundSelector& compound) {
    if (compound.tag && element.tag_name() != *compound.tag) {
        return false;
    }

    if (compound.id) {
        auto id = element.get_attribute("id"_s);
        if (!id || *id != *compound.id) {
            return false;
        }
    }

    if (!compound.classes.empty()) {
        auto classes = element.class_list();
        for (const auto& class_name : compound.classes) {
            if (std::find(classes.begin(), classes.end(), class_name) == classes.end()) {
                return false;
            }
        }
    }

    return std::all_of(compound.attributes.begin(), compound.attributes.end(),
        [&element](const AttributeSelector& attr) { return matches(element, attr); });
}

bool SelectorMatcher::matches(const dom::Element& element, const AttributeSelector& attribute) {
    auto actual = element.get_attribute(attribute.attribute);
    if (!actual) {
        return false;
    }

    const String& value = attribute.value;

    switch (attribute.matcher) {
        case AttributeSelector::Matcher::Exists:
            return true;
        case AttributeSelector::Matcher::Equals:
            return *actual == value;
        case AttributeSelector::Matcher::Includes: {
            if (value.empty() || value.contains_whitespace()) {
                return false;
            }
            auto tokens = actual->split_whitespace();
            return std::find(tokens.begin(), tokens.end(), value) != tokens.end();
        }
        case AttributeSelector::Matcher::DashMatch:
            return *actual == value || actual->starts_with(value + "-"_s);
        case AttributeSelector::Matcher::Prefix:
            return !value.empty() && actual->starts_with(value);
        case AttributeSelector::Matcher::Suffix:
            return !value.empty() && actual->ends_with(value);
        case AttributeSelector::Matcher::Substring:
            return !value.empty() && actual->contains(value);
    }
    return false;
}

std::vector<dom::Element*> SelectorMatcher::select_all(dom::Node& root, const SelectorGroup& group) {
    return collect_all(root, [&group](const dom::Element& element) { return matches(element, group); });
}

std::vector<dom::Element*> SelectorMatcher::select_all(dom::Node& root, const Selector& selector) {
    return collect_all(root, [&selector](const dom::Element& element) { return matches(element, selector); });
}

dom::Element* SelectorMatcher::select_first(dom::Node& root, const SelectorGroup& group) {
    return find_first(root, [&group](const dom::Element& element) { return matches(element, group); });
}

dom::Element* SelectorMatcher::select_first(dom::Node& root, const Selector& selector) {
    return find_first(root, [&selector](const dom::Element& element) { return matches(element, selector); });
}

} // namespace quarry::css
