/**
 * DOM Node implementation
 */

#include "quarry/dom/node.hpp"
#include "quarry/dom/element.hpp"
#include "quarry/dom/text.hpp"
#include "quarry/dom/visit.hpp"
#include <algorithm>

namespace quarry::dom {

namespace {

void collect_descendants(const Node& node, std::vector<Node*>& out) {
    for (const auto& child : node.child_nodes()) {
        out.push_back(child.get());
        collect_descendants(*child, out);
    }
}

void collect_text(const Node& node, StringBuilder& builder) {
    visit(node, [&builder](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Text>) {
            builder.append(n.data());
        } else {
            for (const auto& child : n.child_nodes()) {
                collect_text(*child, builder);
            }
        }
    });
}

} // namespace

Node::~Node() {
    // Iterative, so destroying a deep tree uses constant stack
    std::vector<RefPtr<Node>> pending = std::move(m_children);
    while (!pending.empty()) {
        RefPtr<Node> node = std::move(pending.back());
        pending.pop_back();

        node->m_parent = nullptr;
        node->m_previous_sibling = nullptr;
        node->m_next_sibling = nullptr;

        if (node->ref_count() == 1) {
            for (auto& child : node->m_children) {
                pending.push_back(std::move(child));
            }
            node->m_children.clear();
        }
    }
}

String Node::node_name() const {
    return visit(*this, [](const auto& n) -> String {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Text>) {
            return "#text"_s;
        } else {
            return n.tag_name();
        }
    });
}

Element* Node::as_element() {
    return is_element() ? static_cast<Element*>(this) : nullptr;
}

const Element* Node::as_element() const {
    return is_element() ? static_cast<const Element*>(this) : nullptr;
}

Text* Node::as_text() {
    return is_text() ? static_cast<Text*>(this) : nullptr;
}

const Text* Node::as_text() const {
    return is_text() ? static_cast<const Text*>(this) : nullptr;
}

Node* Node::first_child() const {
    return m_children.empty() ? nullptr : m_children.front().get();
}

Node* Node::last_child() const {
    return m_children.empty() ? nullptr : m_children.back().get();
}

Element* Node::first_element_child() const {
    for (const auto& child : m_children) {
        if (child->is_element()) {
            return child->as_element();
        }
    }
    return nullptr;
}

Element* Node::last_element_child() const {
    for (auto it = m_children.rbegin(); it != m_children.rend(); ++it) {
        if ((*it)->is_element()) {
            return (*it)->as_element();
        }
    }
    return nullptr;
}

Element* Node::previous_element_sibling() const {
    for (Node* sibling = m_previous_sibling; sibling; sibling = sibling->m_previous_sibling) {
        if (sibling->is_element()) {
            return sibling->as_element();
        }
    }
    return nullptr;
}

Element* Node::next_element_sibling() const {
    for (Node* sibling = m_next_sibling; sibling; sibling = sibling->m_next_sibling) {
        if (sibling->is_element()) {
            return sibling->as_element();
        }
    }
    return nullptr;
}

std::vector<Node*> Node::previous_siblings() const {
    std::vector<Node*> result;
    for (Node* sibling = m_previous_sibling; sibling; sibling = sibling->m_previous_sibling) {
        result.push_back(sibling);
    }
    return result;
}

std::vector<Node*> Node::next_siblings() const {
    std::vector<Node*> result;
    for (Node* sibling = m_next_sibling; sibling; sibling = sibling->m_next_sibling) {
        result.push_back(sibling);
    }
    return result;
}

std::vector<Element*> Node::ancestors() const {
    std::vector<Element*> result;
    for (Element* ancestor = m_parent; ancestor; ancestor = ancestor->m_parent) {
        result.push_back(ancestor);
    }
    return result;
}

std::vector<Node*> Node::descendants() const {
    std::vector<Node*> result;
    collect_descendants(*this, result);
    return result;
}

bool Node::contains(const Node* other) const {
    for (const Node* current = other; current; current = current->m_parent) {
        if (current == this) return true;
    }
    return false;
}

String Node::text_content() const {
    StringBuilder builder;
    collect_text(*this, builder);
    return builder.build();
}

RefPtr<Node> Node::append_child(RefPtr<Node> child) {
    return insert_before(std::move(child), nullptr);
}

RefPtr<Node> Node::insert_before(RefPtr<Node> node, Node* reference) {
    // Only a node with children can be a strict ancestor of this one
    if (!node || is_text() || node.get() == this ||
        (node->has_children() && node->contains(this))) {
        return nullptr;
    }
    if (reference == node.get()) {
        return node;
    }

    auto position = m_children.end();
    if (reference) {
        position = std::find_if(m_children.begin(), m_children.end(),
            [reference](const RefPtr<Node>& n) { return n.get() == reference; });
        if (position == m_children.end()) {
            return nullptr;
        }
    }

    // Detach from the previous parent. The RefPtr keeps the node alive.
    if (node->m_parent) {
        node->m_parent->remove_child(node);
        // The reference may have shifted if node shared our child list
        if (reference) {
            position = std::find_if(m_children.begin(), m_children.end(),
                [reference](const RefPtr<Node>& n) { return n.get() == reference; });
        } else {
            position = m_children.end();
        }
    }

    Node* previous = position == m_children.begin() ? nullptr : (position - 1)->get();
    Node* next = position == m_children.end() ? nullptr : position->get();

    node->m_parent = static_cast<Element*>(this);
    node->m_previous_sibling = previous;
    node->m_next_sibling = next;
    if (previous) previous->m_next_sibling = node.get();
    if (next) next->m_previous_sibling = node.get();

    m_children.insert(position, node);
    return node;
}

RefPtr<Node> Node::remove_child(RefPtr<Node> child) {
    if (!child || child->m_parent != this) {
        return nullptr;
    }

    if (child->m_previous_sibling) {
        child->m_previous_sibling->m_next_sibling = child->m_next_sibling;
    }
    if (child->m_next_sibling) {
        child->m_next_sibling->m_previous_sibling = child->m_previous_sibling;
    }

    child->m_parent = nullptr;
    child->m_previous_sibling = nullptr;
    child->m_next_sibling = nullptr;

    auto it = std::find(m_children.begin(), m_children.end(), child);
    if (it != m_children.end()) {
        m_children.erase(it);
    }

    return child;
}

} // namespace quarry::dom
