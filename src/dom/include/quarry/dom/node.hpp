#pragma once

#include "quarry/core/types.hpp"
#include "quarry/core/string.hpp"
#include <vector>

namespace quarry::css {
class Selector;
class SelectorGroup;
} // namespace quarry::css

namespace quarry::dom {

class Element;
class Text;

// ============================================================================
// Node types (values follow the DOM nodeType numbering)
// ============================================================================

enum class NodeType : u16 {
    Element = 1,
    Text = 3,
};

// ============================================================================
// Node - Closed base of Element and Text
// ============================================================================

class Node : public RefCounted {
public:
    // Children outliving this node are detached
    ~Node() override;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Type information
    [[nodiscard]] NodeType node_type() const { return m_type; }
    [[nodiscard]] String node_name() const;

    [[nodiscard]] bool is_element() const { return m_type == NodeType::Element; }
    [[nodiscard]] bool is_text() const { return m_type == NodeType::Text; }

    [[nodiscard]] Element* as_element();
    [[nodiscard]] const Element* as_element() const;
    [[nodiscard]] Text* as_text();
    [[nodiscard]] const Text* as_text() const;

    // Tree structure
    [[nodiscard]] Element* parent_node() const { return m_parent; }
    [[nodiscard]] Node* first_child() const;
    [[nodiscard]] Node* last_child() const;
    [[nodiscard]] Node* previous_sibling() const { return m_previous_sibling; }
    [[nodiscard]] Node* next_sibling() const { return m_next_sibling; }

    [[nodiscard]] bool has_children() const { return !m_children.empty(); }
    [[nodiscard]] const std::vector<RefPtr<Node>>& child_nodes() const { return m_children; }

    // Element-only traversal (text nodes skipped)
    [[nodiscard]] Element* first_element_child() const;
    [[nodiscard]] Element* last_element_child() const;
    [[nodiscard]] Element* previous_element_sibling() const;
    [[nodiscard]] Element* next_element_sibling() const;

    // Nearest first
    [[nodiscard]] std::vector<Node*> previous_siblings() const;
    [[nodiscard]] std::vector<Node*> next_siblings() const;
    [[nodiscard]] std::vector<Element*> ancestors() const;

    // Document order, this node excluded
    [[nodiscard]] std::vector<Node*> descendants() const;

    // True for this node itself and for every node below it
    [[nodiscard]] bool contains(const Node* other) const;

    [[nodiscard]] String text_content() const;

    // Tree manipulation. Insertions detach the node from its previous parent.
    // They return null when refused: a text parent, a null node, or a node
    // that contains this node.
    RefPtr<Node> append_child(RefPtr<Node> child);
    RefPtr<Node> insert_before(RefPtr<Node> node, Node* reference);
    RefPtr<Node> remove_child(RefPtr<Node> child);

    // ------------------------------------------------------------------------
    // Selector queries
    //
    // The String overloads parse the selector on every call and throw
    // css::SelectorParserException on bad syntax. Parse once with
    // css::SelectorGroup::from_string when the same query runs repeatedly.
    // ------------------------------------------------------------------------

    [[nodiscard]] Element* select(const String& selectors);
    [[nodiscard]] Element* select(const css::SelectorGroup& group);
    [[nodiscard]] Element* select(const css::Selector& selector);

    [[nodiscard]] std::vector<Element*> select_all(const String& selectors);
    [[nodiscard]] std::vector<Element*> select_all(const css::SelectorGroup& group);
    [[nodiscard]] std::vector<Element*> select_all(const css::Selector& selector);

    // With a scope, parent and ancestor lookup stops at that node
    [[nodiscard]] bool matched_by(const String& selectors, const Node* scope = nullptr) const;
    [[nodiscard]] bool matched_by(const css::SelectorGroup& group, const Node* scope = nullptr) const;
    [[nodiscard]] bool matched_by(const css::Selector& selector, const Node* scope = nullptr) const;

    [[nodiscard]] Element* query_selector(const String& selectors) { return select(selectors); }
    [[nodiscard]] std::vector<Element*> query_selector_all(const String& selectors) {
        return select_all(selectors);
    }

private:
    explicit Node(NodeType type) : m_type(type) {}

    NodeType m_type;
    Element* m_parent{nullptr};
    Node* m_previous_sibling{nullptr};
    Node* m_next_sibling{nullptr};
    std::vector<RefPtr<Node>> m_children;

    friend class Element;
    friend class Text;
};

} // namespace quarry::dom
