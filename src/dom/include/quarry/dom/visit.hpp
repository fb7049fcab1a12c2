#pragma once

#include "element.hpp"
#include "text.hpp"
#include <utility>

namespace quarry::dom {

// Exhaustive dispatch over the node variants. The visitor must be callable
// with both Element& and Text& (or their const forms) and return the same type.
template<typename Visitor>
decltype(auto) visit(Node& node, Visitor&& visitor) {
    switch (node.node_type()) {
        case NodeType::Element:
            return std::forward<Visitor>(visitor)(static_cast<Element&>(node));
        case NodeType::Text:
            break;
    }
    return std::forward<Visitor>(visitor)(static_cast<Text&>(node));
}

template<typename Visitor>
decltype(auto) visit(const Node& node, Visitor&& visitor) {
    switch (node.node_type()) {
        case NodeType::Element:
            return std::forward<Visitor>(visitor)(static_cast<const Element&>(node));
        case NodeType::Text:
            break;
    }
    return std::forward<Visitor>(visitor)(static_cast<const Text&>(node));
}

} // namespace quarry::dom
