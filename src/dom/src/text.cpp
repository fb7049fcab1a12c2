/**
 * DOM Text implementation
 */

#include "quarry/dom/text.hpp"

namespace quarry::dom {

Text::Text(const String& data)
    : Node(NodeType::Text)
    , m_data(data)
{
}

} // namespace quarry::dom
