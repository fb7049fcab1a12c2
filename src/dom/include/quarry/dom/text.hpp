#pragma once

#include "node.hpp"

namespace quarry::dom {

// ============================================================================
// Text - Character data leaf
// ============================================================================

class Text final : public Node {
public:
    Text() : Node(NodeType::Text) {}
    explicit Text(const String& data);

    [[nodiscard]] const String& data() const { return m_data; }
    void set_data(const String& data) { m_data = data; }
    void append_data(const String& data) { m_data += data; }

    [[nodiscard]] usize length() const { return m_data.length(); }

    // Payload equality, independent of tree position
    [[nodiscard]] bool operator==(const Text& other) const { return m_data == other.m_data; }

private:
    String m_data;
};

} // namespace quarry::dom
