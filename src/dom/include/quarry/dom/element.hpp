#pragma once

#include "node.hpp"
#include <optional>

namespace quarry::dom {

// ============================================================================
// Attribute
// ============================================================================

struct Attribute {
    String name;
    String value;

    [[nodiscard]] bool operator==(const Attribute& other) const {
        return name == other.name && value == other.value;
    }
};

// ============================================================================
// Element
// ============================================================================

class Element final : public Node {
public:
    // Tag and attribute names are stored lower-cased. On duplicate names the
    // first attribute wins.
    explicit Element(const String& tag_name);
    Element(const String& tag_name, const std::vector<Attribute>& attributes);

    [[nodiscard]] const String& tag_name() const { return m_tag_name; }

    // ID and class
    [[nodiscard]] String id() const { return get_attribute("id"_s).value_or(String()); }
    void set_id(const String& id) { set_attribute("id"_s, id); }

    [[nodiscard]] String class_name() const { return get_attribute("class"_s).value_or(String()); }
    [[nodiscard]] std::vector<String> class_list() const;
    [[nodiscard]] bool has_class(const String& name) const;

    // Attributes (name lookup is ASCII case-insensitive)
    [[nodiscard]] bool has_attribute(const String& name) const;
    [[nodiscard]] std::optional<String> get_attribute(const String& name) const;
    void set_attribute(const String& name, const String& value);
    void remove_attribute(const String& name);

    [[nodiscard]] const std::vector<Attribute>& attributes() const { return m_attributes; }
    [[nodiscard]] bool has_attributes() const { return !m_attributes.empty(); }

    [[nodiscard]] u32 child_element_count() const;

    // area, base, br, col, embed, hr, img, input, link, meta, param, source, track, wbr
    [[nodiscard]] bool is_void() const { return is_void_element(m_tag_name); }
    [[nodiscard]] static bool is_void_element(const String& tag_name);

private:
    String m_tag_name;
    std::vector<Attribute> m_attributes;
};

} // namespace quarry::dom
