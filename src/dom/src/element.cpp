/**
 * DOM Element implementation
 */

#include "quarry/dom/element.hpp"
#include <algorithm>
#include <array>

namespace quarry::dom {

namespace {

constexpr std::array<std::string_view, 14> VOID_ELEMENTS = {
    "area", "base", "br", "col", "embed", "hr", "img",
    "input", "link", "meta", "param", "source", "track", "wbr"
};

} // namespace

Element::Element(const String& tag_name)
    : Node(NodeType::Element)
    , m_tag_name(tag_name.to_lowercase())
{
}

Element::Element(const String& tag_name, const std::vector<Attribute>& attributes)
    : Element(tag_name)
{
    for (const auto& attr : attributes) {
        if (!has_attribute(attr.name)) {
            m_attributes.push_back({attr.name.to_lowercase(), attr.value});
        }
    }
}

std::vector<String> Element::class_list() const {
    auto class_attr = get_attribute("class"_s);
    if (!class_attr) {
        return {};
    }
    return class_attr->split_whitespace();
}

bool Element::has_class(const String& name) const {
    auto classes = class_list();
    return std::find(classes.begin(), classes.end(), name) != classes.end();
}

bool Element::has_attribute(const String& name) const {
    return get_attribute(name).has_value();
}

std::optional<String> Element::get_attribute(const String& name) const {
    for (const auto& attr : m_attributes) {
        if (attr.name.equals_ignore_case(name)) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void Element::set_attribute(const String& name, const String& value) {
    for (auto& attr : m_attributes) {
        if (attr.name.equals_ignore_case(name)) {
            attr.value = value;
            return;
        }
    }
    m_attributes.push_back({name.to_lowercase(), value});
}

void Element::remove_attribute(const String& name) {
    m_attributes.erase(
        std::remove_if(m_attributes.begin(), m_attributes.end(),
            [&name](const Attribute& attr) { return attr.name.equals_ignore_case(name); }),
        m_attributes.end());
}

u32 Element::child_element_count() const {
    return static_cast<u32>(std::count_if(child_nodes().begin(), child_nodes().end(),
        [](const RefPtr<Node>& child) { return child->is_element(); }));
}

bool Element::is_void_element(const String& tag_name) {
    auto lowered = tag_name.to_lowercase();
    return std::find(VOID_ELEMENTS.begin(), VOID_ELEMENTS.end(), lowered.view()) != VOID_ELEMENTS.end();
}

} // namespace quarry::dom
