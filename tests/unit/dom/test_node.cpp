#include <gtest/gtest.h>
#include "quarry/dom/element.hpp"
#include "quarry/dom/text.hpp"
#include "quarry/dom/visit.hpp"
#include "quarry/css/selector.hpp"

using namespace quarry;
using namespace quarry::dom;

namespace {

RefPtr<Element> element(const char* tag) {
    return make_ref<Element>(String(tag));
}

RefPtr<Text> text(const char* data) {
    return make_ref<Text>(String(data));
}

} // namespace

class NodeTest : public ::testing::Test {
protected:
    // <ul><li id="a"/>"gap"<li id="b"/><li id="c"/></ul>
    void SetUp() override {
        list = element("ul");
        a = element("li");
        a->set_id("a"_s);
        gap = text("gap");
        b = element("li");
        b->set_id("b"_s);
        c = element("li");
        c->set_id("c"_s);

        list->append_child(a);
        list->append_child(gap);
        list->append_child(b);
        list->append_child(c);
    }

    RefPtr<Element> list;
    RefPtr<Element> a;
    RefPtr<Text> gap;
    RefPtr<Element> b;
    RefPtr<Element> c;
};

// ============================================================================
// Element basics
// ============================================================================

TEST(ElementTest, TagNameIsLowercased) {
    auto div = element("DIV");
    EXPECT_EQ(div->tag_name(), String("div"));
    EXPECT_EQ(div->node_name(), String("div"));
    EXPECT_EQ(div->node_type(), NodeType::Element);
    EXPECT_TRUE(div->is_element());
    EXPECT_FALSE(div->is_text());
}

TEST(ElementTest, FirstDuplicateAttributeWins) {
    auto div = make_ref<Element>("div"_s, std::vector<Attribute>{
        {"Data-K"_s, "first"_s},
        {"data-k"_s, "second"_s},
    });

    ASSERT_EQ(div->attributes().size(), 1u);
    EXPECT_EQ(div->attributes()[0].name, String("data-k"));
    EXPECT_EQ(div->get_attribute("data-k"_s), String("first"));
}

TEST(ElementTest, AttributeAccess) {
    auto input = element("input");

    EXPECT_FALSE(input->has_attributes());
    EXPECT_EQ(input->get_attribute("type"_s), std::nullopt);

    input->set_attribute("TYPE"_s, "text"_s);
    EXPECT_TRUE(input->has_attribute("type"_s));
    EXPECT_EQ(input->get_attribute("Type"_s), String("text"));

    input->set_attribute("type"_s, "checkbox"_s);
    EXPECT_EQ(input->attributes().size(), 1u);
    EXPECT_EQ(input->get_attribute("type"_s), String("checkbox"));

    input->remove_attribute("type"_s);
    EXPECT_FALSE(input->has_attribute("type"_s));
}

TEST(ElementTest, EmptyAttributeValueIsPresent) {
    auto input = element("input");
    input->set_attribute("disabled"_s, String());

    EXPECT_TRUE(input->has_attribute("disabled"_s));
    EXPECT_EQ(input->get_attribute("disabled"_s), String());
}

TEST(ElementTest, ClassList) {
    auto div = element("div");
    EXPECT_TRUE(div->class_list().empty());

    div->set_attribute("class"_s, "  item\tactive  "_s);
    auto classes = div->class_list();
    ASSERT_EQ(classes.size(), 2u);
    EXPECT_EQ(classes[0], String("item"));
    EXPECT_EQ(classes[1], String("active"));

    EXPECT_TRUE(div->has_class("active"_s));
    EXPECT_FALSE(div->has_class("act"_s));
    EXPECT_EQ(div->class_name(), String("  item\tactive  "));
}

TEST(ElementTest, Id) {
    auto div = element("div");
    EXPECT_TRUE(div->id().empty());

    div->set_id("main"_s);
    EXPECT_EQ(div->id(), String("main"));
}

TEST(ElementTest, VoidElements) {
    EXPECT_TRUE(Element::is_void_element("br"_s));
    EXPECT_TRUE(Element::is_void_element("IMG"_s));
    EXPECT_TRUE(Element::is_void_element("wbr"_s));
    EXPECT_FALSE(Element::is_void_element("div"_s));
    EXPECT_FALSE(Element::is_void_element("script"_s));

    EXPECT_TRUE(element("hr")->is_void());
}

// ============================================================================
// Text
// ============================================================================

TEST(TextTest, Data) {
    auto t = text("ab");
    EXPECT_EQ(t->node_type(), NodeType::Text);
    EXPECT_EQ(t->node_name(), String("#text"));
    EXPECT_EQ(t->length(), 2u);

    t->append_data("cd"_s);
    EXPECT_EQ(t->data(), String("abcd"));
    EXPECT_EQ(t->text_content(), String("abcd"));
}

TEST(TextTest, EqualityComparesPayload) {
    auto first = text("same");
    auto second = text("same");
    auto other = text("different");

    auto parent = element("p");
    parent->append_child(first);

    EXPECT_TRUE(*first == *second);
    EXPECT_FALSE(*first == *other);
}

TEST(TextTest, CannotHaveChildren) {
    auto t = text("leaf");
    EXPECT_EQ(t->append_child(element("b")), nullptr);
    EXPECT_FALSE(t->has_children());
}

// ============================================================================
// Tree structure
// ============================================================================

TEST_F(NodeTest, ParentAndChildren) {
    EXPECT_EQ(a->parent_node(), list.get());
    EXPECT_EQ(gap->parent_node(), list.get());
    EXPECT_EQ(list->parent_node(), nullptr);

    EXPECT_EQ(list->child_nodes().size(), 4u);
    EXPECT_EQ(list->first_child(), a.get());
    EXPECT_EQ(list->last_child(), c.get());
    EXPECT_EQ(list->child_element_count(), 3u);
}

TEST_F(NodeTest, SiblingLinks) {
    EXPECT_EQ(a->previous_sibling(), nullptr);
    EXPECT_EQ(a->next_sibling(), gap.get());
    EXPECT_EQ(gap->next_sibling(), b.get());
    EXPECT_EQ(c->next_sibling(), nullptr);

    EXPECT_EQ(a->next_element_sibling(), b.get());
    EXPECT_EQ(b->previous_element_sibling(), a.get());
    EXPECT_EQ(a->previous_element_sibling(), nullptr);
}

TEST_F(NodeTest, SiblingSequencesAreNearestFirst) {
    auto previous = c->previous_siblings();
    ASSERT_EQ(previous.size(), 3u);
    EXPECT_EQ(previous[0], b.get());
    EXPECT_EQ(previous[1], gap.get());
    EXPECT_EQ(previous[2], a.get());

    auto next = a->next_siblings();
    ASSERT_EQ(next.size(), 3u);
    EXPECT_EQ(next[0], gap.get());
    EXPECT_EQ(next[2], c.get());
}

TEST_F(NodeTest, ElementChildren) {
    EXPECT_EQ(list->first_element_child(), a.get());
    EXPECT_EQ(list->last_element_child(), c.get());
    EXPECT_EQ(a->first_element_child(), nullptr);
}

TEST_F(NodeTest, AncestorsAreNearestFirst) {
    auto wrapper = element("div");
    wrapper->append_child(list);
    auto em = element("em");
    b->append_child(em);

    auto ancestors = em->ancestors();
    ASSERT_EQ(ancestors.size(), 3u);
    EXPECT_EQ(ancestors[0], b.get());
    EXPECT_EQ(ancestors[1], list.get());
    EXPECT_EQ(ancestors[2], wrapper.get());
}

TEST_F(NodeTest, DescendantsInDocumentOrder) {
    auto em = element("em");
    a->append_child(em);

    auto all = list->descendants();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all[0], a.get());
    EXPECT_EQ(all[1], em.get());
    EXPECT_EQ(all[2], gap.get());
    EXPECT_EQ(all[3], b.get());
    EXPECT_EQ(all[4], c.get());
}

TEST_F(NodeTest, Contains) {
    EXPECT_TRUE(list->contains(list.get()));
    EXPECT_TRUE(list->contains(gap.get()));
    EXPECT_FALSE(a->contains(b.get()));
    EXPECT_FALSE(a->contains(list.get()));
}

TEST_F(NodeTest, TextContent) {
    b->append_child(text("two"));
    EXPECT_EQ(list->text_content(), String("gaptwo"));
    EXPECT_TRUE(a->text_content().empty());
}

// ============================================================================
// Tree manipulation
// ============================================================================

TEST_F(NodeTest, InsertBefore) {
    auto first = element("li");
    EXPECT_EQ(list->insert_before(first, a.get()), first);

    EXPECT_EQ(list->first_child(), first.get());
    EXPECT_EQ(first->next_sibling(), a.get());
    EXPECT_EQ(a->previous_sibling(), first.get());
}

TEST_F(NodeTest, InsertBeforeUnknownReferenceIsRefused) {
    auto orphan = element("li");
    auto stray = element("li");
    EXPECT_EQ(list->insert_before(orphan, stray.get()), nullptr);
    EXPECT_EQ(orphan->parent_node(), nullptr);
}

TEST_F(NodeTest, RemoveChildRelinksSiblings) {
    auto removed = list->remove_child(gap);
    EXPECT_EQ(removed, gap);
    EXPECT_EQ(gap->parent_node(), nullptr);
    EXPECT_EQ(gap->next_sibling(), nullptr);

    EXPECT_EQ(a->next_sibling(), b.get());
    EXPECT_EQ(b->previous_sibling(), a.get());
    EXPECT_EQ(list->child_nodes().size(), 3u);

    EXPECT_EQ(list->remove_child(gap), nullptr);
}

TEST_F(NodeTest, AppendMovesBetweenParents) {
    auto other = element("ol");
    other->append_child(b);

    EXPECT_EQ(b->parent_node(), other.get());
    EXPECT_EQ(gap->next_sibling(), c.get());
    EXPECT_EQ(list->child_element_count(), 2u);
}

TEST_F(NodeTest, AppendWithinSameParentMovesToEnd) {
    list->append_child(a);

    EXPECT_EQ(list->child_nodes().size(), 4u);
    EXPECT_EQ(list->first_child(), gap.get());
    EXPECT_EQ(list->last_child(), a.get());
    EXPECT_EQ(c->next_sibling(), a.get());
}

TEST_F(NodeTest, CycleIsRefused) {
    EXPECT_EQ(a->append_child(list), nullptr);
    EXPECT_EQ(list->append_child(list), nullptr);
    EXPECT_EQ(list->parent_node(), nullptr);
}

TEST(NodeCycleTest, ChildlessNodeCannotAdoptItself) {
    auto leaf = element("span");
    EXPECT_EQ(leaf->append_child(leaf), nullptr);
    EXPECT_FALSE(leaf->has_children());
    EXPECT_EQ(leaf->parent_node(), nullptr);
}

TEST_F(NodeTest, ChildrenOutlivingParentAreDetached) {
    RefPtr<Node> survivor = b;
    a = nullptr;
    b = nullptr;
    c = nullptr;
    gap = nullptr;
    list = nullptr;

    EXPECT_EQ(survivor->parent_node(), nullptr);
    EXPECT_EQ(survivor->previous_sibling(), nullptr);
    EXPECT_EQ(survivor->next_sibling(), nullptr);
    EXPECT_TRUE(survivor->ancestors().empty());
}

TEST(NodeLifetimeTest, SelectorsDoNotReachDestroyedAncestors) {
    RefPtr<Element> span;
    {
        auto div = element("div");
        auto p = element("p");
        p->append_child(text("x"));
        div->append_child(p);
        span = element("span");
        div->append_child(span);
        EXPECT_TRUE(span->matched_by("div span"_s));
        EXPECT_TRUE(span->matched_by("p + span"_s));
    }

    EXPECT_EQ(span->parent_node(), nullptr);
    EXPECT_FALSE(span->matched_by("div span"_s));
    EXPECT_FALSE(span->matched_by("p + span"_s));
    EXPECT_TRUE(span->matched_by("span"_s));
}

TEST(NodeLifetimeTest, KeptSubtreeStaysIntact) {
    RefPtr<Element> p;
    {
        auto div = element("div");
        p = element("p");
        p->append_child(element("em"));
        div->append_child(p);
    }

    EXPECT_EQ(p->parent_node(), nullptr);
    ASSERT_NE(p->first_element_child(), nullptr);
    EXPECT_EQ(p->first_element_child()->parent_node(), p.get());
}

TEST(NodeLifetimeTest, DeepTreeIsReleased) {
    auto root = element("div");
    Element* current = root.get();
    for (int i = 0; i < 100000; ++i) {
        auto child = element("div");
        current->append_child(child);
        current = child.get();
    }
    EXPECT_EQ(current->ancestors().size(), 100000u);
    root = nullptr;
}

// ============================================================================
// Visit
// ============================================================================

TEST_F(NodeTest, VisitDispatchesOnVariant) {
    auto describe = [](const auto& n) -> String {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Element>) {
            return "element:"_s + n.tag_name();
        } else {
            return "text:"_s + n.data();
        }
    };

    EXPECT_EQ(visit(static_cast<const Node&>(*a), describe), String("element:li"));
    EXPECT_EQ(visit(static_cast<const Node&>(*gap), describe), String("text:gap"));
}
