#include <gtest/gtest.h>
#include "quarry/html/dom_builder.hpp"

using namespace quarry;
using namespace quarry::html;

// ============================================================================
// DOM Builder Tests
// ============================================================================

class DOMBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        builder.set_error_callback([this](const String& message, SourcePosition) {
            errors.push_back(message);
        });
    }

    DOMBuilder builder;
    std::vector<String> errors;
};

TEST_F(DOMBuilderTest, NestedElements) {
    builder.start_tag("html"_s);
    builder.start_tag("body"_s);
    builder.start_tag("p"_s, {{"class"_s, "intro"_s}});
    builder.text("hi"_s);
    builder.end_tag("p"_s);
    builder.end_tag("body"_s);
    builder.end_tag("html"_s);
    builder.finish();

    auto root = builder.root();
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->tag_name(), String("html"));

    auto* body = root->first_element_child();
    ASSERT_NE(body, nullptr);
    auto* p = body->first_element_child();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->get_attribute("class"_s), String("intro"));
    EXPECT_EQ(p->text_content(), String("hi"));
    EXPECT_TRUE(errors.empty());
}

TEST_F(DOMBuilderTest, StackTracksOpenElements) {
    builder.start_tag("div"_s);
    builder.start_tag("span"_s);
    EXPECT_EQ(builder.open_element_count(), 2u);
    EXPECT_EQ(builder.current_node()->tag_name(), String("span"));

    builder.end_tag("span"_s);
    EXPECT_EQ(builder.open_element_count(), 1u);
    EXPECT_EQ(builder.current_node()->tag_name(), String("div"));
}

TEST_F(DOMBuilderTest, AdjacentTextIsCoalesced) {
    builder.start_tag("p"_s);
    builder.text("ab"_s);
    builder.text("cd"_s);
    builder.end_tag("p"_s);
    builder.finish();

    auto p = builder.root();
    ASSERT_EQ(p->child_nodes().size(), 1u);
    ASSERT_TRUE(p->first_child()->is_text());
    EXPECT_EQ(p->first_child()->as_text()->data(), String("abcd"));
}

TEST_F(DOMBuilderTest, CommentDoesNotSplitText) {
    builder.start_tag("p"_s);
    builder.text("ab"_s);
    builder.comment(" note "_s);
    builder.text("cd"_s);
    builder.end_tag("p"_s);
    builder.finish();

    auto p = builder.root();
    ASSERT_EQ(p->child_nodes().size(), 1u);
    EXPECT_EQ(p->text_content(), String("abcd"));
}

TEST_F(DOMBuilderTest, TextSeparatedByElementIsNotCoalesced) {
    builder.start_tag("p"_s);
    builder.text("a"_s);
    builder.start_tag("br"_s);
    builder.text("b"_s);
    builder.end_tag("p"_s);
    builder.finish();

    EXPECT_EQ(builder.root()->child_nodes().size(), 3u);
}

TEST_F(DOMBuilderTest, EmptyTextIsIgnored) {
    builder.start_tag("p"_s);
    builder.text(String());
    builder.end_tag("p"_s);
    builder.finish();

    EXPECT_FALSE(builder.root()->has_children());
}

TEST_F(DOMBuilderTest, VoidElementsAreNotPushed) {
    builder.start_tag("div"_s);
    builder.start_tag("img"_s, {{"src"_s, "a.png"_s}});
    builder.start_tag("span"_s);
    builder.end_tag("span"_s);
    builder.end_tag("div"_s);
    builder.finish();

    auto div = builder.root();
    ASSERT_EQ(div->child_element_count(), 2u);
    auto* img = div->first_element_child();
    EXPECT_EQ(img->tag_name(), String("img"));
    EXPECT_FALSE(img->has_children());
    EXPECT_EQ(img->next_element_sibling()->tag_name(), String("span"));
    EXPECT_TRUE(errors.empty());
}

TEST_F(DOMBuilderTest, VoidEndTagIsIgnored) {
    builder.start_tag("p"_s);
    builder.start_tag("br"_s);
    builder.end_tag("br"_s);
    builder.text("x"_s);
    builder.end_tag("p"_s);
    builder.finish();

    auto p = builder.root();
    EXPECT_EQ(p->child_nodes().size(), 2u);
    EXPECT_EQ(p->text_content(), String("x"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("extra end tag: br"));
}

TEST_F(DOMBuilderTest, EndTagClosesIntermediateElements) {
    builder.start_tag("div"_s);
    builder.start_tag("span"_s);
    builder.end_tag("div"_s);
    builder.text("after"_s);
    builder.finish();

    ASSERT_EQ(builder.top_level_nodes().size(), 2u);
    auto div = builder.root();
    EXPECT_EQ(div->child_element_count(), 1u);
    EXPECT_TRUE(builder.top_level_nodes()[1]->is_text());

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("end tag div closes unclosed span"));
}

TEST_F(DOMBuilderTest, UnclosedElementsAreClosedAtFinish) {
    builder.start_tag("ul"_s);
    builder.start_tag("li"_s);
    builder.text("one"_s);
    builder.finish();

    EXPECT_TRUE(builder.finished());
    EXPECT_EQ(builder.open_element_count(), 0u);
    EXPECT_EQ(builder.root()->text_content(), String("one"));
    ASSERT_EQ(errors.size(), 1u);
}

TEST_F(DOMBuilderTest, EndTagMatchesCaseInsensitively) {
    builder.start_tag("DIV"_s);
    builder.end_tag("Div"_s);
    builder.finish();

    EXPECT_TRUE(errors.empty());
}

TEST_F(DOMBuilderTest, RootIsFirstTopLevelElement) {
    builder.text("lead"_s);
    builder.start_tag("a"_s);
    builder.end_tag("a"_s);
    builder.start_tag("b"_s);
    builder.end_tag("b"_s);
    builder.finish();

    ASSERT_EQ(builder.top_level_nodes().size(), 3u);
    EXPECT_EQ(builder.root()->tag_name(), String("a"));
}

TEST_F(DOMBuilderTest, NoStartTagMeansNoRoot) {
    builder.text("just text"_s);
    builder.finish();

    EXPECT_EQ(builder.root(), nullptr);
    EXPECT_EQ(builder.top_level_nodes().size(), 1u);
}

TEST_F(DOMBuilderTest, ProcessTokens) {
    builder.process_token(DoctypeToken{"html"_s, {}});
    builder.process_token(StartTagToken{"p"_s, {{"id"_s, "x"_s}}, false, {}});
    builder.process_token(TextToken{"t"_s, {}});
    builder.process_token(CommentToken{"c"_s, {}});
    builder.process_token(EndTagToken{"p"_s, {}});
    builder.process_token(EndOfFileToken{});

    EXPECT_TRUE(builder.finished());
    EXPECT_EQ(builder.root()->id(), String("x"));
    EXPECT_EQ(builder.root()->text_content(), String("t"));
}

// ============================================================================
// After finish
// ============================================================================

TEST_F(DOMBuilderTest, TokensAfterFinishThrow) {
    builder.start_tag("p"_s);
    builder.end_tag("p"_s);
    builder.finish();

    EXPECT_THROW(builder.start_tag("p"_s), DOMBuilderException);
    EXPECT_THROW(builder.end_tag("p"_s), DOMBuilderException);
    EXPECT_THROW(builder.text("x"_s), DOMBuilderException);
    EXPECT_THROW(builder.comment("x"_s), DOMBuilderException);
    EXPECT_THROW(builder.process_token(DoctypeToken{"html"_s, {}}), DOMBuilderException);
    EXPECT_THROW(builder.finish(), DOMBuilderException);
    EXPECT_THROW(builder.process_token(EndOfFileToken{}), DOMBuilderException);
}

// ============================================================================
// Strict mode
// ============================================================================

class StrictDOMBuilderTest : public ::testing::Test {
protected:
    DOMBuilder builder{ParseOptions{.strict = true}};
};

TEST_F(StrictDOMBuilderTest, WellFormedInputBuilds) {
    builder.start_tag("div"_s);
    builder.start_tag("br"_s);
    builder.end_tag("div"_s);
    builder.finish();

    ASSERT_NE(builder.root(), nullptr);
    EXPECT_EQ(builder.root()->child_element_count(), 1u);
}

TEST_F(StrictDOMBuilderTest, SpuriousEndTagThrows) {
    builder.start_tag("p"_s);
    builder.start_tag("br"_s);

    try {
        builder.end_tag("br"_s, SourcePosition{3, 7});
        FAIL() << "expected DOMBuilderException";
    } catch (const DOMBuilderException& e) {
        EXPECT_EQ(e.message(), String("extra end tag: br"));
        ASSERT_TRUE(e.position().has_value());
        EXPECT_EQ(e.position()->line, 3u);
        EXPECT_EQ(e.position()->column, 7u);
    }
}

TEST_F(StrictDOMBuilderTest, MismatchedEndTagThrows) {
    builder.start_tag("div"_s);
    builder.start_tag("span"_s);

    EXPECT_THROW(builder.end_tag("div"_s), DOMBuilderException);
}

TEST_F(StrictDOMBuilderTest, UnclosedAtFinishThrows) {
    builder.start_tag("div"_s);

    EXPECT_THROW(builder.finish(), DOMBuilderException);
}
