#include <gtest/gtest.h>
#include "quarry/core/string.hpp"
#include <sstream>

using namespace quarry;

// ============================================================================
// Unicode Tests
// ============================================================================

TEST(UnicodeTest, AsciiClassification) {
    EXPECT_TRUE(unicode::is_ascii_alpha('a'));
    EXPECT_TRUE(unicode::is_ascii_alpha('Z'));
    EXPECT_FALSE(unicode::is_ascii_alpha('1'));

    EXPECT_TRUE(unicode::is_ascii_hex_digit('f'));
    EXPECT_TRUE(unicode::is_ascii_hex_digit('A'));
    EXPECT_FALSE(unicode::is_ascii_hex_digit('g'));

    EXPECT_TRUE(unicode::is_ascii_whitespace('\f'));
    EXPECT_TRUE(unicode::is_ascii_whitespace('\r'));
    EXPECT_FALSE(unicode::is_ascii_whitespace('\v'));
}

TEST(UnicodeTest, CaseMapping) {
    EXPECT_EQ(unicode::to_ascii_lower('A'), U'a');
    EXPECT_EQ(unicode::to_ascii_lower('a'), U'a');
    EXPECT_EQ(unicode::to_ascii_lower(0x00C9), 0x00C9u);
}

TEST(UnicodeTest, Utf8Encode) {
    char buffer[4];

    EXPECT_EQ(unicode::utf8_encode('A', buffer), 1u);
    EXPECT_EQ(buffer[0], 'A');

    EXPECT_EQ(unicode::utf8_encode(0x00E9, buffer), 2u);
    EXPECT_EQ(static_cast<u8>(buffer[0]), 0xC3);
    EXPECT_EQ(static_cast<u8>(buffer[1]), 0xA9);

    EXPECT_EQ(unicode::utf8_encode(0x20AC, buffer), 3u);
    EXPECT_EQ(static_cast<u8>(buffer[0]), 0xE2);
    EXPECT_EQ(static_cast<u8>(buffer[1]), 0x82);
    EXPECT_EQ(static_cast<u8>(buffer[2]), 0xAC);

    EXPECT_EQ(unicode::utf8_encode(0x110000, buffer), 0u);
}

// ============================================================================
// String Tests
// ============================================================================

TEST(StringTest, DefaultConstruction) {
    String s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0u);
}

TEST(StringTest, NullCStringIsEmpty) {
    String s(static_cast<const char*>(nullptr));
    EXPECT_TRUE(s.empty());
}

TEST(StringTest, FromCodePoint) {
    EXPECT_EQ(String::from_code_point(0x00A9), String("\xC2\xA9"));
    EXPECT_EQ(String::from_code_point('x'), "x"_s);
}

TEST(StringTest, Concatenation) {
    String a("Hello");
    String c = a + String(" World");
    EXPECT_EQ(c, String("Hello World"));

    c += std::string_view("!");
    EXPECT_EQ(c, String("Hello World!"));
}

TEST(StringTest, SearchHelpers) {
    String s("Hello World");

    EXPECT_TRUE(s.contains(String("World")));
    EXPECT_FALSE(s.contains(String("Foo")));
    EXPECT_TRUE(s.starts_with(String("Hello")));
    EXPECT_FALSE(s.starts_with(String("World")));
    EXPECT_TRUE(s.ends_with(String("World")));
    EXPECT_FALSE(s.ends_with(String("Hello")));
}

TEST(StringTest, Find) {
    String s("Hello World");

    EXPECT_EQ(s.find(String("World")), 6u);
    EXPECT_EQ(s.find('o'), 4u);
    EXPECT_EQ(s.find('o', 5), 7u);
    EXPECT_EQ(s.find(String("Foo")), std::nullopt);
}

TEST(StringTest, CaseConversion) {
    EXPECT_EQ(String("Hello WORLD").to_lowercase(), String("hello world"));
    EXPECT_EQ(String("\xC3\x89T\xC3\x89").to_lowercase(), String("\xC3\x89t\xC3\x89"));
}

TEST(StringTest, SplitWhitespace) {
    auto parts = String("  item \t active\nlarge  ").split_whitespace();

    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], String("item"));
    EXPECT_EQ(parts[1], String("active"));
    EXPECT_EQ(parts[2], String("large"));

    EXPECT_TRUE(String("   ").split_whitespace().empty());
    EXPECT_TRUE(String().split_whitespace().empty());
}

TEST(StringTest, ContainsWhitespace) {
    EXPECT_TRUE(String("a b").contains_whitespace());
    EXPECT_TRUE(String("a\fb").contains_whitespace());
    EXPECT_FALSE(String("a-b").contains_whitespace());
}

TEST(StringTest, EqualsIgnoreCase) {
    String a("Hello");

    EXPECT_TRUE(a.equals_ignore_case(String("HELLO")));
    EXPECT_TRUE(a.equals_ignore_case(String("hello")));
    EXPECT_FALSE(a.equals_ignore_case(String("World")));
    EXPECT_FALSE(a.equals_ignore_case(String("Hell")));
}

TEST(StringTest, StreamOutput) {
    std::ostringstream out;
    out << String("div");
    EXPECT_EQ(out.str(), "div");
}

// ============================================================================
// StringBuilder Tests
// ============================================================================

TEST(StringBuilderTest, BasicUsage) {
    StringBuilder sb;
    sb.append("Hello");
    sb.append(' ');
    sb.append(String("World"));

    EXPECT_EQ(sb.size(), 11u);
    EXPECT_EQ(sb.view(), "Hello World");
    EXPECT_EQ(sb.build(), String("Hello World"));
}

TEST(StringBuilderTest, AppendNumber) {
    StringBuilder sb;
    sb.append(u64{0});
    sb.append(" ");
    sb.append(u64{100});

    EXPECT_EQ(sb.build(), String("0 100"));
}

TEST(StringBuilderTest, AppendCodePoint) {
    StringBuilder sb;
    sb.append(unicode::CodePoint('A'));
    sb.append(unicode::CodePoint(0x4E2D));

    EXPECT_EQ(sb.build(), String("A\xE4\xB8\xAD"));
}

TEST(StringBuilderTest, Clear) {
    StringBuilder sb;
    sb.append("text");
    sb.clear();

    EXPECT_TRUE(sb.empty());
    EXPECT_TRUE(sb.build().empty());
}
