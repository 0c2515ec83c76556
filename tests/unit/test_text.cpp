#include <gtest/gtest.h>
#include "../../src/utils/html/document.hpp"
#include "../../src/utils/text/string_utils.hpp"

using namespace Harvest::Utils::Text;
using Harvest::Utils::Html::Document;

TEST(TextTest, TrimAndLower) {
    EXPECT_EQ(trim("  \t news \r\n"), "news");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("RsS"), "rss");
}

TEST(TextTest, CaseInsensitiveContains) {
    EXPECT_TRUE(icontains("Rust 1.80 released", "RUST"));
    EXPECT_TRUE(icontains("anything", ""));
    EXPECT_FALSE(icontains("Go generics", "rust"));
}

TEST(TextTest, SquashWhitespace) {
    EXPECT_EQ(squash_whitespace("  Breaking \n\n  news\t today "), "Breaking news today");
    EXPECT_EQ(squash_whitespace(""), "");
}

TEST(TextTest, UrlEncode) {
    EXPECT_EQ(url_encode("climate change"), "climate+change");
    EXPECT_EQ(url_encode("c++ & rust"), "c%2B%2B+%26+rust");
    EXPECT_EQ(url_encode("caf\xC3\xA9"), "caf%C3%A9");
    EXPECT_EQ(url_encode("a-b_c.d~e"), "a-b_c.d~e");
}

TEST(TextTest, Join) {
    EXPECT_EQ(join({"a", "b", "c"}, "/"), "a/b/c");
    EXPECT_EQ(join({}, ","), "");
}

TEST(TextTest, DocumentFindsTagsInOrder) {
    Document doc(R"html(
        <h2>Second level</h2>
        <div><h1>Top</h1><h3>Third</h3></div>
        <h4>Ignored</h4>
    )html");

    auto headings = doc.find_all({GUMBO_TAG_H1, GUMBO_TAG_H2, GUMBO_TAG_H3});
    ASSERT_EQ(headings.size(), 3u);
    EXPECT_EQ(Document::text(headings[0]), "Second level");
    EXPECT_EQ(Document::text(headings[1]), "Top");
    EXPECT_EQ(Document::text(headings[2]), "Third");
}

TEST(TextTest, DocumentTextSkipsScripts) {
    Document doc("<div><p>Hello <b>big</b> world</p><script>var x = 1;</script>"
                 "<style>p{}</style></div>");
    auto divs = doc.find_all({GUMBO_TAG_DIV});
    ASSERT_EQ(divs.size(), 1u);
    EXPECT_EQ(Document::text(divs[0]), "Hello big world");
}

TEST(TextTest, DocumentAttributesAndAncestors) {
    Document doc("<a href='/story'><h2>Wrapped <span>headline</span></h2></a>");
    auto     spans = doc.find_all({GUMBO_TAG_SPAN});
    ASSERT_EQ(spans.size(), 1u);

    const GumboNode* link = Document::closest(spans[0], GUMBO_TAG_A);
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(Document::attribute(link, "href"), "/story");
    EXPECT_EQ(Document::attribute(link, "title"), "");
    EXPECT_EQ(Document::closest(spans[0], GUMBO_TAG_ARTICLE), nullptr);
}

TEST(TextTest, MalformedHtml) {
    Document doc("<div><a>Unclosed tag<p>nested");
    EXPECT_NE(doc.root(), nullptr);
    EXPECT_EQ(doc.find_all({GUMBO_TAG_A}).size(), 1u);

    Document garbage("<<<<>>>>");
    EXPECT_NE(garbage.root(), nullptr);
}
