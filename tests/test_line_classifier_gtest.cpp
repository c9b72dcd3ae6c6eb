#include <gtest/gtest.h>
#include "../CatalogLint/line_classifier.h"

// Line roles of the listing dialect

TEST(LineClassifierTest, CategoryHeader) {
    EXPECT_EQ(classifyLine("### Animals"), LineKind::CategoryHeader);
    EXPECT_EQ(classifyLine("###Animals"), LineKind::CategoryHeader);
    EXPECT_EQ(classifyLine("#### Deeper"), LineKind::CategoryHeader);
}

TEST(LineClassifierTest, SeparatorAndTableRows) {
    EXPECT_EQ(classifyLine("|---|---|---|---|---|"), LineKind::SeparatorRow);
    EXPECT_EQ(classifyLine("|:---|:---|"), LineKind::TableRow);
    EXPECT_EQ(classifyLine("| [Foo](http://x) | Does a thing | No | Yes | Yes |"), LineKind::TableRow);
}

TEST(LineClassifierTest, IndexBulletAndOther) {
    EXPECT_EQ(classifyLine("* [Animals](#animals)"), LineKind::IndexBullet);
    EXPECT_EQ(classifyLine("*[Animals](#animals)"), LineKind::Other);
    EXPECT_EQ(classifyLine("## Index"), LineKind::Other);
    EXPECT_EQ(classifyLine(""), LineKind::Other);
    EXPECT_EQ(classifyLine("API | Description | Auth | HTTPS | CORS"), LineKind::Other);
}

TEST(LineClassifierTest, ParseCategoryHeader) {
    string name;
    EXPECT_TRUE(parseCategoryHeader("### Open Data", name));
    EXPECT_EQ(name, "Open Data");
    EXPECT_FALSE(parseCategoryHeader("###Open Data", name));
    EXPECT_FALSE(parseCategoryHeader("#### Open Data", name));
}

TEST(LineClassifierTest, HeaderPatternFollowsAnchor) {
    string name;
    EXPECT_TRUE(parseCategoryHeader(CATEGORY_ANCHOR + " Weather", name));
    EXPECT_EQ(name, "Weather");
    EXPECT_FALSE(parseCategoryHeader(CATEGORY_ANCHOR + "# Weather", name));
    EXPECT_TRUE(categoryHeaderPattern().ok());
}

TEST(LineClassifierTest, CategoryNameFromHeaderIsTrimmedRemainder) {
    EXPECT_EQ(categoryNameFromHeader("### Open Data"), "Open Data");
    EXPECT_EQ(categoryNameFromHeader("###Books"), "Books");
    EXPECT_EQ(categoryNameFromHeader("Books"), "");
}

TEST(LineClassifierTest, ParseIndexBullet) {
    string name;
    EXPECT_TRUE(parseIndexBullet("* [Anime](#anime)", name));
    EXPECT_EQ(name, "Anime");
}

TEST(LineClassifierTest, ParseTitleLink) {
    string title, link;
    ASSERT_TRUE(parseTitleLink("[Cat Facts](https://example.com/cats)", title, link));
    EXPECT_EQ(title, "Cat Facts");
    EXPECT_EQ(link, "https://example.com/cats");

    EXPECT_FALSE(parseTitleLink("Cat Facts", title, link));
    EXPECT_FALSE(parseTitleLink("[Cat Facts](ftp://example.com)", title, link));
    EXPECT_FALSE(parseTitleLink(" [Cat Facts](https://example.com)", title, link));
}
