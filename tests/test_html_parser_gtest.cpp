#include <gtest/gtest.h>
#include "../CatalogLint/html_parser.h"

TEST(HtmlParserTest, ExtractsTitle) {
    string html = "<!DOCTYPE html><html><head><title>404 Not Found</title></head><body><h1>Gone</h1></body></html>";
    EXPECT_EQ(extractPageTitle(html), "404 Not Found");
}

TEST(HtmlParserTest, CollapsesWhitespaceInTitle) {
    string html = "<html><head><title>\n   Please Wait...\n   | Cloudflare  </title></head></html>";
    EXPECT_EQ(extractPageTitle(html), "Please Wait... | Cloudflare");
}

TEST(HtmlParserTest, NoTitle) {
    EXPECT_EQ(extractPageTitle("<html><body><p>plain</p></body></html>"), "");
    EXPECT_EQ(extractPageTitle(""), "");
    EXPECT_EQ(extractPageTitle("{\"error\": \"not found\"}"), "");
}

TEST(HtmlParserTest, LongTitleCutOnCharacterBoundary) {
    string fits = string(199, 'a') + "\xC3\xA9";
    EXPECT_EQ(extractPageTitle("<title>" + fits + "</title>"), fits);

    string over = string(200, 'a') + "\xC3\xA9";
    EXPECT_EQ(extractPageTitle("<title>" + over + "</title>"), string(200, 'a'));
}

TEST(HtmlParserTest, CollapseWhitespace) {
    EXPECT_EQ(collapseWhitespace("  a \t b\n\nc  "), "a b c");
    EXPECT_EQ(collapseWhitespace(""), "");
}
