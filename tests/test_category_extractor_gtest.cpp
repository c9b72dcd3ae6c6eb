#include <gtest/gtest.h>
#include "../CatalogLint/category_extractor.h"

static vector<string> sortedAnimals() {
    return {
        "### Animals",
        "API | Description | Auth | HTTPS | CORS",
        "|---|---|---|---|---|",
        "| [axolotl](https://a.example) | Axolotl facts | No | Yes | Yes |",
        "| [Cat Facts](https://c.example) | Daily cat facts | No | Yes | No |",
        "| [Dogs](https://d.example) | Dog pictures | No | Yes | Yes |",
    };
}

TEST(CategoryExtractorTest, GroupsUppercasedTitlesPerCategory) {
    vector<string> lines = sortedAnimals();
    lines.push_back("");
    lines.push_back("### Books");
    lines.push_back("| [Gutendex](https://g.example) | Book metadata | No | Yes | No |");

    vector<Category> categories = extractCategories(lines);
    ASSERT_EQ(categories.size(), 2u);

    EXPECT_EQ(categories[0].name, "Animals");
    EXPECT_EQ(categories[0].headerLine, 0u);
    ASSERT_EQ(categories[0].titles.size(), 3u);
    EXPECT_EQ(categories[0].titles[0], "AXOLOTL");
    EXPECT_EQ(categories[0].titles[1], "CAT FACTS");
    EXPECT_EQ(categories[0].titles[2], "DOGS");

    EXPECT_EQ(categories[1].name, "Books");
    EXPECT_EQ(categories[1].headerLine, 7u);
    ASSERT_EQ(categories[1].titles.size(), 1u);
    EXPECT_EQ(categories[1].titles[0], "GUTENDEX");
}

TEST(CategoryExtractorTest, RowsBeforeAnyHeaderAreIgnored) {
    vector<string> lines = {
        "| [Orphan](https://o.example) | No home | No | Yes | Yes |",
        "### Animals",
        "| [Cat](https://c.example) | Cats | No | Yes | Yes |",
    };
    vector<Category> categories = extractCategories(lines);
    ASSERT_EQ(categories.size(), 1u);
    ASSERT_EQ(categories[0].titles.size(), 1u);
    EXPECT_EQ(categories[0].titles[0], "CAT");
}

TEST(CategoryExtractorTest, RowsWithoutLinkedTitleAreNotCollected) {
    vector<string> lines = {
        "### Animals",
        "| API | Description | Auth | HTTPS | CORS |",
        "| [Cat](https://c.example) | Cats | No | Yes | Yes |",
    };
    vector<Category> categories = extractCategories(lines);
    ASSERT_EQ(categories.size(), 1u);
    ASSERT_EQ(categories[0].titles.size(), 1u);
}

TEST(AlphabeticalOrderTest, SortedCategoryHasNoDiagnostics) {
    EXPECT_TRUE(checkAlphabeticalOrder(sortedAnimals()).empty());
}

TEST(AlphabeticalOrderTest, ComparisonIgnoresCase) {
    vector<string> lines = {
        "### Animals",
        "| [alpha](https://a.example) | A | No | Yes | Yes |",
        "| [Beta](https://b.example) | B | No | Yes | Yes |",
        "| [gamma](https://g.example) | G | No | Yes | Yes |",
    };
    EXPECT_TRUE(checkAlphabeticalOrder(lines).empty());
}

TEST(AlphabeticalOrderTest, NonAsciiTitlesAreFoldedBeforeComparison) {
    vector<string> lines = {
        "### Food",
        "| [\xC3\xA9lan](https://e.example) | E | No | Yes | Yes |",
        "| [\xC3\x89z](https://z.example) | Z | No | Yes | Yes |",
    };
    EXPECT_TRUE(checkAlphabeticalOrder(lines).empty());

    std::swap(lines[1], lines[2]);
    EXPECT_EQ(checkAlphabeticalOrder(lines).size(), 1u);
}

TEST(AlphabeticalOrderTest, SwapYieldsOneDiagnosticAtHeader) {
    vector<string> lines = sortedAnimals();
    std::swap(lines[3], lines[5]);

    vector<Diagnostic> diagnostics = checkAlphabeticalOrder(lines);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].line, 0u);
    EXPECT_EQ(formatDiagnostic(diagnostics[0]), "(L001) Animals category is not alphabetical order");
}

TEST(AlphabeticalOrderTest, OneDiagnosticPerCategoryRegardlessOfMisplacedCount) {
    vector<string> lines = {
        "### Animals",
        "| [D](https://d.example) | D | No | Yes | Yes |",
        "| [C](https://c.example) | C | No | Yes | Yes |",
        "| [B](https://b.example) | B | No | Yes | Yes |",
        "| [A](https://a.example) | A | No | Yes | Yes |",
        "### Books",
        "| [Z](https://z.example) | Z | No | Yes | Yes |",
        "| [Y](https://y.example) | Y | No | Yes | Yes |",
    };
    vector<Diagnostic> diagnostics = checkAlphabeticalOrder(lines);
    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].line, 0u);
    EXPECT_EQ(diagnostics[1].line, 5u);
    EXPECT_EQ(diagnostics[1].message, "Books category is not alphabetical order");
}
