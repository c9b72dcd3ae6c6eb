#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <map>
#include <algorithm>

#include "config.h"
#include "string_utils.h"
#include "catalog_types.h"
#include "line_classifier.h"

using namespace std;

// --- Function Definitions ---

// Categories in order of their first header. A repeated header starts the
// category over at the new line.
inline vector<Category> extractCategories(const vector<string>& lines) {
    vector<Category> categories;
    map<string, size_t> position;
    bool inCategory = false;
    size_t current = 0;

    for (size_t lineNum = 0; lineNum < lines.size(); ++lineNum) {
        const string& line = lines[lineNum];
        LineKind kind = classifyLine(line);

        if (kind == LineKind::CategoryHeader) {
            string name = categoryNameFromHeader(line);
            auto it = position.find(name);
            if (it == position.end()) {
                current = categories.size();
                position[name] = current;
                categories.push_back(Category{ name, lineNum, {} });
            }
            else {
                current = it->second;
                categories[current].headerLine = lineNum;
                categories[current].titles.clear();
            }
            inCategory = true;
            continue;
        }
        if (kind != LineKind::TableRow) continue;
        if (!inCategory) continue;

        vector<string> cells = splitTableCells(line, TABLE_DELIMITER);
        if (cells.empty()) continue;
        string title, link;
        if (parseTitleLink(trimWhitespace(cells[0]), title, link)) {
            categories[current].titles.push_back(toUpperStr(title));
        }
    }
    return categories;
}

inline bool isAlphabetical(const vector<string>& titles) {
    return is_sorted(titles.begin(), titles.end());
}

inline vector<Diagnostic> checkAlphabeticalOrder(const vector<Category>& categories) {
    vector<Diagnostic> diagnostics;
    for (const auto& category : categories) {
        if (!isAlphabetical(category.titles)) {
            diagnostics.push_back(makeDiagnostic(category.headerLine,
                category.name + " category is not alphabetical order"));
        }
    }
    return diagnostics;
}

inline vector<Diagnostic> checkAlphabeticalOrder(const vector<string>& lines) {
    return checkAlphabeticalOrder(extractCategories(lines));
}
