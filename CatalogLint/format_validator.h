#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <set>

#include "config.h"
#include "string_utils.h"
#include "catalog_types.h"
#include "line_classifier.h"
#include "category_extractor.h"
#include "entry_validator.h"

using namespace std;

// --- Structs ---

// State carried across lines by the structural pass.
struct FormatScanState {
    string category;
    size_t categoryLine = 0;
    int entriesInCategory = MIN_ENTRIES_PER_CATEGORY + 1; // no check before the first header
    set<string> indexedCategories;
    vector<Diagnostic> diagnostics;
};

// --- Function Definitions ---

inline void scanCategoryHeader(FormatScanState& state, size_t lineNum, const string& line) {
    if (state.entriesInCategory < MIN_ENTRIES_PER_CATEGORY) {
        state.diagnostics.push_back(makeDiagnostic(state.categoryLine,
            state.category + " category does not have the minimum " + to_string(MIN_ENTRIES_PER_CATEGORY) +
            " entries (only has " + to_string(state.entriesInCategory) + ")"));
    }

    string name;
    if (parseCategoryHeader(line, name)) {
        // Only bullets above this header count; an Index placed after the catalog
        // body does not satisfy it.
        if (state.indexedCategories.find(name) == state.indexedCategories.end()) {
            state.diagnostics.push_back(makeDiagnostic(lineNum,
                "category header (" + name + ") not added to Index section"));
        }
    }
    else {
        state.diagnostics.push_back(makeDiagnostic(lineNum, "category header is not formatted correctly"));
    }

    state.category = categoryNameFromHeader(line);
    state.categoryLine = lineNum;
    state.entriesInCategory = 0;
}

inline void scanTableRow(FormatScanState& state, size_t lineNum, const string& line) {
    state.entriesInCategory += 1;

    vector<string> segments = splitTableCells(line, TABLE_DELIMITER);
    if (segments.size() < NUM_SEGMENTS) {
        state.diagnostics.push_back(makeDiagnostic(lineNum,
            "entry does not have all the required columns (have " + to_string(segments.size()) +
            ", need " + to_string(NUM_SEGMENTS) + ")"));
        return;
    }

    // every line segment should start and end with exactly 1 space
    for (const auto& segment : segments) {
        if (countLeadingWhitespace(segment) != 1 || countTrailingWhitespace(segment) != 1) {
            state.diagnostics.push_back(makeDiagnostic(lineNum, "each segment must start and end with exactly 1 space"));
        }
    }

    vector<string> trimmed;
    trimmed.reserve(segments.size());
    for (const auto& segment : segments) trimmed.push_back(trimWhitespace(segment));
    appendDiagnostics(state.diagnostics, checkEntry(lineNum, trimmed));
}

inline void scanLine(FormatScanState& state, size_t lineNum, const string& line) {
    switch (classifyLine(line)) {
    case LineKind::IndexBullet: {
        string name;
        if (parseIndexBullet(line, name)) state.indexedCategories.insert(name);
        break;
    }
    case LineKind::CategoryHeader:
        scanCategoryHeader(state, lineNum, line);
        break;
    case LineKind::TableRow:
        scanTableRow(state, lineNum, line);
        break;
    case LineKind::SeparatorRow:
    case LineKind::Other:
        break;
    }
}

// Ordered diagnostics for the whole document: alphabetical order findings
// first, then the line-by-line findings. The last category's entry count is
// never checked since no header follows it.
inline vector<Diagnostic> checkFileFormat(const vector<string>& lines) {
    FormatScanState state;
    appendDiagnostics(state.diagnostics, checkAlphabeticalOrder(lines));
    for (size_t lineNum = 0; lineNum < lines.size(); ++lineNum) {
        scanLine(state, lineNum, lines[lineNum]);
    }
    return state.diagnostics;
}

inline vector<string> checkFileFormatMessages(const vector<string>& lines) {
    return formatDiagnostics(checkFileFormat(lines));
}
