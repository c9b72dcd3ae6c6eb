#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <cctype>

#include "config.h"
#include "string_utils.h"
#include "catalog_types.h"
#include "line_classifier.h"

using namespace std;

// --- Function Definitions ---

inline vector<Diagnostic> checkTitle(size_t lineNum, const string& rawTitle) {
    vector<Diagnostic> diagnostics;
    string title, link;
    // url should be wrapped in "[TITLE](LINK)" Markdown syntax
    if (!parseTitleLink(rawTitle, title, link)) {
        diagnostics.push_back(makeDiagnostic(lineNum, "Title syntax should be \"[TITLE](LINK)\""));
    }
    else if (endsWith(toUpperStr(title), " API")) {
        diagnostics.push_back(makeDiagnostic(lineNum, "Title should not end with \"... API\". Every entry is an API here!"));
    }
    return diagnostics;
}

inline vector<Diagnostic> checkDescription(size_t lineNum, const string& description) {
    vector<Diagnostic> diagnostics;
    if (!description.empty()) {
        if (!firstCharIsUppercase(description)) {
            diagnostics.push_back(makeDiagnostic(lineNum, "first character of description is not capitalized"));
        }
        char last = description.back();
        if (DESCRIPTION_PUNCTUATION.find(last) != string::npos) {
            diagnostics.push_back(makeDiagnostic(lineNum, string("description should not end with ") + last));
        }
    }
    size_t length = utf8Length(description);
    if (length > MAX_DESCRIPTION_LENGTH) {
        diagnostics.push_back(makeDiagnostic(lineNum,
            "description should not exceed " + to_string(MAX_DESCRIPTION_LENGTH) +
            " characters (currently " + to_string(length) + ")"));
    }
    return diagnostics;
}

// Enclosure and option validity are reported independently.
inline vector<Diagnostic> checkAuth(size_t lineNum, const string& auth) {
    vector<Diagnostic> diagnostics;
    const char backtick = '`';
    bool enclosed = !auth.empty() && auth.front() == backtick && auth.back() == backtick;
    if (auth != "No" && !enclosed) {
        diagnostics.push_back(makeDiagnostic(lineNum, "auth value is not enclosed with `backticks`"));
    }
    if (!containsString(AUTH_KEYS, removeChar(auth, backtick))) {
        diagnostics.push_back(makeDiagnostic(lineNum, auth + " is not a valid Auth option"));
    }
    return diagnostics;
}

inline vector<Diagnostic> checkHttps(size_t lineNum, const string& https) {
    vector<Diagnostic> diagnostics;
    if (!containsString(HTTPS_KEYS, https)) {
        diagnostics.push_back(makeDiagnostic(lineNum, https + " is not a valid HTTPS option"));
    }
    return diagnostics;
}

inline vector<Diagnostic> checkCors(size_t lineNum, const string& cors) {
    vector<Diagnostic> diagnostics;
    if (!containsString(CORS_KEYS, cors)) {
        diagnostics.push_back(makeDiagnostic(lineNum, cors + " is not a valid CORS option"));
    }
    return diagnostics;
}

// segments are trimmed cells; only the first NUM_SEGMENTS are inspected.
inline vector<Diagnostic> checkEntry(size_t lineNum, const vector<string>& segments) {
    vector<Diagnostic> diagnostics;
    if (segments.size() < NUM_SEGMENTS) return diagnostics;
    appendDiagnostics(diagnostics, checkTitle(lineNum, segments[INDEX_TITLE]));
    appendDiagnostics(diagnostics, checkDescription(lineNum, segments[INDEX_DESC]));
    appendDiagnostics(diagnostics, checkAuth(lineNum, segments[INDEX_AUTH]));
    appendDiagnostics(diagnostics, checkHttps(lineNum, segments[INDEX_HTTPS]));
    appendDiagnostics(diagnostics, checkCors(lineNum, segments[INDEX_CORS]));
    return diagnostics;
}

// Entry view of a data row, used by the exporter. Returns false for rows that
// lack columns or whose title is not a link.
inline bool parseEntry(size_t lineNum, const string& line, const string& category, Entry& entry) {
    vector<string> cells = splitTableCells(line, TABLE_DELIMITER);
    if (cells.size() < NUM_SEGMENTS) return false;
    vector<string> fields;
    for (const auto& c : cells) fields.push_back(trimWhitespace(c));

    string title, link;
    if (!parseTitleLink(fields[INDEX_TITLE], title, link)) return false;

    entry.title = title;
    entry.link = link;
    entry.description = fields[INDEX_DESC];
    entry.auth = fields[INDEX_AUTH];
    entry.https = fields[INDEX_HTTPS];
    entry.cors = fields[INDEX_CORS];
    entry.category = category;
    entry.line = lineNum;
    entry.fields = fields;
    return true;
}
