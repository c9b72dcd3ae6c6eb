#pragma once

// --- Includes ---
#include <string>
#include <re2/re2.h>

#include "config.h"
#include "string_utils.h"

using namespace std;

enum class LineKind {
    CategoryHeader,
    SeparatorRow,
    TableRow,
    IndexBullet,
    Other
};

// --- Function Definitions ---

inline const RE2& categoryHeaderPattern() {
    static const RE2 re("^" + RE2::QuoteMeta(CATEGORY_ANCHOR) + "\\s(.+)");
    return re;
}

inline const RE2& indexBulletPattern() {
    static const RE2 re("^\\*\\s\\[(.*)\\]");
    return re;
}

// [TITLE](http...), matched from the start of the cell.
inline const RE2& titleLinkPattern() {
    static const RE2 re("^\\[(.+)\\]\\((http.*)\\)");
    return re;
}

inline LineKind classifyLine(const string& line) {
    if (startsWith(line, CATEGORY_ANCHOR)) return LineKind::CategoryHeader;
    if (startsWith(line, SEPARATOR_ROW_PREFIX)) return LineKind::SeparatorRow;
    if (!line.empty() && line[0] == TABLE_DELIMITER) return LineKind::TableRow;
    if (RE2::PartialMatch(line, indexBulletPattern())) return LineKind::IndexBullet;
    return LineKind::Other;
}

inline const char* lineKindName(LineKind kind) {
    switch (kind) {
    case LineKind::CategoryHeader: return "CategoryHeader";
    case LineKind::SeparatorRow: return "SeparatorRow";
    case LineKind::TableRow: return "TableRow";
    case LineKind::IndexBullet: return "IndexBullet";
    default: return "Other";
    }
}

// Name after the anchor, trimmed. Used for grouping, so it does not require the
// "### " form the structural check enforces.
inline string categoryNameFromHeader(const string& line) {
    if (!startsWith(line, CATEGORY_ANCHOR)) return string();
    return trimWhitespace(line.substr(CATEGORY_ANCHOR.size()));
}

inline bool parseCategoryHeader(const string& line, string& name) {
    return RE2::PartialMatch(line, categoryHeaderPattern(), &name);
}

inline bool parseIndexBullet(const string& line, string& name) {
    return RE2::PartialMatch(line, indexBulletPattern(), &name);
}

inline bool parseTitleLink(const string& rawTitle, string& title, string& link) {
    return RE2::PartialMatch(rawTitle, titleLinkPattern(), &title, &link);
}
