#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <map>
#include <iostream>
#include <re2/re2.h>

#include "config.h"
#include "string_utils.h"

using namespace std;

// --- Structs ---
struct DuplicateLinkReport {
    bool hasDuplicate = false;
    vector<string> duplicates;
};

// --- Function Definitions ---

// Accepts scheme, "www." and bare "domain.tld/" forms, allows one level of
// nested balanced parentheses in the target and refuses trailing punctuation.
inline const RE2& linkPattern() {
    static const RE2 re(R"re(((?:https?://|www\d{0,3}[.]|[a-z0-9.\-]+[.][a-z]{2,4}/)(?:[^\s()<>]+|\((?:[^\s()<>]+|(?:\([^\s()<>]+\)))*\))+(?:\((?:[^\s()<>]+|(?:\([^\s()<>]+\)))*\)|[^\s`!()\[\]{};:'".,<>?«»“”‘’])))re");
    return re;
}

inline vector<string> findLinksInText(const string& text) {
    vector<string> links;
    const RE2& re = linkPattern();
    if (!re.ok()) {
        cerr << "[findLinksInText] invalid link pattern: " << re.error() << "\n";
        return links;
    }
    re2::StringPiece input(text);
    string link;
    while (RE2::FindAndConsume(&input, re, &link)) {
        links.push_back(link);
    }
    return links;
}

// Links from the Index section onwards, or the whole document when there is no Index.
inline vector<string> findLinksInDocument(const string& document) {
    size_t indexSection = document.find(INDEX_SECTION_MARKER);
    if (indexSection == string::npos) indexSection = 0;
    return findLinksInText(document.substr(indexSection));
}

inline string normalizeLink(const string& link) {
    if (endsWith(link, "/")) return link.substr(0, link.size() - 1);
    return link;
}

// Each repeated link is reported once, at its second occurrence.
inline DuplicateLinkReport checkDuplicateLinks(const vector<string>& links) {
    DuplicateLinkReport report;
    map<string, int> seen;
    for (const auto& raw : links) {
        string link = normalizeLink(raw);
        int count = ++seen[link];
        if (count == 2) report.duplicates.push_back(link);
    }
    report.hasDuplicate = !report.duplicates.empty();
    return report;
}
