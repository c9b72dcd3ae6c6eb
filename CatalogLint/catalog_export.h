#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <cctype>
#include <nlohmann/json.hpp>

#include "config.h"
#include "string_utils.h"
#include "catalog_types.h"
#include "line_classifier.h"
#include "entry_validator.h"

// --- Namespaces ---
using namespace std;
using ordered_json = nlohmann::ordered_json;

// --- Function Definitions ---

// "Anime & Manga" -> "anime-and-manga"; runs outside [a-z0-9/] become one '-'.
inline string categorySlug(const string& name) {
    string lowered = toLowerStr(trimWhitespace(name));
    string replaced;
    for (char c : lowered) {
        if (c == '&') replaced += "and";
        else replaced.push_back(c);
    }
    string slug;
    bool inRun = false;
    for (char c : replaced) {
        unsigned char u = (unsigned char)c;
        bool keep = (u < 0x80 && isalnum(u)) || c == '/';
        if (keep) {
            slug.push_back(c);
            inRun = false;
        }
        else if (!inRun) {
            slug.push_back('-');
            inRun = true;
        }
    }
    return slug;
}

inline vector<string> indexCategoryNames(const vector<string>& lines) {
    vector<string> names;
    for (const auto& line : lines) {
        string name;
        if (classifyLine(line) == LineKind::IndexBullet && parseIndexBullet(line, name)) {
            names.push_back(name);
        }
    }
    return names;
}

// Entries of every table under a "### " header below the Index list, or in
// the whole document when it has no Index list. Rows without a linked title
// (table headings included) are skipped. Deeper headings close the category.
inline vector<Entry> collectEntries(const vector<string>& lines) {
    vector<Entry> entries;
    bool hasIndex = false;
    for (const auto& line : lines) {
        if (classifyLine(line) == LineKind::IndexBullet) {
            hasIndex = true;
            break;
        }
    }
    bool pastIndex = !hasIndex;
    string category;
    bool inCategory = false;
    for (size_t lineNum = 0; lineNum < lines.size(); ++lineNum) {
        const string& line = lines[lineNum];
        LineKind kind = classifyLine(line);
        if (kind == LineKind::IndexBullet) {
            pastIndex = true;
            continue;
        }
        if (!pastIndex) continue;
        if (kind == LineKind::CategoryHeader) {
            inCategory = parseCategoryHeader(line, category);
            if (inCategory) category = trimWhitespace(category);
            continue;
        }
        if (kind != LineKind::TableRow || !inCategory) continue;
        Entry entry;
        if (parseEntry(lineNum, line, category, entry)) entries.push_back(entry);
    }
    return entries;
}

inline ordered_json entryToJson(const Entry& entry) {
    ordered_json j;
    j["API"] = entry.title;
    j["Description"] = entry.description;
    j["Auth"] = toLowerStr(entry.auth) == "no" ? string() : removeChar(entry.auth, '`');
    j["HTTPS"] = toLowerStr(entry.https) == "yes";
    j["Cors"] = toLowerStr(entry.cors);
    j["Link"] = entry.link;
    j["Category"] = entry.category;
    return j;
}

inline ordered_json buildResourcesJson(const vector<string>& lines) {
    ordered_json entries = ordered_json::array();
    for (const auto& entry : collectEntries(lines)) entries.push_back(entryToJson(entry));
    ordered_json doc;
    doc["count"] = entries.size();
    doc["entries"] = entries;
    return doc;
}

inline ordered_json buildCategoriesJson(const vector<string>& lines) {
    ordered_json entries = ordered_json::array();
    for (const auto& name : indexCategoryNames(lines)) {
        ordered_json c;
        c["name"] = name;
        c["slug"] = categorySlug(name);
        entries.push_back(c);
    }
    ordered_json doc;
    doc["count"] = entries.size();
    doc["entries"] = entries;
    return doc;
}

inline bool writeJsonFile(const string& path, const ordered_json& doc) {
    ofstream out(path);
    if (!out) {
        cerr << "[writeJsonFile] cannot open " << path << " for writing\n";
        return false;
    }
    // Invalid UTF-8 in titles or README text becomes U+FFFD instead of throwing.
    out << doc.dump(EXPORT_JSON_INDENT, ' ', false, ordered_json::error_handler_t::replace) << "\n";
    if (!out) {
        cerr << "[writeJsonFile] write failed for " << path << "\n";
        return false;
    }
    return true;
}

inline bool exportCatalog(const vector<string>& lines, const string& outDir) {
    string base = outDir.empty() ? string(".") : outDir;
    if (base.back() != '/') base.push_back('/');
    bool ok = writeJsonFile(base + RESOURCES_FILE_NAME, buildResourcesJson(lines));
    ok = writeJsonFile(base + CATEGORIES_FILE_NAME, buildCategoriesJson(lines)) && ok;
    return ok;
}
