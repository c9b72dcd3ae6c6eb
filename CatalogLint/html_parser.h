#pragma once
// --- Includes ---
#include <string>
#include <cstddef>
#include <cctype>

// Lexbor headers
#include <lexbor/html/parser.h>
#include <lexbor/html/interfaces/document.h>

#include "string_utils.h"

using namespace std;

// --- Constant Definitions ---
static const size_t MAX_TITLE_CHARS = 200;

// --- Function Definitions ---

inline string collapseWhitespace(const string& text) {
    string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (isspace((unsigned char)c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
    }
    return out;
}

// <title> of an HTML page, whitespace collapsed; empty when there is none or
// the body is not HTML.
inline string extractPageTitle(const string& html) {
    if (html.empty()) return "";
    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) return "";
    lxb_status_t status = lxb_html_document_parse(document,
        (const lxb_char_t*)html.c_str(),
        html.size());
    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        return "";
    }
    size_t len = 0;
    const lxb_char_t* data = lxb_html_document_title(document, &len);
    string title;
    if (data && len > 0) {
        title = collapseWhitespace(string(reinterpret_cast<const char*>(data), len));
    }
    lxb_html_document_destroy(document);
    return utf8Truncate(title, MAX_TITLE_CHARS);
}
