#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <cctype>    // For isspace, tolower, toupper
#include <cstddef>
#include <algorithm> // For transform
#include <utf8proc.h>

using namespace std;

// --- Function Definitions ---

inline string toLowerStr(const string& s) {
    string r(s);
    transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return (char)tolower(c); });
    return r;
}

// Bytes taken by the code point at pos. An invalid sequence yields
// codepoint -1 and is consumed one byte at a time.
inline size_t utf8Step(const string& s, size_t pos, utf8proc_int32_t& codepoint) {
    utf8proc_ssize_t n = utf8proc_iterate(
        reinterpret_cast<const utf8proc_uint8_t*>(s.data() + pos),
        static_cast<utf8proc_ssize_t>(s.size() - pos), &codepoint);
    if (n <= 0) {
        codepoint = -1;
        return 1;
    }
    return static_cast<size_t>(n);
}

// Unicode simple uppercase mapping; invalid bytes are copied unchanged.
inline string toUpperStr(const string& s) {
    string r;
    r.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        utf8proc_int32_t cp;
        size_t n = utf8Step(s, pos, cp);
        if (cp < 0) {
            r.append(s, pos, n);
        }
        else {
            utf8proc_uint8_t buf[4];
            utf8proc_ssize_t written = utf8proc_encode_char(utf8proc_toupper(cp), buf);
            r.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(written));
        }
        pos += n;
    }
    return r;
}

inline bool firstCharIsUppercase(const string& s) {
    if (s.empty()) return true;
    utf8proc_int32_t cp;
    utf8Step(s, 0, cp);
    return cp < 0 || utf8proc_toupper(cp) == cp;
}

inline string trimWhitespace(const string& s) {
    size_t i = 0, j = s.size();
    while (i < j && isspace((unsigned char)s[i])) ++i;
    while (j > i && isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

inline string trimTrailingWhitespace(const string& s) {
    size_t j = s.size();
    while (j > 0 && isspace((unsigned char)s[j - 1])) --j;
    return s.substr(0, j);
}

inline size_t countLeadingWhitespace(const string& s) {
    size_t n = 0;
    while (n < s.size() && isspace((unsigned char)s[n])) ++n;
    return n;
}

inline size_t countTrailingWhitespace(const string& s) {
    size_t n = 0;
    while (n < s.size() && isspace((unsigned char)s[s.size() - 1 - n])) ++n;
    return n;
}

inline bool startsWith(const string& s, const string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const string& s, const string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline string removeChar(const string& s, char c) {
    string r;
    r.reserve(s.size());
    for (char ch : s) {
        if (ch != c) r.push_back(ch);
    }
    return r;
}

inline bool containsString(const vector<string>& values, const string& value) {
    return find(values.begin(), values.end(), value) != values.end();
}

// Number of code points; each invalid byte counts as one.
inline size_t utf8Length(const string& s) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < s.size()) {
        utf8proc_int32_t cp;
        pos += utf8Step(s, pos, cp);
        ++count;
    }
    return count;
}

// At most maxChars code points, never splitting a multi-byte sequence.
inline string utf8Truncate(const string& s, size_t maxChars) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size() && count < maxChars) {
        utf8proc_int32_t cp;
        pos += utf8Step(s, pos, cp);
        ++count;
    }
    return s.substr(0, pos);
}

// Split on the delimiter, keeping empty fields: "|a|b|" -> "", "a", "b", "".
inline vector<string> splitOn(const string& s, char delimiter) {
    vector<string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Table cells of a row, untrimmed, without the fields outside the outer delimiters.
inline vector<string> splitTableCells(const string& line, char delimiter) {
    vector<string> parts = splitOn(line, delimiter);
    if (parts.size() < 2) return vector<string>();
    return vector<string>(parts.begin() + 1, parts.end() - 1);
}

inline bool containsAnyKeyword(const string& text, const vector<string>& keywords) {
    if (text.empty() || keywords.empty()) return false;
    for (const string& kw : keywords) {
        if (!kw.empty() && text.find(kw) != string::npos) {
            return true;
        }
    }
    return false;
}

// Lines of a document with trailing whitespace removed; a final newline does
// not produce an extra empty line.
inline vector<string> splitDocumentLines(const string& text) {
    vector<string> lines;
    if (text.empty()) return lines;
    vector<string> parts = splitOn(text, '\n');
    if (parts.back().empty()) parts.pop_back();
    lines.reserve(parts.size());
    for (const auto& p : parts) lines.push_back(trimTrailingWhitespace(p));
    return lines;
}
