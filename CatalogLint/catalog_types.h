#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <cstdio>

using namespace std;

// --- Structs ---

// line is the 0-based index into the document; messages print it 1-based.
struct Diagnostic {
    size_t line;
    string message;
};

struct Category {
    string name;
    size_t headerLine;
    vector<string> titles; // uppercased, document order
};

struct Entry {
    string title;
    string link;
    string description;
    string auth;
    string https;
    string cors;
    string category;
    size_t line;
    vector<string> fields;
};

// --- Function Definitions ---

inline Diagnostic makeDiagnostic(size_t line, const string& message) {
    return Diagnostic{ line, message };
}

inline string formatDiagnostic(const Diagnostic& d) {
    char prefix[32];
    snprintf(prefix, sizeof(prefix), "(L%03zu) ", d.line + 1);
    return string(prefix) + d.message;
}

inline vector<string> formatDiagnostics(const vector<Diagnostic>& diagnostics) {
    vector<string> out;
    out.reserve(diagnostics.size());
    for (const auto& d : diagnostics) out.push_back(formatDiagnostic(d));
    return out;
}

inline void appendDiagnostics(vector<Diagnostic>& into, const vector<Diagnostic>& more) {
    into.insert(into.end(), more.begin(), more.end());
}
