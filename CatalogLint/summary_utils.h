#pragma once

// --- Includes ---
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "catalog_types.h"
#include "link_extractor.h"
#include "link_prober.h"
#include "catalog_export.h"

// --- Namespaces ---
using namespace std;
using ordered_json = nlohmann::ordered_json;

// --- Function Definitions ---

inline void printDiagnostics(const vector<Diagnostic>& diagnostics) {
    for (const auto& d : diagnostics) {
        std::cout << formatDiagnostic(d) << "\n";
    }
}

inline void printDuplicateReport(const DuplicateLinkReport& report) {
    if (report.hasDuplicate) {
        std::cout << "Found duplicate links:\n";
        for (const auto& link : report.duplicates) {
            std::cout << link << "\n";
        }
    }
    else {
        std::cout << "No duplicate links.\n";
    }
}

inline void printProbeFailures(const vector<LinkProbeResult>& failures) {
    if (failures.empty()) return;
    std::cout << "Apparently " << failures.size() << " links are not working properly. See in:\n";
    for (const auto& f : failures) {
        std::cout << formatProbeError(f) << "\n";
    }
}

inline ordered_json probeResultToJson(const LinkProbeResult& result) {
    ordered_json j;
    j["url"] = result.url;
    j["kind"] = probeErrorKindName(result.kind);
    j["message"] = formatProbeError(result);
    if (!result.detail.empty()) j["detail"] = result.detail;
    if (result.status > 0) j["status"] = result.status;
    if (!result.pageTitle.empty()) j["page_title"] = result.pageTitle;
    return j;
}

inline ordered_json linkReportToJson(size_t linkCount, const DuplicateLinkReport& duplicates, const vector<LinkProbeResult>& failures) {
    ordered_json j;
    j["links_checked"] = linkCount;
    j["duplicates"] = duplicates.duplicates;
    j["failures"] = ordered_json::array();
    for (const auto& f : failures) j["failures"].push_back(probeResultToJson(f));
    return j;
}
