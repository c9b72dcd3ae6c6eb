#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <curl/curl.h>

// Project headers
#include "config.h"
#include "string_utils.h"
#include "config_loader.h"
#include "format_validator.h"
#include "link_extractor.h"
#include "link_prober.h"
#include "http_utils.h"
#include "catalog_export.h"
#include "summary_utils.h"

using namespace std;

struct CliOptions {
    string command;
    string filename;
    string configPath;
    string reportPath;
    string outDir = ".";
    bool onlyDuplicateLinksChecker = false;
    bool verbose = false;
};

static void printUsage(const char* prog) {
    cerr << "Usage: " << prog << " <format|links|export> <file.md> [--config <file.json>] [--verbose]\n"
         << "       links:  [-odlc | --only_duplicate_links_checker] [--report <file.json>]\n"
         << "       export: [--out <dir>]\n";
}

static bool parseArgs(int argc, char** argv, CliOptions& opts) {
    if (argc < 2) {
        printUsage(argv[0]);
        return false;
    }
    opts.command = argv[1];
    if (opts.command != "format" && opts.command != "links" && opts.command != "export") {
        cerr << "[ERROR] Unknown command: " << opts.command << "\n";
        printUsage(argv[0]);
        return false;
    }
    if (argc < 3) {
        cout << "No .md file passed\n";
        return false;
    }
    opts.filename = argv[2];

    for (int i = 3; i < argc; ++i) {
        string arg = argv[i];
        string lower = toLowerStr(arg);
        auto needValue = [&](string& into) {
            if (i + 1 >= argc) {
                cerr << "[ERROR] " << arg << " requires a value\n";
                return false;
            }
            into = argv[++i];
            return true;
        };
        if (opts.command == "links" && (lower == "-odlc" || lower == "--only_duplicate_links_checker")) {
            opts.onlyDuplicateLinksChecker = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        }
        else if (arg == "--config") {
            if (!needValue(opts.configPath)) return false;
        }
        else if (opts.command == "links" && arg == "--report") {
            if (!needValue(opts.reportPath)) return false;
        }
        else if (opts.command == "export" && arg == "--out") {
            if (!needValue(opts.outDir)) return false;
        }
        else {
            cerr << "[ERROR] Invalid argument: " << arg << "\n";
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

static bool readDocument(const string& filename, string& content) {
    ifstream in(filename, ios::binary);
    if (!in) {
        cerr << "[ERROR] Cannot open " << filename << "\n";
        return false;
    }
    stringstream ss;
    ss << in.rdbuf();
    content = ss.str();
    return true;
}

static int runFormat(const string& content) {
    vector<Diagnostic> diagnostics = checkFileFormat(splitDocumentLines(content));
    if (!diagnostics.empty()) {
        printDiagnostics(diagnostics);
        return 1;
    }
    return 0;
}

static int runLinks(const string& content, const CliOptions& opts, const RunConfig& config) {
    vector<string> links = findLinksInDocument(content);
    if (config.verbose) cerr << "[INFO] Extracted " << links.size() << " links\n";

    cout << "Checking for duplicate links...\n";
    DuplicateLinkReport duplicates = checkDuplicateLinks(links);
    printDuplicateReport(duplicates);

    vector<LinkProbeResult> failures;
    int status = duplicates.hasDuplicate ? 1 : 0;

    if (!duplicates.hasDuplicate && !opts.onlyDuplicateLinksChecker) {
        cout << "Checking if " << links.size() << " links are working...\n";
        cout.flush();

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            cerr << "[ERROR] curl_global_init failed\n";
            return 1;
        }
        failures = checkIfListOfLinksAreWorking(links, makeCurlTransport(config.probe), config.probe);
        curl_global_cleanup();

        printProbeFailures(failures);
        if (!failures.empty()) status = 1;
    }

    if (!opts.reportPath.empty()) {
        if (!writeJsonFile(opts.reportPath, linkReportToJson(links.size(), duplicates, failures))) status = 1;
    }
    return status;
}

static int runExport(const string& content, const CliOptions& opts) {
    vector<string> lines = splitDocumentLines(content);
    if (!exportCatalog(lines, opts.outDir)) {
        cerr << "[ERROR] Error creating DB files in " << opts.outDir << "\n";
        return 1;
    }
    cout << "[OK] Wrote " << RESOURCES_FILE_NAME << " and " << CATEGORIES_FILE_NAME << " to " << opts.outDir << "\n";
    return 0;
}

int main(int argc, char** argv) {
    ios::sync_with_stdio(false);

    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) return 1;

    RunConfig config;
    if (!opts.configPath.empty() && !loadConfigFile(opts.configPath, config)) {
        cerr << "[ERROR] Invalid config file: " << opts.configPath << "\n";
        return 1;
    }
    if (opts.verbose) {
        config.verbose = true;
        config.probe.verbose = true;
    }

    string content;
    if (!readDocument(opts.filename, content)) return 1;

    if (opts.command == "format") return runFormat(content);
    if (opts.command == "links") return runLinks(content, opts, config);
    return runExport(content, opts);
}
