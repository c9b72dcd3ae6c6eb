#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "config.h"
#include "link_prober.h"

// --- Namespaces ---
using namespace std;
using json = nlohmann::json;

// --- Structs ---
struct RunConfig {
    ProbeSettings probe;
    bool verbose = false;
};

// --- Function Definitions ---

// Overrides defaults with the keys present in j. Unknown keys are ignored;
// a key of the wrong type is an error.
inline bool applyConfigJson(const json& j, RunConfig& config) {
    if (!j.is_object()) {
        cerr << "[config] top-level value must be an object\n";
        return false;
    }
    try {
        if (j.contains("timeout_seconds")) {
            long timeout = j.at("timeout_seconds").get<long>();
            if (timeout <= 0) {
                cerr << "[config] timeout_seconds must be positive\n";
                return false;
            }
            config.probe.timeoutSeconds = timeout;
        }
        if (j.contains("max_redirects")) {
            long redirects = j.at("max_redirects").get<long>();
            if (redirects < 0) {
                cerr << "[config] max_redirects must not be negative\n";
                return false;
            }
            config.probe.maxRedirects = redirects;
        }
        if (j.contains("user_agents")) {
            vector<string> agents = j.at("user_agents").get<vector<string>>();
            if (agents.empty()) {
                cerr << "[config] user_agents must not be empty\n";
                return false;
            }
            config.probe.userAgents = agents;
        }
        if (j.contains("verbose")) {
            config.verbose = j.at("verbose").get<bool>();
        }
    }
    catch (const std::exception& e) {
        cerr << "[config] " << e.what() << "\n";
        return false;
    }
    config.probe.verbose = config.verbose;
    return true;
}

inline bool parseConfigString(const string& text, RunConfig& config) {
    json j;
    try {
        j = json::parse(text);
    }
    catch (const std::exception& e) {
        cerr << "[config] Failed to parse JSON: " << e.what() << "\n";
        return false;
    }
    return applyConfigJson(j, config);
}

inline bool loadConfigFile(const string& path, RunConfig& config) {
    ifstream in(path);
    if (!in) {
        cerr << "[config] cannot open " << path << "\n";
        return false;
    }
    stringstream ss;
    ss << in.rdbuf();
    return parseConfigString(ss.str(), config);
}
