#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <functional>
#include <random>
#include <iostream>

#include "config.h"
#include "string_utils.h"
#include "html_parser.h"

using namespace std;

// --- Types ---
enum class ProbeErrorKind {
    None,
    ClientError,
    SSLError,
    ConnectionError,
    Timeout,
    TooManyRedirects,
    Unknown
};

// What the transport saw. transportError is None whenever a response arrived.
struct HttpResponse {
    long status = 0;
    string server;
    string body;
    ProbeErrorKind transportError = ProbeErrorKind::None;
    string errorDetail;
};

struct LinkProbeResult {
    string url;
    ProbeErrorKind kind = ProbeErrorKind::None;
    string detail;
    long status = 0;
    string pageTitle;
};

struct ProbeSettings {
    long timeoutSeconds = PROBE_TIMEOUT_SECONDS;
    long maxRedirects = PROBE_MAX_REDIRECTS;
    size_t maxBodyBytes = MAX_DOWNLOAD_BYTES;
    vector<string> userAgents = PROBE_USER_AGENTS;
    bool verbose = false;
};

// Sends one GET with the given extra request headers ("Name: value").
using HttpGetFn = function<HttpResponse(const string& url, const vector<string>& headers)>;

// --- Function Definitions ---

inline const char* probeErrorKindName(ProbeErrorKind kind) {
    switch (kind) {
    case ProbeErrorKind::None: return "None";
    case ProbeErrorKind::ClientError: return "ClientError";
    case ProbeErrorKind::SSLError: return "SSLError";
    case ProbeErrorKind::ConnectionError: return "ConnectionError";
    case ProbeErrorKind::Timeout: return "Timeout";
    case ProbeErrorKind::TooManyRedirects: return "TooManyRedirects";
    default: return "Unknown";
    }
}

inline string fakeUserAgent(const vector<string>& userAgents) {
    if (userAgents.empty()) return PROBE_USER_AGENTS.front();
    static mt19937 rng(random_device{}());
    uniform_int_distribution<size_t> pick(0, userAgents.size() - 1);
    return userAgents[pick(rng)];
}

// Host part of a link: scheme removed, then cut at the first '/', else '?', else '#'.
inline string getHostFromLink(const string& link) {
    string host = link;
    size_t scheme = host.find("://");
    if (scheme != string::npos) host = host.substr(scheme + 3);

    size_t cut = host.find('/');
    if (cut == string::npos) cut = host.find('?');
    if (cut == string::npos) cut = host.find('#');
    if (cut != string::npos) host = host.substr(0, cut);
    return host;
}

// Anti-bot challenge pages answer 403/503 from a CDN with one of the known
// markers in the body; those links are treated as healthy.
inline bool hasCloudflareProtection(const HttpResponse& resp) {
    bool challengeStatus = false;
    for (int code : BOT_CHALLENGE_STATUS_CODES) {
        if (resp.status == code) challengeStatus = true;
    }
    if (!challengeStatus) return false;
    if (!containsString(KNOWN_CDN_SERVERS, resp.server)) return false;
    return containsAnyKeyword(resp.body, BOT_CHALLENGE_MARKERS);
}

inline LinkProbeResult classifyResponse(const string& link, const HttpResponse& resp) {
    LinkProbeResult result;
    result.url = link;
    result.status = resp.status;

    if (resp.transportError != ProbeErrorKind::None) {
        result.kind = resp.transportError;
        result.detail = resp.errorDetail;
        return result;
    }
    if (resp.status >= 400 && !hasCloudflareProtection(resp)) {
        result.kind = ProbeErrorKind::ClientError;
        result.detail = to_string(resp.status);
        result.pageTitle = extractPageTitle(resp.body);
    }
    return result;
}

inline string formatProbeError(const LinkProbeResult& result) {
    switch (result.kind) {
    case ProbeErrorKind::None: return "";
    case ProbeErrorKind::ClientError: return "ERR:CLT: " + to_string(result.status) + " : " + result.url;
    case ProbeErrorKind::SSLError: return "ERR:SSL: " + result.detail + " : " + result.url;
    case ProbeErrorKind::ConnectionError: return "ERR:CNT: " + result.detail + " : " + result.url;
    case ProbeErrorKind::Timeout: return "ERR:TMO: " + result.url;
    case ProbeErrorKind::TooManyRedirects: return "ERR:TMR: " + result.detail + " : " + result.url;
    default: return "ERR:UKN: " + result.detail + " : " + result.url;
    }
}

inline LinkProbeResult checkIfLinkIsWorking(const string& link, const HttpGetFn& httpGet, const ProbeSettings& settings) {
    vector<string> headers;
    headers.push_back("User-Agent: " + fakeUserAgent(settings.userAgents));
    headers.push_back("Host: " + getHostFromLink(link));

    HttpResponse resp = httpGet(link, headers);
    LinkProbeResult result = classifyResponse(link, resp);
    if (settings.verbose) {
        cerr << "[probe] " << link << " -> " << probeErrorKindName(result.kind);
        if (resp.status > 0) cerr << " (HTTP " << resp.status << ")";
        cerr << "\n";
    }
    return result;
}

// Probes every link in order, one at a time, and keeps only the failures.
inline vector<LinkProbeResult> checkIfListOfLinksAreWorking(const vector<string>& links, const HttpGetFn& httpGet, const ProbeSettings& settings) {
    vector<LinkProbeResult> failures;
    for (const auto& link : links) {
        LinkProbeResult result = checkIfLinkIsWorking(link, httpGet, settings);
        if (result.kind != ProbeErrorKind::None) failures.push_back(result);
    }
    return failures;
}
