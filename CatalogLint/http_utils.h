#pragma once

// --- Includes ---
#include <string>
#include <vector>
#include <cstddef> // For size_t
#include <iostream>
#include <curl/curl.h>

#include "config.h"
#include "string_utils.h"
#include "link_prober.h"

using namespace std;

// --- Structs ---
struct CurlBuffer {
    std::string data;
    size_t maxBytes;
};

// --- Function Definitions ---

// Keeps at most maxBytes of the body; the rest is read and dropped so that an
// oversized page is not reported as a transfer failure.
inline size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    if (!userp) return 0;
    CurlBuffer* buf = static_cast<CurlBuffer*>(userp);
    if (buf->data.size() < buf->maxBytes) {
        size_t room = buf->maxBytes - buf->data.size();
        buf->data.append(static_cast<char*>(contents), realsize < room ? realsize : room);
    }
    return realsize;
}

// Records the Server header of the last response in a redirect chain.
inline size_t curlHeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t realsize = size * nitems;
    if (!userp) return 0;
    string* server = static_cast<string*>(userp);
    string line(buffer, realsize);
    if (startsWith(line, "HTTP/")) {
        server->clear();
        return realsize;
    }
    size_t colon = line.find(':');
    if (colon != string::npos && toLowerStr(trimWhitespace(line.substr(0, colon))) == "server") {
        *server = trimWhitespace(line.substr(colon + 1));
    }
    return realsize;
}

inline ProbeErrorKind probeErrorFromCurlCode(CURLcode code) {
    switch (code) {
    case CURLE_OK:
        return ProbeErrorKind::None;
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_ENGINE_NOTFOUND:
    case CURLE_SSL_ENGINE_SETFAILED:
    case CURLE_SSL_ENGINE_INITFAILED:
    case CURLE_SSL_SHUTDOWN_FAILED:
    case CURLE_SSL_CRL_BADFILE:
    case CURLE_SSL_ISSUER_ERROR:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
    case CURLE_SSL_INVALIDCERTSTATUS:
    case CURLE_USE_SSL_FAILED:
        return ProbeErrorKind::SSLError;
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
        return ProbeErrorKind::ConnectionError;
    case CURLE_OPERATION_TIMEDOUT:
        return ProbeErrorKind::Timeout;
    case CURLE_TOO_MANY_REDIRECTS:
        return ProbeErrorKind::TooManyRedirects;
    default:
        return ProbeErrorKind::Unknown;
    }
}

inline HttpResponse httpGetForProbe(const string& url, const vector<string>& extraHeaders, const ProbeSettings& settings) {
    HttpResponse resp;
    CURL* curl = curl_easy_init();
    if (!curl) {
        cerr << "[httpGet] curl_easy_init failed\n";
        resp.transportError = ProbeErrorKind::Unknown;
        resp.errorDetail = "curl_easy_init failed";
        return resp;
    }

    CurlBuffer buf{ string(), settings.maxBodyBytes };
    string server;
    struct curl_slist* headers = nullptr;
    for (const auto& h : extraHeaders) headers = curl_slist_append(headers, h.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, curlHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &server);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, settings.maxRedirects);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, settings.timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, settings.timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        if (settings.verbose) {
            cerr << "[httpGet] curl error for " << url << " : " << curl_easy_strerror(res) << "\n";
        }
        resp.transportError = probeErrorFromCurlCode(res);
        resp.errorDetail = curl_easy_strerror(res);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return resp;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    resp.status = httpCode;
    resp.server = server;
    resp.body = buf.data;

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return resp;
}

inline HttpGetFn makeCurlTransport(const ProbeSettings& settings) {
    return [settings](const string& url, const vector<string>& headers) {
        return httpGetForProbe(url, headers, settings);
    };
}
