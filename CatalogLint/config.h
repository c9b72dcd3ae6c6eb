#pragma once

#include <string>
#include <vector>
#include <cstddef>

using namespace std;

// Listing dialect
static const string CATEGORY_ANCHOR = "###";
static const string INDEX_SECTION_MARKER = "## Index";
static const char TABLE_DELIMITER = '|';
static const string SEPARATOR_ROW_PREFIX = "|---";

static const size_t NUM_SEGMENTS = 5;
static const size_t INDEX_TITLE = 0;
static const size_t INDEX_DESC = 1;
static const size_t INDEX_AUTH = 2;
static const size_t INDEX_HTTPS = 3;
static const size_t INDEX_CORS = 4;

static const int MIN_ENTRIES_PER_CATEGORY = 3;
static const size_t MAX_DESCRIPTION_LENGTH = 100;

static const vector<string> AUTH_KEYS = { "apiKey", "OAuth", "X-Mashape-Key", "User-Agent", "No" };
static const vector<string> HTTPS_KEYS = { "Yes", "No" };
static const vector<string> CORS_KEYS = { "Yes", "No", "Unknown" };

// ASCII punctuation minus the parentheses, which descriptions may end with
static const string DESCRIPTION_PUNCTUATION = "!\"#$%&'*+,-./:;<=>?@[\\]^_`{|}~";

// Timeouts and limits
static const long PROBE_TIMEOUT_SECONDS = 25L;
static const long PROBE_MAX_REDIRECTS = 30L;
static const size_t MAX_DOWNLOAD_BYTES = 8 * 1024 * 1024;

static const vector<string> PROBE_USER_AGENTS = {
    "Mozilla/5.0 (Windows NT 6.2) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/28.0.1467.0 Safari/537.36",
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_13_6) AppleWebKit/605.1.15 (KHTML, like Gecko)",
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/80.0.3987.132 Safari/537.36",
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/97.0.4692.71 Safari/537.36",
};

// Bot protection
static const vector<int> BOT_CHALLENGE_STATUS_CODES = { 403, 503 };
static const vector<string> KNOWN_CDN_SERVERS = { "cloudflare" };
static const vector<string> BOT_CHALLENGE_MARKERS = {
    "403 Forbidden",
    "cloudflare",
    "Cloudflare",
    "Security check",
    "Please Wait... | Cloudflare",
    "We are checking your browser...",
    "Please stand by, while we are checking your browser...",
    "Checking your browser before accessing",
    "This process is automatic.",
    "Your browser will redirect to your requested content shortly.",
    "Please allow up to 5 seconds",
    "DDoS protection by",
    "Ray ID:",
    "Cloudflare Ray ID:",
    "_cf_chl",
    "_cf_chl_opt",
    "__cf_chl_rt_tk",
    "cf-spinner-please-wait",
    "cf-spinner-redirecting",
};

// Export
static const string RESOURCES_FILE_NAME = "resources.json";
static const string CATEGORIES_FILE_NAME = "categories.json";
static const int EXPORT_JSON_INDENT = 4;
