#pragma once

#include <chrono>
#include <set>
#include <string>
#include <curl/curl.h>

struct CrawlConfig {
    // Traversal limits
    size_t maxDepth = 2;
    size_t maxPages = 20;
    size_t perOriginCap = 5;
    size_t maxSeedUrls = 12;
    size_t maxConcurrentOrigins = 5;

    // Pacing applied before every network fetch attempt
    std::chrono::milliseconds paceMin{1000};
    std::chrono::milliseconds paceMax{3000};
    // Upper bound of the per-origin slowdown after repeated throttling
    double maxPaceMultiplier = 5.0;

    // Direct fetch
    std::chrono::milliseconds requestTimeout{15000};
    std::chrono::milliseconds connectTimeout{10000};
    bool followRedirects = true;
    size_t maxRedirects = 5;
    bool verifySSL = true;
    std::string proxy;

    int maxAttempts = 3;
    std::chrono::milliseconds baseRetryDelay{500};
    float backoffMultiplier = 2.0f;
    std::chrono::milliseconds maxRetryDelay{4000};
    std::chrono::milliseconds rateLimitDelay{2000};

    // 403 and 999 are what bot walls usually answer with; a fresh identity often gets through
    std::set<int> retryableHttpCodes = {403, 500, 502, 503, 504, 999};
    std::set<CURLcode> retryableCurlCodes = {
        CURLE_OPERATION_TIMEDOUT,
        CURLE_COULDNT_CONNECT,
        CURLE_RECV_ERROR,
        CURLE_SEND_ERROR,
        CURLE_GOT_NOTHING,
        CURLE_PARTIAL_FILE,
        CURLE_SSL_CONNECT_ERROR
    };

    // Headless rendering through Browserless
    bool renderingEnabled = true;
    std::string browserlessUrl = "http://browserless:3000";
    std::chrono::milliseconds renderTimeout{30000};

    // Archived snapshot fallback
    bool archiveFallbackEnabled = true;
    std::string archiveLookupEndpoint = "http://web.archive.org/__wb/sparkline";
    std::string archiveSnapshotEndpoint = "http://web.archive.org/web/";

    // Extraction and relevance
    size_t minBlockChars = 200;
    // Words kept from each page's extracted text; 0 keeps everything
    size_t maxWordsPerPage = 5000;
    bool deduplicateParagraphs = true;
    double nearDuplicateThreshold = 0.8;
};
