#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <curl/curl.h>

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct PageFetchResult {
    bool success = false;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string errorMessage;
    std::string finalUrl;  // After redirects
    CURLcode curlCode = CURLE_OK;  // CURL error code for retry classification
};

// The network stack itself is unusable (libcurl cannot initialize or runs out
// of memory), or no seed host could be resolved or connected to.
// Unlike per-URL failures this aborts the whole crawl.
class NetworkUnavailableError : public std::runtime_error {
public:
    explicit NetworkUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

// Blocking HTTP transport. Implementations must be safe to call from several threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual PageFetchResult get(const std::string& url,
                                const HeaderList& headers,
                                std::chrono::milliseconds timeout) = 0;
};
