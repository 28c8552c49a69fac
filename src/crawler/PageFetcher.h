#pragma once

#include <string>
#include <chrono>
#include <curl/curl.h>
#include "HttpTransport.h"

// libcurl-backed HttpTransport. Every request uses its own easy handle so one
// instance is shared by all origin tasks.
class PageFetcher : public HttpTransport {
public:
    PageFetcher(std::chrono::milliseconds connectTimeout,
                bool followRedirects = true,
                size_t maxRedirects = 5);
    ~PageFetcher() override;

    // GET a URL with the given headers. Throws NetworkUnavailableError when
    // libcurl cannot create a handle or runs out of memory.
    PageFetchResult get(const std::string& url,
                        const HeaderList& headers,
                        std::chrono::milliseconds timeout) override;

    // Route requests through an HTTP(S) or SOCKS proxy; empty disables it
    void setProxy(const std::string& proxy);

    // Enable/disable SSL verification
    void setVerifySSL(bool verify);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::chrono::milliseconds connectTimeout;
    bool followRedirects;
    size_t maxRedirects;
    std::string proxy;
    bool verifySSL;
};
