#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

struct BrowserlessRenderResult {
    bool success = false;
    std::string html;
    std::string error;
    int status_code = 0;
    std::chrono::milliseconds render_time{0};
};

// Per-call render settings; renderers keep no per-request state
struct RenderOptions {
    std::string userAgent;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{30000};
    bool waitForNetworkIdle = true;
    bool stealth = true;
};

// Headless browser that returns the DOM of a page after its scripts ran
class PageRenderer {
public:
    virtual ~PageRenderer() = default;
    virtual BrowserlessRenderResult renderUrl(const std::string& url, const RenderOptions& options) = 0;
};

// Renders through a Browserless service's /content endpoint. Each call gets a
// fresh browser context.
class BrowserlessClient : public PageRenderer {
public:
    explicit BrowserlessClient(const std::string& browserless_url);
    ~BrowserlessClient() override;

    BrowserlessRenderResult renderUrl(const std::string& url, const RenderOptions& options) override;

    // Health check against <browserless>/health
    bool isAvailable();

    // Endpoint the render request is POSTed to, including the stealth launch flags
    std::string contentEndpoint(bool stealth) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};
