#include "../../include/topic_harvest/crawler/BrowserlessClient.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlSanitizer.h"
#include "HttpTransport.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class BrowserlessClient::Impl {
public:
    explicit Impl(const std::string& browserless_url)
        : browserless_url_(browserless_url) {
        while (!browserless_url_.empty() && browserless_url_.back() == '/') {
            browserless_url_.pop_back();
        }
    }

    std::string contentEndpoint(bool stealth) const {
        std::string endpoint = browserless_url_ + "/content";
        if (stealth) {
            // Hide navigator.webdriver and the other automation markers
            endpoint += "?stealth=true&--disable-blink-features=AutomationControlled";
        }
        return endpoint;
    }

    json buildPayload(const std::string& url, const RenderOptions& options) const {
        json payload = {
            {"url", url},
            {"gotoOptions", {
                {"waitUntil", options.waitForNetworkIdle ? "networkidle2" : "domcontentloaded"},
                {"timeout", options.timeout.count()}
            }},
            {"rejectResourceTypes", json::array({"image", "media", "font"})}
        };

        if (!options.userAgent.empty()) {
            payload["userAgent"] = options.userAgent;
        }

        if (!options.headers.empty()) {
            json headers = json::object();
            for (const auto& [key, value] : options.headers) {
                // Browserless sets the user agent itself
                if (key == "User-Agent") continue;
                headers[key] = value;
            }
            payload["setExtraHTTPHeaders"] = headers;
        }
        return payload;
    }

    BrowserlessRenderResult renderUrl(const std::string& url, const RenderOptions& options) {
        BrowserlessRenderResult result;
        auto start_time = std::chrono::steady_clock::now();

        using namespace topic_harvest::common;
        const std::string cleanedUrl = sanitizeUrl(url);
        LOG_INFO("Starting headless browser rendering for: " + cleanedUrl);

        CURL* curl = curl_easy_init();
        if (!curl) {
            LOG_ERROR("Failed to create local CURL handle for BrowserlessClient");
            throw NetworkUnavailableError("Failed to create CURL handle for browserless");
        }

        const std::string endpoint = contentEndpoint(options.stealth);
        const std::string json_payload = buildPayload(cleanedUrl, options).dump();

        LOG_DEBUG("Browserless endpoint: " + endpoint);
        LOG_TRACE("JSON payload: " + json_payload);

        // Leave the browser time to hit its own navigation timeout before we give up on it
        const long transfer_timeout_ms = static_cast<long>(options.timeout.count()) + 5000L;

        curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(json_payload.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, transfer_timeout_ms);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        char errbuf[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        std::string response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(headers);

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        curl_easy_cleanup(curl);

        result.status_code = static_cast<int>(http_code);
        result.render_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res != CURLE_OK) {
            result.error = "CURL error: " + std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf;
            if (res == CURLE_OUT_OF_MEMORY || res == CURLE_FAILED_INIT) {
                throw NetworkUnavailableError(result.error);
            }
            LOG_WARNING("Browserless unavailable for: " + cleanedUrl + " - " + result.error +
                        " [duration_ms=" + std::to_string(result.render_time.count()) +
                        ", timeout_ms=" + std::to_string(options.timeout.count()) + "]");
            return result;
        }

        if (http_code == 200 && !response.empty()) {
            result.html = std::move(response);
            result.success = true;
            LOG_INFO("Successfully rendered page via browserless: " + cleanedUrl + ", size: " +
                     std::to_string(result.html.size()) + " bytes, render_time_ms=" +
                     std::to_string(result.render_time.count()));
        } else {
            result.error = "Browserless returned HTTP " + std::to_string(http_code) + ": " + response.substr(0, 200);
            LOG_WARNING("Browserless error for " + cleanedUrl + ": " + result.error);
        }
        return result;
    }

    bool isAvailable() {
        CURL* curl = curl_easy_init();
        if (!curl) return false;

        std::string health_url = browserless_url_ + "/health";
        curl_easy_setopt(curl, CURLOPT_URL, health_url.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));

        CURLcode res = curl_easy_perform(curl);
        bool available = false;
        if (res == CURLE_OK) {
            long http_code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
            available = (http_code == 200);
        }
        curl_easy_cleanup(curl);
        return available;
    }

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        std::string* response = static_cast<std::string*>(userp);
        size_t totalSize = size * nmemb;
        response->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    std::string browserless_url_;
};

BrowserlessClient::BrowserlessClient(const std::string& browserless_url)
    : pImpl(std::make_unique<Impl>(browserless_url)) {}

BrowserlessClient::~BrowserlessClient() = default;

BrowserlessRenderResult BrowserlessClient::renderUrl(const std::string& url, const RenderOptions& options) {
    return pImpl->renderUrl(url, options);
}

bool BrowserlessClient::isAvailable() {
    return pImpl->isAvailable();
}

std::string BrowserlessClient::contentEndpoint(bool stealth) const {
    return pImpl->contentEndpoint(stealth);
}
