#include "PageFetcher.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlSanitizer.h"
#include <mutex>

namespace {

// curl_global_init is not thread-safe; run it once before any handle exists
void ensureCurlGlobalInit() {
    static std::once_flag flag;
    static CURLcode initResult = CURLE_OK;
    std::call_once(flag, []() {
        initResult = curl_global_init(CURL_GLOBAL_ALL);
    });
    if (initResult != CURLE_OK) {
        throw NetworkUnavailableError("curl_global_init failed: " + std::string(curl_easy_strerror(initResult)));
    }
}

} // namespace

PageFetcher::PageFetcher(std::chrono::milliseconds connectTimeout,
                         bool followRedirects,
                         size_t maxRedirects)
    : connectTimeout(connectTimeout)
    , followRedirects(followRedirects)
    , maxRedirects(maxRedirects)
    , verifySSL(true) {
    LOG_DEBUG("PageFetcher constructor called, connect timeout: " + std::to_string(connectTimeout.count()) + "ms");
    ensureCurlGlobalInit();
}

PageFetcher::~PageFetcher() {
    LOG_DEBUG("PageFetcher destructor called");
}

PageFetchResult PageFetcher::get(const std::string& url,
                                 const HeaderList& headers,
                                 std::chrono::milliseconds timeout) {
    using namespace topic_harvest::common;
    const std::string cleanedUrl = sanitizeUrl(url);
    LOG_DEBUG("PageFetcher::get called for URL: " + cleanedUrl);
    PageFetchResult result;

    // Use a local curl handle for this request to avoid multi-threading issues
    CURL* localCurl = curl_easy_init();
    if (!localCurl) {
        LOG_ERROR("Failed to create local CURL handle");
        throw NetworkUnavailableError("Failed to create CURL handle");
    }

    curl_easy_setopt(localCurl, CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(localCurl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(localCurl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(localCurl, CURLOPT_NOSIGNAL, 1L);

    LOG_TRACE("Setting timeout: " + std::to_string(timeout.count()) + "ms");
    curl_easy_setopt(localCurl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(localCurl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout.count()));
    curl_easy_setopt(localCurl, CURLOPT_DNS_CACHE_TIMEOUT, 300L);

    curl_easy_setopt(localCurl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(localCurl, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));

    curl_easy_setopt(localCurl, CURLOPT_SSL_VERIFYPEER, verifySSL ? 1L : 0L);
    curl_easy_setopt(localCurl, CURLOPT_SSL_VERIFYHOST, verifySSL ? 2L : 0L);

    // Decode whatever compression the server picks, as a browser would
    curl_easy_setopt(localCurl, CURLOPT_ACCEPT_ENCODING, "");
    // In-memory cookie engine so redirect chains that set cookies work
    curl_easy_setopt(localCurl, CURLOPT_COOKIEFILE, "");

    if (!proxy.empty()) {
        LOG_DEBUG("Setting proxy: " + proxy);
        curl_easy_setopt(localCurl, CURLOPT_PROXY, proxy.c_str());
    }

    struct curl_slist* headerList = nullptr;
    for (const auto& header : headers) {
        std::string headerStr = header.first + ": " + header.second;
        LOG_TRACE("Adding header: " + headerStr);
        headerList = curl_slist_append(headerList, headerStr.c_str());
    }
    if (headerList) {
        curl_easy_setopt(localCurl, CURLOPT_HTTPHEADER, headerList);
    }

    std::string responseData;
    curl_easy_setopt(localCurl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(localCurl, CURLOPT_WRITEDATA, &responseData);

    CURLcode res = curl_easy_perform(localCurl);

    if (headerList) {
        curl_slist_free_all(headerList);
    }

    if (res != CURLE_OK) {
        result.errorMessage = std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf + " | url_hex=" + hexDump(cleanedUrl);
        result.curlCode = res;
        curl_easy_cleanup(localCurl);
        if (FailureClassifier::isNetworkStackFailure(res)) {
            LOG_ERROR("CURL cannot operate: " + result.errorMessage);
            throw NetworkUnavailableError(result.errorMessage);
        }
        LOG_WARNING("CURL error for " + cleanedUrl + ": " + result.errorMessage);
        return result;
    }

    long statusCode = 0;
    curl_easy_getinfo(localCurl, CURLINFO_RESPONSE_CODE, &statusCode);
    result.statusCode = static_cast<int>(statusCode);

    if (result.statusCode >= 200 && result.statusCode < 300) {
        LOG_INFO("HTTP SUCCESS (" + std::to_string(result.statusCode) + "): " + cleanedUrl);
    } else if (result.statusCode >= 400 && result.statusCode < 500) {
        LOG_WARNING("HTTP CLIENT ERROR (" + std::to_string(result.statusCode) + "): " + cleanedUrl);
    } else if (result.statusCode >= 500) {
        LOG_WARNING("HTTP SERVER ERROR (" + std::to_string(result.statusCode) + "): " + cleanedUrl);
    } else {
        LOG_INFO("HTTP " + std::to_string(result.statusCode) + ": " + cleanedUrl);
    }

    char* contentType = nullptr;
    curl_easy_getinfo(localCurl, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        result.contentType = contentType;
    }

    char* finalUrl = nullptr;
    curl_easy_getinfo(localCurl, CURLINFO_EFFECTIVE_URL, &finalUrl);
    if (finalUrl) {
        result.finalUrl = finalUrl;
        if (result.finalUrl != cleanedUrl) {
            LOG_DEBUG("Final URL (after redirects): " + result.finalUrl);
        }
    }

    curl_easy_cleanup(localCurl);

    result.content = std::move(responseData);
    result.success = (result.statusCode >= 200 && result.statusCode < 300);
    LOG_DEBUG("Response for " + cleanedUrl + ": " + std::to_string(result.content.size()) + " bytes");
    return result;
}

void PageFetcher::setProxy(const std::string& proxyUrl) {
    LOG_DEBUG("PageFetcher::setProxy called with: " + proxyUrl);
    proxy = proxyUrl;
}

void PageFetcher::setVerifySSL(bool verify) {
    LOG_DEBUG("PageFetcher::setVerifySSL called with: " + std::string(verify ? "true" : "false"));
    verifySSL = verify;
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* responseData = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    responseData->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}
