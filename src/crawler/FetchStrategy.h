#pragma once

#include <string>
#include <utility>
#include "CrawlSession.h"
#include "HttpTransport.h"
#include "IdentityPool.h"
#include "../../include/topic_harvest/crawler/models/FailureType.h"
#include "../../include/topic_harvest/crawler/models/FetchResult.h"

// Result of one strategy step. Failures are values; only NetworkUnavailableError is thrown.
struct StrategyOutcome {
    bool success = false;
    std::string html;
    std::string servedFrom;
    int statusCode = 0;
    std::string error;
    FailureType failureType = FailureType::UNKNOWN;
    // Transport error of the final request, CURLE_OK when the server answered
    CURLcode curlCode = CURLE_OK;

    static StrategyOutcome succeeded(std::string html, int statusCode = 200) {
        StrategyOutcome outcome;
        outcome.success = true;
        outcome.html = std::move(html);
        outcome.statusCode = statusCode;
        return outcome;
    }

    static StrategyOutcome failed(std::string error, int statusCode = 0,
                                  FailureType failureType = FailureType::UNKNOWN) {
        StrategyOutcome outcome;
        outcome.error = std::move(error);
        outcome.statusCode = statusCode;
        outcome.failureType = failureType;
        return outcome;
    }
};

// True for an absent content type or an HTML one (text/html, application/xhtml+xml)
bool isHtmlContentType(const std::string& contentType);

/**
 * What a strategy may touch while fetching one URL: the budget (through
 * beginAttempt) and the identity pool. One context per strategy step.
 */
class FetchAttemptContext {
public:
    FetchAttemptContext(CrawlSession& session, IdentityPool& identity,
                        std::string url, std::string origin, std::string host);

    /**
     * Reserve one budget unit for a network fetch of this URL and pace before it.
     * @return false when the budget denied the fetch; the chain must then stop
     */
    bool beginAttempt(FetchStrategyKind kind);

    // Whether a reservation would currently succeed (nothing is reserved)
    bool canReserve() const;

    // Pace before a request that needs no reservation of its own (retries, index lookups)
    void pace();

    // Feed the origin's adaptive pacing
    void reportOutcome(bool success);

    // Fresh browser-like headers for this URL's host
    HeaderList headers();

    const std::string& url() const { return url_; }
    const std::string& origin() const { return origin_; }
    const std::string& host() const { return host_; }
    bool budgetDenied() const { return budgetDenied_; }
    size_t reservations() const { return reservations_; }

private:
    CrawlSession& session_;
    IdentityPool& identity_;
    std::string url_;
    std::string origin_;
    std::string host_;
    bool budgetDenied_ = false;
    size_t reservations_ = 0;
};

// One way of obtaining a page's HTML
class FetchStrategy {
public:
    virtual ~FetchStrategy() = default;

    virtual FetchStrategyKind kind() const = 0;

    // Must call context.beginAttempt() before each budgeted network fetch and
    // give up as soon as it returns false. Must be safe to call concurrently.
    virtual StrategyOutcome attempt(FetchAttemptContext& context) = 0;

    std::string name() const { return fetchStrategyName(kind()); }
};
