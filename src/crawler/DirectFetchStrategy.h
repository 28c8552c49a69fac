#pragma once

#include "FetchStrategy.h"
#include "HttpTransport.h"
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"

// Plain HTTP GET with browser headers, retried with exponential backoff on
// bot walls and transient errors. All retries share one budget unit.
class DirectFetchStrategy : public FetchStrategy {
public:
    DirectFetchStrategy(HttpTransport& transport, const CrawlConfig& config);

    FetchStrategyKind kind() const override { return FetchStrategyKind::DIRECT; }
    StrategyOutcome attempt(FetchAttemptContext& context) override;

private:
    HttpTransport& transport_;
    CrawlConfig config_;
};
