#pragma once

#include "FetchStrategy.h"
#include "../../include/topic_harvest/crawler/BrowserlessClient.h"
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"

// Loads the page in a headless browser so script-built content is present
class RenderFetchStrategy : public FetchStrategy {
public:
    RenderFetchStrategy(PageRenderer& renderer, const CrawlConfig& config);

    FetchStrategyKind kind() const override { return FetchStrategyKind::RENDERED; }
    StrategyOutcome attempt(FetchAttemptContext& context) override;

private:
    PageRenderer& renderer_;
    std::chrono::milliseconds timeout_;
};
