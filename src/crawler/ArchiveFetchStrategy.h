#pragma once

#include <optional>
#include <string>
#include "FetchStrategy.h"
#include "HttpTransport.h"
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"

// Last resort: the most recent Wayback Machine snapshot of the page.
// The index lookup is free; only the snapshot fetch costs a budget unit.
class ArchiveFetchStrategy : public FetchStrategy {
public:
    ArchiveFetchStrategy(HttpTransport& transport, const CrawlConfig& config);

    FetchStrategyKind kind() const override { return FetchStrategyKind::ARCHIVED; }
    StrategyOutcome attempt(FetchAttemptContext& context) override;

    std::string lookupUrl(const std::string& url) const;
    std::string snapshotUrl(const std::string& timestamp, const std::string& url) const;

    // "last_ts" of a sparkline response; nullopt when absent, null or malformed
    static std::optional<std::string> parseLastTimestamp(const std::string& body);

private:
    HttpTransport& transport_;
    std::string lookupEndpoint_;
    std::string snapshotEndpoint_;
    std::chrono::milliseconds timeout_;
};
