#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "BudgetTracker.h"
#include "../../include/topic_harvest/crawler/models/FetchResult.h"

/**
 * Mutable state of a single crawl invocation, shared by reference among the
 * per-origin tasks. One mutex guards the visited set, the budget and the fetch
 * log so every check-then-update is atomic.
 */
class CrawlSession {
public:
    CrawlSession(size_t maxPages, size_t perOriginCap);
    explicit CrawlSession(const CrawlConfig& config);

    CrawlSession(const CrawlSession&) = delete;
    CrawlSession& operator=(const CrawlSession&) = delete;

    // Returns false when the URL was already visited
    bool markVisited(const std::string& url);
    bool isVisited(const std::string& url) const;

    // Reserve one budget unit and append the attempt to the fetch log
    bool reserveAttempt(const FetchLogEntry& entry);

    bool canReserve(const std::string& origin) const;
    bool hasOriginCapacity(const std::string& origin) const;

    size_t getPagesCrawled() const;
    size_t getPagesFetched(const std::string& origin) const;
    std::unordered_map<std::string, size_t> getOriginCounts() const;
    size_t getVisitedCount() const;
    size_t getMaxPages() const;
    size_t getPerOriginCap() const;

    std::vector<FetchLogEntry> getFetchLog() const;

private:
    mutable std::mutex mutex_;
    BudgetTracker budget_;
    std::unordered_set<std::string> visited_;
    std::vector<FetchLogEntry> fetchLog_;
};
