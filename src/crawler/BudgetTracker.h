#pragma once

#include <string>
#include <unordered_map>
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"

/**
 * Page budget of one crawl: a global page count and a per-origin page count.
 * Not synchronized; CrawlSession serializes every call.
 */
class BudgetTracker {
public:
    BudgetTracker(size_t maxPages, size_t perOriginCap);
    explicit BudgetTracker(const CrawlConfig& config);

    /**
     * Reserve one fetch for an origin
     * @param origin Origin ("scheme://host") the fetch targets
     * @return true and both counters incremented, or false with nothing changed
     */
    bool tryReserve(const std::string& origin);

    // Same check as tryReserve, without reserving
    bool canReserve(const std::string& origin) const;

    // Per-origin check only, used before a link is enqueued
    bool hasOriginCapacity(const std::string& origin) const;

    bool isGloballyExhausted() const { return pagesCrawled_ >= maxPages_; }

    size_t getPagesCrawled() const { return pagesCrawled_; }
    size_t getPagesFetched(const std::string& origin) const;
    const std::unordered_map<std::string, size_t>& getOriginCounts() const { return pagesFetched_; }

    size_t getMaxPages() const { return maxPages_; }
    size_t getPerOriginCap() const { return perOriginCap_; }

private:
    size_t maxPages_;
    size_t perOriginCap_;
    size_t pagesCrawled_ = 0;
    std::unordered_map<std::string, size_t> pagesFetched_;
};
