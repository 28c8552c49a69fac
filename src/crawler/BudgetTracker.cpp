#include "BudgetTracker.h"
#include "../../include/Logger.h"

BudgetTracker::BudgetTracker(size_t maxPages, size_t perOriginCap)
    : maxPages_(maxPages), perOriginCap_(perOriginCap) {
}

BudgetTracker::BudgetTracker(const CrawlConfig& config)
    : BudgetTracker(config.maxPages, config.perOriginCap) {
}

bool BudgetTracker::tryReserve(const std::string& origin) {
    if (!canReserve(origin)) {
        LOG_DEBUG("Budget denied for origin " + origin + " (global " + std::to_string(pagesCrawled_) + "/" +
                  std::to_string(maxPages_) + ", origin " + std::to_string(getPagesFetched(origin)) + "/" +
                  std::to_string(perOriginCap_) + ")");
        return false;
    }

    ++pagesCrawled_;
    ++pagesFetched_[origin];
    return true;
}

bool BudgetTracker::canReserve(const std::string& origin) const {
    return !isGloballyExhausted() && hasOriginCapacity(origin);
}

bool BudgetTracker::hasOriginCapacity(const std::string& origin) const {
    return getPagesFetched(origin) < perOriginCap_;
}

size_t BudgetTracker::getPagesFetched(const std::string& origin) const {
    auto it = pagesFetched_.find(origin);
    return it == pagesFetched_.end() ? 0 : it->second;
}
