#include "CrawlSession.h"
#include "../../include/Logger.h"

CrawlSession::CrawlSession(size_t maxPages, size_t perOriginCap)
    : budget_(maxPages, perOriginCap) {
}

CrawlSession::CrawlSession(const CrawlConfig& config)
    : budget_(config) {
}

bool CrawlSession::markVisited(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.insert(url).second;
}

bool CrawlSession::isVisited(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.find(url) != visited_.end();
}

bool CrawlSession::reserveAttempt(const FetchLogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!budget_.tryReserve(entry.origin)) {
        LOG_INFO("Budget exhausted, " + std::string(fetchStrategyName(entry.strategy)) +
                 " fetch of " + entry.url + " denied");
        return false;
    }
    fetchLog_.push_back(entry);
    LOG_DEBUG("Reserved budget unit " + std::to_string(budget_.getPagesCrawled()) + "/" +
              std::to_string(budget_.getMaxPages()) + " for " + fetchStrategyName(entry.strategy) +
              " fetch of " + entry.url);
    return true;
}

bool CrawlSession::canReserve(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.canReserve(origin);
}

bool CrawlSession::hasOriginCapacity(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.hasOriginCapacity(origin);
}

size_t CrawlSession::getPagesCrawled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.getPagesCrawled();
}

size_t CrawlSession::getPagesFetched(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.getPagesFetched(origin);
}

std::unordered_map<std::string, size_t> CrawlSession::getOriginCounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_.getOriginCounts();
}

size_t CrawlSession::getVisitedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.size();
}

size_t CrawlSession::getMaxPages() const {
    return budget_.getMaxPages();
}

size_t CrawlSession::getPerOriginCap() const {
    return budget_.getPerOriginCap();
}

std::vector<FetchLogEntry> CrawlSession::getFetchLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchLog_;
}
