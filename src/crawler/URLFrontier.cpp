#include "URLFrontier.h"
#include "../../include/Logger.h"

bool URLFrontier::addURL(const std::string& url, size_t depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!queued_.insert(url).second) {
        LOG_TRACE("URL already queued, skipping: " + url);
        return false;
    }
    queue_.push_back(FrontierEntry{url, depth});
    LOG_DEBUG("Queued " + url + " at depth " + std::to_string(depth) +
              ", frontier size: " + std::to_string(queue_.size()));
    return true;
}

std::optional<FrontierEntry> URLFrontier::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    FrontierEntry entry = queue_.front();
    queue_.pop_front();
    return entry;
}

size_t URLFrontier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t URLFrontier::totalQueued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_.size();
}
