#include "IdentityPool.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlResolver.h"
#include <algorithm>
#include <cmath>
#include <thread>

IdentityPool::IdentityPool(std::chrono::milliseconds paceMin, std::chrono::milliseconds paceMax,
                           double maxPaceMultiplier)
    : paceMin_(paceMin)
    , paceMax_(std::max(paceMin, paceMax))
    , maxPaceMultiplier_(std::max(1.0, maxPaceMultiplier))
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
    , rng_(std::random_device{}()) {
}

IdentityPool::IdentityPool(const CrawlConfig& config)
    : IdentityPool(config.paceMin, config.paceMax, config.maxPaceMultiplier) {
}

const std::vector<std::string>& IdentityPool::userAgents() {
    static const std::vector<std::string> agents = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.4 Safari/605.1.15",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36 Edg/124.0.0.0",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:125.0) Gecko/20100101 Firefox/125.0"
    };
    return agents;
}

std::string IdentityPool::nextUserAgent() {
    const auto& agents = userAgents();
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<size_t> pick(0, agents.size() - 1);
    return agents[pick(rng_)];
}

std::string IdentityPool::nextReferer(const std::string& host) {
    double roll;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    }

    const std::string query = topic_harvest::common::percentEncode(host);
    if (roll < 0.7) {
        return "https://www.google.com/search?q=" + query;
    }
    if (roll < 0.85) {
        return "https://www.bing.com/search?q=" + query;
    }
    return "https://duckduckgo.com/?q=" + query;
}

HeaderList IdentityPool::nextHeaders(const std::string& host) {
    HeaderList headers = {
        {"User-Agent", nextUserAgent()},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Referer", nextReferer(host)},
        {"DNT", "1"},
        {"Upgrade-Insecure-Requests", "1"},
        {"Cache-Control", "max-age=0"}
    };
    LOG_TRACE("Identity for " + host + ": " + headers[0].second);
    return headers;
}

std::chrono::milliseconds IdentityPool::pace(const std::string& origin) {
    std::chrono::milliseconds delay;
    Sleeper sleeper;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<long long> pick(paceMin_.count(), paceMax_.count());
        double multiplier = 1.0;
        auto it = multipliers_.find(origin);
        if (it != multipliers_.end()) {
            multiplier = it->second;
        }
        delay = std::chrono::milliseconds(std::llround(static_cast<double>(pick(rng_)) * multiplier));
        sleeper = sleeper_;
    }

    LOG_DEBUG("Pacing for " + std::to_string(delay.count()) + "ms before next fetch" +
              (origin.empty() ? std::string() : " to " + origin));
    sleeper(delay);
    return delay;
}

void IdentityPool::reportOutcome(const std::string& origin, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = multipliers_.find(origin);
    const double current = it == multipliers_.end() ? 1.0 : it->second;
    const double next = success ? std::max(1.0, current * 0.8)
                                : std::min(maxPaceMultiplier_, current * 1.5);
    if (next != current) {
        LOG_DEBUG("Pace multiplier for " + origin + " adjusted to " + std::to_string(next));
    }
    multipliers_[origin] = next;
}

double IdentityPool::paceMultiplier(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = multipliers_.find(origin);
    return it == multipliers_.end() ? 1.0 : it->second;
}

void IdentityPool::setSleeper(Sleeper sleeper) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleeper_ = std::move(sleeper);
}
