#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "HttpTransport.h"
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"

/**
 * Request identities used to look like ordinary browser traffic: rotating
 * user agents, search-engine referers and randomized pacing between fetches.
 * Pacing adapts per origin: throttling answers stretch the interval, successes
 * shrink it back. Shared by all origin tasks; all state is guarded by a mutex.
 */
class IdentityPool {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    IdentityPool(std::chrono::milliseconds paceMin, std::chrono::milliseconds paceMax,
                 double maxPaceMultiplier = 5.0);
    explicit IdentityPool(const CrawlConfig& config);

    // Full header set for one request to the given host
    HeaderList nextHeaders(const std::string& host);

    /**
     * Sleep a uniformly random interval in [paceMin, paceMax], scaled by the
     * origin's current multiplier. Called before every network request.
     * @return the interval slept
     */
    std::chrono::milliseconds pace(const std::string& origin = std::string());

    // x1.5 after a throttled or failed request, x0.8 after a success, kept within [1, maxPaceMultiplier]
    void reportOutcome(const std::string& origin, bool success);

    double paceMultiplier(const std::string& origin) const;

    // Replace the real sleep, for tests
    void setSleeper(Sleeper sleeper);

    std::string nextUserAgent();

    static const std::vector<std::string>& userAgents();

    std::chrono::milliseconds getPaceMin() const { return paceMin_; }
    std::chrono::milliseconds getPaceMax() const { return paceMax_; }

private:
    std::string nextReferer(const std::string& host);

    std::chrono::milliseconds paceMin_;
    std::chrono::milliseconds paceMax_;
    double maxPaceMultiplier_;
    Sleeper sleeper_;
    std::mt19937 rng_;
    std::map<std::string, double> multipliers_;
    mutable std::mutex mutex_;
};
