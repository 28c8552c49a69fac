#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "CorpusSink.h"
#include "FetchStrategyChain.h"
#include "IdentityPool.h"
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"
#include "../../include/topic_harvest/crawler/models/HarvestResult.h"

/**
 * Runs one crawl: prepares the seeds, starts one BFS per origin on a bounded
 * number of std::async tasks sharing a fresh CrawlSession, and assembles the
 * corpus in seed order.
 */
class HarvestEngine {
public:
    // Throws std::invalid_argument when the configuration is invalid
    HarvestEngine(const CrawlConfig& config, FetchStrategyChain chain);

    HarvestEngine(const HarvestEngine&) = delete;
    HarvestEngine& operator=(const HarvestEngine&) = delete;

    /**
     * @param topic Topic string the text and links are filtered on
     * @param seedUrls Seed URLs; invalid ones are dropped, at most maxSeedUrls are used
     * @throws NetworkUnavailableError when the network stack is unusable or every seed host is unreachable
     */
    HarvestResult crawl(const std::string& topic, const std::vector<std::string>& seedUrls);

    // Optional consumer receiving every origin's corpus after a crawl
    void setCorpusSink(std::shared_ptr<CorpusSink> sink);

    IdentityPool& getIdentityPool() { return identity_; }
    const CrawlConfig& getConfig() const { return config_; }

    // Sanitized, normalized, de-duplicated and capped seeds grouped by origin in first-seen order
    static std::vector<std::pair<std::string, std::vector<std::string>>>
    groupSeedsByOrigin(const std::vector<std::string>& seedUrls, size_t maxSeeds);

private:
    CrawlConfig config_;
    FetchStrategyChain chain_;
    IdentityPool identity_;
    std::shared_ptr<CorpusSink> sink_;
};
