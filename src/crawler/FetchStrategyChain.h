#pragma once

#include <memory>
#include <string>
#include <vector>
#include "FetchStrategy.h"
#include "../../include/topic_harvest/crawler/BrowserlessClient.h"
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"
#include "../../include/topic_harvest/crawler/models/FetchResult.h"

/**
 * Ordered fallback list of fetch strategies. fetch() tries each in turn and
 * returns the first non-empty HTML. A budget denial in any step ends the chain.
 */
class FetchStrategyChain {
public:
    FetchStrategyChain() = default;

    FetchStrategyChain(const FetchStrategyChain&) = delete;
    FetchStrategyChain& operator=(const FetchStrategyChain&) = delete;
    FetchStrategyChain(FetchStrategyChain&&) = default;
    FetchStrategyChain& operator=(FetchStrategyChain&&) = default;

    void addStrategy(std::unique_ptr<FetchStrategy> strategy);

    /**
     * Fetch one URL through the strategies in order
     * @param url Normalized absolute URL
     * @param session Budget and fetch log of the current crawl
     * @param identity Header and pacing source
     * @throws NetworkUnavailableError when the network stack is unusable
     */
    FetchResult fetch(const std::string& url, CrawlSession& session, IdentityPool& identity) const;

    size_t size() const { return strategies_.size(); }
    std::vector<FetchStrategyKind> kinds() const;

    /**
     * Direct, then rendered (when enabled and a renderer is given), then archived (when enabled)
     * @param transport HTTP transport used by the direct and archive steps; must outlive the chain
     * @param renderer Headless renderer, or nullptr to skip rendering; must outlive the chain
     */
    static FetchStrategyChain createDefault(const CrawlConfig& config,
                                            HttpTransport& transport,
                                            PageRenderer* renderer);

private:
    std::vector<std::unique_ptr<FetchStrategy>> strategies_;
};
