#pragma once

#include <atomic>
#include <string>
#include <vector>
#include "ContentExtractor.h"
#include "CrawlSession.h"
#include "FetchStrategyChain.h"
#include "IdentityPool.h"
#include "TopicRelevanceFilter.h"
#include "URLFrontier.h"
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"
#include "../../include/topic_harvest/crawler/models/HarvestResult.h"

/**
 * Breadth-first traversal of a single origin. Runs on one thread; the
 * session it shares with the other origins' crawlers is the only
 * cross-thread state.
 */
class Crawler {
public:
    Crawler(std::string origin,
            const CrawlConfig& config,
            CrawlSession& session,
            IdentityPool& identity,
            const FetchStrategyChain& chain,
            const TopicRelevanceFilter& filter);

    // Queue a normalized URL of this origin at depth 0
    void addSeedURL(const std::string& url);

    /**
     * Process the frontier until it is empty (COMPLETED) or the budget
     * denies a fetch (EXHAUSTED).
     * @throws NetworkUnavailableError when the network stack is unusable
     */
    OriginCorpus run();

    CrawlState getState() const { return state_.load(); }
    const std::string& getOrigin() const { return origin_; }
    size_t frontierSize() const { return frontier_.size(); }

private:
    void processPage(const FrontierEntry& entry, const FetchResult& fetched);
    void appendText(const std::string& text);
    void enqueueLinks(const std::vector<ExtractedLink>& links, size_t depth);

    std::string origin_;
    const CrawlConfig& config_;
    CrawlSession& session_;
    IdentityPool& identity_;
    const FetchStrategyChain& chain_;
    const TopicRelevanceFilter& filter_;
    ContentExtractor extractor_;
    URLFrontier frontier_;
    std::atomic<CrawlState> state_{CrawlState::IDLE};

    std::vector<std::string> blocks_;
    std::vector<std::string> keptParagraphs_;
    size_t pagesWithText_ = 0;
    size_t seedsAttempted_ = 0;
    size_t seedsUnreachable_ = 0;
};
