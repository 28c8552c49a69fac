#include "HarvestEngine.h"
#include "../../include/topic_harvest/crawler/BrowserlessClient.h"
#include "ConfigLoader.h"
#include "CrawlSession.h"
#include "Crawler.h"
#include "PageFetcher.h"
#include "TopicRelevanceFilter.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/Harvest.h"
#include "../../include/topic_harvest/common/UrlResolver.h"
#include "../../include/topic_harvest/common/UrlSanitizer.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <sstream>

HarvestEngine::HarvestEngine(const CrawlConfig& config, FetchStrategyChain chain)
    : config_(config)
    , chain_(std::move(chain))
    , identity_(config) {
    validateConfig(config_);
}

void HarvestEngine::setCorpusSink(std::shared_ptr<CorpusSink> sink) {
    sink_ = std::move(sink);
}

std::vector<std::pair<std::string, std::vector<std::string>>>
HarvestEngine::groupSeedsByOrigin(const std::vector<std::string>& seedUrls, size_t maxSeeds) {
    std::vector<std::pair<std::string, std::vector<std::string>>> groups;
    std::vector<std::string> accepted;

    for (const auto& seed : seedUrls) {
        const std::string cleaned = topic_harvest::common::sanitizeUrl(seed);
        auto normalized = topic_harvest::common::normalizeUrl(cleaned);
        if (!normalized) {
            LOG_WARNING("Dropping invalid seed URL: '" + cleaned + "' (hex: " + topic_harvest::common::hexDump(seed) + ")");
            continue;
        }
        if (std::find(accepted.begin(), accepted.end(), *normalized) != accepted.end()) {
            continue;
        }
        if (accepted.size() >= maxSeeds) {
            LOG_WARNING("Seed limit of " + std::to_string(maxSeeds) + " reached, ignoring " + *normalized);
            continue;
        }
        accepted.push_back(*normalized);

        const std::string origin = topic_harvest::common::originOf(*normalized);
        auto group = std::find_if(groups.begin(), groups.end(),
                                  [&origin](const auto& entry) { return entry.first == origin; });
        if (group == groups.end()) {
            groups.emplace_back(origin, std::vector<std::string>{*normalized});
        } else {
            group->second.push_back(*normalized);
        }
    }
    return groups;
}

HarvestResult HarvestEngine::crawl(const std::string& topic, const std::vector<std::string>& seedUrls) {
    HarvestResult result;
    result.topic = topic;

    const auto groups = groupSeedsByOrigin(seedUrls, config_.maxSeedUrls);
    LOG_INFO("Harvesting '" + topic + "' from " + std::to_string(groups.size()) + " origin(s), depth " +
             std::to_string(config_.maxDepth) + ", budget " + std::to_string(config_.maxPages) + " pages (" +
             std::to_string(config_.perOriginCap) + " per origin)");

    CrawlSession session(config_);
    TopicRelevanceFilter filter(topic);
    std::vector<OriginCorpus> corpora(groups.size());

    std::atomic<size_t> nextOrigin{0};
    std::atomic<bool> aborted{false};
    auto worker = [&]() {
        while (!aborted) {
            const size_t index = nextOrigin++;
            if (index >= groups.size()) {
                break;
            }
            Crawler crawler(groups[index].first, config_, session, identity_, chain_, filter);
            for (const auto& url : groups[index].second) {
                crawler.addSeedURL(url);
            }
            try {
                corpora[index] = crawler.run();
            } catch (const NetworkUnavailableError& e) {
                LOG_ERROR("Network unavailable, aborting crawl: " + std::string(e.what()));
                aborted = true;
                throw;
            }
        }
    };

    const size_t taskCount = std::min(config_.maxConcurrentOrigins, groups.size());
    std::vector<std::future<void>> tasks;
    for (size_t i = 0; i < taskCount; ++i) {
        tasks.push_back(std::async(std::launch::async, worker));
    }
    // A NetworkUnavailableError rethrows here; the remaining futures block in their destructors
    for (auto& task : tasks) {
        task.get();
    }

    size_t seedsAttempted = 0;
    size_t seedsUnreachable = 0;
    for (const auto& corpus : corpora) {
        seedsAttempted += corpus.seedsAttempted;
        seedsUnreachable += corpus.seedsUnreachable;
    }
    if (seedsAttempted > 0 && seedsUnreachable == seedsAttempted) {
        LOG_ERROR("None of the " + std::to_string(seedsAttempted) + " seed host(s) could be resolved or connected to");
        throw NetworkUnavailableError("no seed host could be resolved or connected to; "
                                      "DNS or connectivity is unavailable");
    }

    result.finalState = CrawlState::COMPLETED;
    for (size_t i = 0; i < corpora.size(); ++i) {
        OriginCorpus& corpus = corpora[i];
        corpus.origin = groups[i].first;
        if (corpus.finalState == CrawlState::EXHAUSTED) {
            result.finalState = CrawlState::EXHAUSTED;
        }
        if (!corpus.text.empty()) {
            if (!result.corpus.empty()) result.corpus += "\n\n";
            result.corpus += corpus.text;
        }
    }

    std::istringstream words(result.corpus);
    std::string word;
    while (words >> word) {
        ++result.wordCount;
    }
    result.pagesCrawled = session.getPagesCrawled();
    result.fetchLog = session.getFetchLog();
    result.origins = std::move(corpora);

    LOG_INFO("Harvest of '" + topic + "' " + crawlStateName(result.finalState) + ": " +
             std::to_string(result.pagesCrawled) + " page fetch(es), " + std::to_string(result.wordCount) + " words");

    if (sink_) {
        for (const auto& corpus : result.origins) {
            sink_->store(topic, corpus);
        }
    }
    return result;
}

namespace topic_harvest {

HarvestResult crawl(const std::string& topic,
                    const std::vector<std::string>& seedUrls,
                    const CrawlConfig& config) {
    PageFetcher fetcher(config.connectTimeout, config.followRedirects, config.maxRedirects);
    fetcher.setVerifySSL(config.verifySSL);
    fetcher.setProxy(config.proxy);

    std::unique_ptr<BrowserlessClient> renderer;
    if (config.renderingEnabled) {
        renderer = std::make_unique<BrowserlessClient>(config.browserlessUrl);
    }

    HarvestEngine engine(config, FetchStrategyChain::createDefault(config, fetcher, renderer.get()));
    return engine.crawl(topic, seedUrls);
}

HarvestResult crawl(const std::string& topic,
                    const std::vector<std::string>& seedUrls,
                    size_t maxDepth,
                    size_t maxPages,
                    size_t perOriginCap) {
    CrawlConfig config = loadConfigFromEnvironment();
    config.maxDepth = maxDepth;
    config.maxPages = maxPages;
    config.perOriginCap = perOriginCap;
    return crawl(topic, seedUrls, config);
}

} // namespace topic_harvest
