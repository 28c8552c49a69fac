#include "FetchStrategyChain.h"
#include "ArchiveFetchStrategy.h"
#include "DirectFetchStrategy.h"
#include "FailureClassifier.h"
#include "RenderFetchStrategy.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlResolver.h"

void FetchStrategyChain::addStrategy(std::unique_ptr<FetchStrategy> strategy) {
    if (strategy) {
        strategies_.push_back(std::move(strategy));
    }
}

std::vector<FetchStrategyKind> FetchStrategyChain::kinds() const {
    std::vector<FetchStrategyKind> result;
    for (const auto& strategy : strategies_) {
        result.push_back(strategy->kind());
    }
    return result;
}

FetchResult FetchStrategyChain::fetch(const std::string& url, CrawlSession& session, IdentityPool& identity) const {
    FetchResult result;
    result.url = url;
    result.origin = topic_harvest::common::originOf(url);
    const std::string host = topic_harvest::common::hostOf(url);

    for (const auto& strategy : strategies_) {
        FetchAttemptContext context(session, identity, url, result.origin, host);
        StrategyOutcome outcome;
        try {
            outcome = strategy->attempt(context);
        } catch (const NetworkUnavailableError&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARNING("Strategy " + strategy->name() + " threw for " + url + ": " + e.what());
            outcome = StrategyOutcome::failed(e.what());
        }

        if (context.budgetDenied()) {
            LOG_INFO("Fetch chain for " + url + " stopped at " + strategy->name() + ": budget exhausted");
            result.budgetExhausted = true;
            return result;
        }

        if (outcome.success && !outcome.html.empty()) {
            LOG_INFO("Fetched " + url + " via " + strategy->name());
            result.html = std::move(outcome.html);
            result.servedFrom = std::move(outcome.servedFrom);
            result.strategyUsed = strategy->kind();
            return result;
        }

        if (strategy->kind() == FetchStrategyKind::DIRECT && FailureClassifier::isUnreachableHost(outcome.curlCode)) {
            result.hostUnreachable = true;
        }

        LOG_INFO("Strategy " + strategy->name() + " failed for " + url +
                 (outcome.error.empty() ? "" : ": " + outcome.error) + ", falling back");
    }

    LOG_WARNING("All fetch strategies failed for " + url);
    return result;
}

FetchStrategyChain FetchStrategyChain::createDefault(const CrawlConfig& config,
                                                     HttpTransport& transport,
                                                     PageRenderer* renderer) {
    FetchStrategyChain chain;
    chain.addStrategy(std::make_unique<DirectFetchStrategy>(transport, config));
    if (config.renderingEnabled && renderer) {
        chain.addStrategy(std::make_unique<RenderFetchStrategy>(*renderer, config));
    }
    if (config.archiveFallbackEnabled) {
        chain.addStrategy(std::make_unique<ArchiveFetchStrategy>(transport, config));
    }
    return chain;
}
