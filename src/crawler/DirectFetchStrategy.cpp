#include "DirectFetchStrategy.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <thread>

DirectFetchStrategy::DirectFetchStrategy(HttpTransport& transport, const CrawlConfig& config)
    : transport_(transport), config_(config) {
}

StrategyOutcome DirectFetchStrategy::attempt(FetchAttemptContext& context) {
    if (!context.beginAttempt(kind())) {
        return StrategyOutcome::failed("budget exhausted");
    }

    const int maxAttempts = std::max(1, config_.maxAttempts);
    for (int attempt = 1; ; ++attempt) {
        LOG_INFO("Direct fetch attempt " + std::to_string(attempt) + "/" + std::to_string(maxAttempts) +
                 " for " + context.url());

        // New identity on every try; a retried bot wall sees a different browser
        PageFetchResult response = transport_.get(context.url(), context.headers(), config_.requestTimeout);

        if (response.statusCode == 200 && !isHtmlContentType(response.contentType)) {
            LOG_WARNING("Content is not HTML (" + response.contentType + "), skipping " + context.url());
            context.reportOutcome(true);
            return StrategyOutcome::failed("non-HTML content: " + response.contentType,
                                           response.statusCode, FailureType::PERMANENT);
        }

        if (response.statusCode == 200 && !response.content.empty()) {
            LOG_DEBUG("Direct fetch succeeded for " + context.url() + " (" +
                      std::to_string(response.content.size()) + " bytes)");
            context.reportOutcome(true);
            return StrategyOutcome::succeeded(std::move(response.content), response.statusCode);
        }

        FailureType failureType;
        std::string error;
        if (response.statusCode == 200) {
            failureType = FailureType::PERMANENT;
            error = "empty body";
        } else if (response.statusCode >= 200 && response.statusCode < 300) {
            failureType = FailureType::PERMANENT;
            error = "unexpected status " + std::to_string(response.statusCode);
        } else {
            failureType = FailureClassifier::classifyFailure(response.statusCode, response.curlCode,
                                                             response.errorMessage, config_);
            error = response.errorMessage.empty()
                ? "HTTP " + std::to_string(response.statusCode)
                : response.errorMessage;
        }

        // Only answers that look like throttling slow the origin down
        if (failureType == FailureType::TEMPORARY || failureType == FailureType::RATE_LIMITED) {
            context.reportOutcome(false);
        }

        if (!FailureClassifier::shouldRetry(failureType, attempt, maxAttempts)) {
            LOG_WARNING("Direct fetch failed for " + context.url() + " after " + std::to_string(attempt) +
                        " attempt(s): " + error + " (" + FailureClassifier::getFailureTypeDescription(failureType) + ")");
            StrategyOutcome outcome = StrategyOutcome::failed(error, response.statusCode, failureType);
            outcome.curlCode = response.curlCode;
            return outcome;
        }

        auto delay = FailureClassifier::calculateRetryDelay(attempt, config_, failureType);
        LOG_INFO("Retrying direct fetch of " + context.url() + " in " + std::to_string(delay.count()) +
                 "ms: " + error);
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        context.pace();
    }
}
