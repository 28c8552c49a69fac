#pragma once

#include <chrono>
#include <string>
#include <curl/curl.h>
#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"
#include "../../include/topic_harvest/crawler/models/FailureType.h"

class FailureClassifier {
public:
    /**
     * Classify a failed fetch attempt
     * @param httpCode HTTP status code (0 if the transfer never got a response)
     * @param curlCode CURL error code
     * @param errorMessage Error message string
     * @param config Crawl configuration with the retryable code sets
     * @return FailureType indicating how to handle this failure
     */
    static FailureType classifyFailure(int httpCode,
                                       CURLcode curlCode,
                                       const std::string& errorMessage,
                                       const CrawlConfig& config);

    /**
     * Check if a failure should be retried
     * @param failureType The type of failure
     * @param attempt Number of attempts already made (1-based)
     * @param maxAttempts Maximum attempts for one fetch
     */
    static bool shouldRetry(FailureType failureType, int attempt, int maxAttempts);

    /**
     * Exponential backoff delay before the next attempt:
     * base * multiplier^(attempt - 1), capped at config.maxRetryDelay
     * @param attempt Number of attempts already made (1-based)
     */
    static std::chrono::milliseconds calculateRetryDelay(int attempt,
                                                         const CrawlConfig& config,
                                                         FailureType failureType);

    // CURL errors meaning the network stack itself cannot work
    static bool isNetworkStackFailure(CURLcode curlCode);

    // CURL errors meaning the host could not be resolved or connected to at all
    static bool isUnreachableHost(CURLcode curlCode);

    static std::string getFailureTypeDescription(FailureType failureType);

private:
    static bool isPermanentHttpError(int httpCode);
    static bool isPermanentCurlError(CURLcode curlCode);
};
