#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>

FailureType FailureClassifier::classifyFailure(int httpCode,
                                               CURLcode curlCode,
                                               const std::string& errorMessage,
                                               const CrawlConfig& config) {
    LOG_DEBUG("Classifying failure - HTTP: " + std::to_string(httpCode) +
              ", CURL: " + std::to_string(static_cast<int>(curlCode)) +
              ", Error: " + errorMessage);

    if (httpCode == 429) {
        LOG_DEBUG("Classified as RATE_LIMITED (HTTP 429)");
        return FailureType::RATE_LIMITED;
    }

    if (httpCode > 0) {
        // Configured codes win over the permanent list: 403 is often a bot wall, not a real denial
        if (config.retryableHttpCodes.count(httpCode) > 0) {
            LOG_DEBUG("Classified as TEMPORARY (retryable HTTP " + std::to_string(httpCode) + ")");
            return FailureType::TEMPORARY;
        }
        if (isPermanentHttpError(httpCode)) {
            LOG_DEBUG("Classified as PERMANENT (HTTP " + std::to_string(httpCode) + ")");
            return FailureType::PERMANENT;
        }
        if (httpCode >= 500 && httpCode < 600) {
            LOG_DEBUG("Classified as TEMPORARY (5xx server error)");
            return FailureType::TEMPORARY;
        }
    }

    if (curlCode != CURLE_OK) {
        if (config.retryableCurlCodes.count(curlCode) > 0) {
            LOG_DEBUG("Classified as TEMPORARY (retryable CURL error " + std::to_string(static_cast<int>(curlCode)) + ")");
            return FailureType::TEMPORARY;
        }
        if (isPermanentCurlError(curlCode)) {
            LOG_DEBUG("Classified as PERMANENT (CURL error " + std::to_string(static_cast<int>(curlCode)) + ")");
            return FailureType::PERMANENT;
        }
    }

    std::string lowerError = errorMessage;
    std::transform(lowerError.begin(), lowerError.end(), lowerError.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerError.find("name or service not known") != std::string::npos ||
        lowerError.find("no such host is known") != std::string::npos ||
        lowerError.find("nodename nor servname provided") != std::string::npos) {
        LOG_DEBUG("Classified as PERMANENT (DNS resolution failed)");
        return FailureType::PERMANENT;
    }

    if (lowerError.find("timeout") != std::string::npos ||
        lowerError.find("timed out") != std::string::npos ||
        lowerError.find("connection") != std::string::npos) {
        LOG_DEBUG("Classified as TEMPORARY (network/timeout issue)");
        return FailureType::TEMPORARY;
    }

    LOG_DEBUG("Classified as UNKNOWN (unrecognized error pattern)");
    return FailureType::UNKNOWN;
}

bool FailureClassifier::shouldRetry(FailureType failureType, int attempt, int maxAttempts) {
    if (failureType == FailureType::PERMANENT || attempt >= maxAttempts) {
        return false;
    }

    if (failureType == FailureType::UNKNOWN) {
        // Unclassified failures get half the attempts
        return attempt < std::max(1, maxAttempts / 2);
    }

    return true;
}

std::chrono::milliseconds FailureClassifier::calculateRetryDelay(int attempt,
                                                                 const CrawlConfig& config,
                                                                 FailureType failureType) {
    std::chrono::milliseconds baseDelay = config.baseRetryDelay;
    if (failureType == FailureType::RATE_LIMITED) {
        baseDelay = std::max(baseDelay, config.rateLimitDelay);
    }

    double multiplier = std::pow(config.backoffMultiplier, std::max(0, attempt - 1));
    auto calculatedDelay = std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(baseDelay.count()) * multiplier));
    auto finalDelay = std::min(calculatedDelay, config.maxRetryDelay);

    LOG_DEBUG("Retry delay after attempt " + std::to_string(attempt) + ": " +
              std::to_string(finalDelay.count()) + "ms (type: " +
              getFailureTypeDescription(failureType) + ")");
    return finalDelay;
}

bool FailureClassifier::isNetworkStackFailure(CURLcode curlCode) {
    return curlCode == CURLE_FAILED_INIT || curlCode == CURLE_OUT_OF_MEMORY;
}

bool FailureClassifier::isUnreachableHost(CURLcode curlCode) {
    return curlCode == CURLE_COULDNT_RESOLVE_HOST || curlCode == CURLE_COULDNT_CONNECT;
}

std::string FailureClassifier::getFailureTypeDescription(FailureType failureType) {
    switch (failureType) {
        case FailureType::TEMPORARY: return "TEMPORARY";
        case FailureType::RATE_LIMITED: return "RATE_LIMITED";
        case FailureType::PERMANENT: return "PERMANENT";
        case FailureType::UNKNOWN: return "UNKNOWN";
        default: return "INVALID";
    }
}

bool FailureClassifier::isPermanentHttpError(int httpCode) {
    switch (httpCode) {
        case 400: case 401: case 403: case 404: case 405: case 406:
        case 407: case 409: case 410: case 411: case 412: case 413:
        case 414: case 415: case 416: case 417: case 421: case 422:
        case 423: case 424: case 426: case 428: case 431: case 451:
            return true;
        default:
            return false;
    }
}

bool FailureClassifier::isPermanentCurlError(CURLcode curlCode) {
    switch (curlCode) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_FAILED_INIT:
        case CURLE_URL_MALFORMAT:
        case CURLE_NOT_BUILT_IN:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_BAD_FUNCTION_ARGUMENT:
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_UNKNOWN_OPTION:
        case CURLE_OUT_OF_MEMORY:
            return true;
        default:
            return false;
    }
}
