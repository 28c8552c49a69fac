#include "ConfigLoader.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlResolver.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace {

std::optional<long long> readInteger(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed != std::string(raw).size() || value < 0) {
            throw std::invalid_argument("trailing characters or negative value");
        }
        return value;
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Ignoring invalid ") + name + "='" + raw + "': " + e.what());
        return std::nullopt;
    }
}

std::optional<bool> readFlag(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) {
        return std::nullopt;
    }
    std::string value = raw;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    LOG_WARNING(std::string("Ignoring invalid ") + name + "='" + raw + "'");
    return std::nullopt;
}

} // namespace

CrawlConfig loadConfigFromEnvironment(const CrawlConfig& base) {
    CrawlConfig config = base;

    if (auto value = readInteger("HARVEST_MAX_DEPTH")) config.maxDepth = static_cast<size_t>(*value);
    if (auto value = readInteger("HARVEST_MAX_PAGES")) config.maxPages = static_cast<size_t>(*value);
    if (auto value = readInteger("HARVEST_PER_ORIGIN_CAP")) config.perOriginCap = static_cast<size_t>(*value);
    if (auto value = readInteger("HARVEST_PACE_MIN_MS")) config.paceMin = std::chrono::milliseconds(*value);
    if (auto value = readInteger("HARVEST_PACE_MAX_MS")) config.paceMax = std::chrono::milliseconds(*value);
    if (auto value = readInteger("HARVEST_MAX_WORDS_PER_PAGE")) config.maxWordsPerPage = static_cast<size_t>(*value);

    if (auto value = readInteger("SPA_RENDERING_TIMEOUT")) {
        config.renderTimeout = std::chrono::milliseconds(*value);
        LOG_INFO("Using SPA_RENDERING_TIMEOUT from environment: " + std::to_string(*value) + "ms");
    }

    if (auto value = readFlag("HARVEST_ARCHIVE_FALLBACK")) config.archiveFallbackEnabled = *value;
    if (auto value = readFlag("HARVEST_RENDERING")) config.renderingEnabled = *value;

    if (const char* browserless = std::getenv("BROWSERLESS_URL")) {
        if (*browserless) {
            config.browserlessUrl = browserless;
        }
    }

    if (const char* proxy = std::getenv("HARVEST_PROXY")) {
        config.proxy = proxy;
    }

    return config;
}

void validateConfig(const CrawlConfig& config) {
    if (config.maxPages == 0) {
        throw std::invalid_argument("maxPages must be at least 1");
    }
    if (config.perOriginCap == 0) {
        throw std::invalid_argument("perOriginCap must be at least 1");
    }
    if (config.maxSeedUrls == 0) {
        throw std::invalid_argument("maxSeedUrls must be at least 1");
    }
    if (config.maxConcurrentOrigins == 0) {
        throw std::invalid_argument("maxConcurrentOrigins must be at least 1");
    }
    if (config.paceMin.count() < 0 || config.paceMax < config.paceMin) {
        throw std::invalid_argument("pacing interval must satisfy 0 <= paceMin <= paceMax");
    }
    if (config.maxAttempts < 1) {
        throw std::invalid_argument("maxAttempts must be at least 1");
    }
    if (config.requestTimeout.count() <= 0 || config.renderTimeout.count() <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (config.maxPaceMultiplier < 1.0) {
        throw std::invalid_argument("maxPaceMultiplier must be at least 1");
    }
    if (config.nearDuplicateThreshold <= 0.0 || config.nearDuplicateThreshold > 1.0) {
        throw std::invalid_argument("nearDuplicateThreshold must be in (0, 1]");
    }
    if (config.renderingEnabled && !topic_harvest::common::parseUrl(config.browserlessUrl)) {
        throw std::invalid_argument("browserlessUrl is not an http(s) URL: " + config.browserlessUrl);
    }
}
