#pragma once

#include <string>
#include <vector>
#include "crawler/models/CrawlConfig.h"
#include "crawler/models/HarvestResult.h"

namespace topic_harvest {

/**
 * Harvest on-topic text starting from the given seed URLs.
 *
 * Builds the default fetch chain (direct, Browserless render, archived snapshot)
 * from the environment-adjusted default configuration; the explicit limits
 * override it.
 *
 * @throws NetworkUnavailableError when the network stack is unusable or every seed host is unreachable
 * @throws std::invalid_argument when the limits are impossible (zero pages)
 */
HarvestResult crawl(const std::string& topic,
                    const std::vector<std::string>& seedUrls,
                    size_t maxDepth = 2,
                    size_t maxPages = 20,
                    size_t perOriginCap = 5);

HarvestResult crawl(const std::string& topic,
                    const std::vector<std::string>& seedUrls,
                    const CrawlConfig& config);

} // namespace topic_harvest
