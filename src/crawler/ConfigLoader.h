#pragma once

#include "../../include/topic_harvest/crawler/models/CrawlConfig.h"

// Copy of base with overrides from HARVEST_* / BROWSERLESS_URL / SPA_RENDERING_TIMEOUT.
// Unparsable values are logged and ignored.
CrawlConfig loadConfigFromEnvironment(const CrawlConfig& base = CrawlConfig{});

// Throws std::invalid_argument for configurations the crawler cannot run with
void validateConfig(const CrawlConfig& config);
