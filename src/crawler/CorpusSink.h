#pragma once

#include <string>
#include "../../include/topic_harvest/crawler/models/HarvestResult.h"

// Consumer of harvested text, handed each origin's corpus once the crawl finished
class CorpusSink {
public:
    virtual ~CorpusSink() = default;
    virtual void store(const std::string& topic, const OriginCorpus& corpus) = 0;
};
