#pragma once

#include <string>
#include <vector>
#include "FetchResult.h"

enum class CrawlState {
    IDLE,
    RUNNING,
    COMPLETED,
    EXHAUSTED
};

inline const char* crawlStateName(CrawlState state) {
    switch (state) {
        case CrawlState::IDLE: return "idle";
        case CrawlState::RUNNING: return "running";
        case CrawlState::COMPLETED: return "completed";
        case CrawlState::EXHAUSTED: return "exhausted";
        default: return "unknown";
    }
}

// Accumulated text of one origin's BFS
struct OriginCorpus {
    std::string origin;
    std::string text;
    size_t wordCount = 0;
    size_t pagesFetched = 0;
    size_t pagesWithText = 0;
    // Seeds the fetch chain ran for, and how many of those had an unreachable host
    size_t seedsAttempted = 0;
    size_t seedsUnreachable = 0;
    CrawlState finalState = CrawlState::IDLE;
};

struct HarvestResult {
    std::string topic;
    std::string corpus;
    size_t wordCount = 0;
    size_t pagesCrawled = 0;
    CrawlState finalState = CrawlState::IDLE;
    std::vector<OriginCorpus> origins;
    std::vector<FetchLogEntry> fetchLog;
};
