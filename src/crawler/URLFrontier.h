#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

struct FrontierEntry {
    const std::string url;
    const size_t depth = 0;  // 0 = seed URL
};

// FIFO of URLs awaiting a fetch. Entries come out in insertion order, so
// depth order holds as long as callers enqueue at depth + 1.
class URLFrontier {
public:
    URLFrontier() = default;

    // Returns false when the URL is already queued
    bool addURL(const std::string& url, size_t depth);

    std::optional<FrontierEntry> next();

    size_t size() const;

    // Number of URLs ever accepted
    size_t totalQueued() const;

private:
    std::deque<FrontierEntry> queue_;
    std::unordered_set<std::string> queued_;
    mutable std::mutex mutex_;
};
