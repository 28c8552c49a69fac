#pragma once

#include <optional>
#include <string>

enum class FetchStrategyKind {
    NONE,
    DIRECT,
    RENDERED,
    ARCHIVED
};

inline const char* fetchStrategyName(FetchStrategyKind kind) {
    switch (kind) {
        case FetchStrategyKind::DIRECT: return "direct";
        case FetchStrategyKind::RENDERED: return "rendered";
        case FetchStrategyKind::ARCHIVED: return "archived";
        default: return "none";
    }
}

// Outcome of running the whole fallback chain for one URL
struct FetchResult {
    std::string url;
    std::string origin;
    std::optional<std::string> html;
    // Address the html was served from when it differs from url (archived snapshots)
    std::string servedFrom;
    FetchStrategyKind strategyUsed = FetchStrategyKind::NONE;
    bool budgetExhausted = false;
    // The direct step could not resolve or connect to the host
    bool hostUnreachable = false;
};

// One budgeted network fetch, recorded when the budget unit is reserved
struct FetchLogEntry {
    std::string url;
    std::string origin;
    FetchStrategyKind strategy = FetchStrategyKind::NONE;
};
