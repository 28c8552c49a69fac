#include "FetchStrategy.h"
#include <algorithm>
#include <cctype>

bool isHtmlContentType(const std::string& contentType) {
    std::string mediaType = contentType.substr(0, contentType.find(';'));
    mediaType.erase(std::remove_if(mediaType.begin(), mediaType.end(),
                                   [](unsigned char c) { return std::isspace(c); }),
                    mediaType.end());
    std::transform(mediaType.begin(), mediaType.end(), mediaType.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return mediaType.empty() || mediaType == "text/html" || mediaType == "application/xhtml+xml";
}

FetchAttemptContext::FetchAttemptContext(CrawlSession& session, IdentityPool& identity,
                                         std::string url, std::string origin, std::string host)
    : session_(session)
    , identity_(identity)
    , url_(std::move(url))
    , origin_(std::move(origin))
    , host_(std::move(host)) {
}

bool FetchAttemptContext::beginAttempt(FetchStrategyKind kind) {
    if (!session_.reserveAttempt(FetchLogEntry{url_, origin_, kind})) {
        budgetDenied_ = true;
        return false;
    }
    ++reservations_;
    identity_.pace(origin_);
    return true;
}

void FetchAttemptContext::pace() {
    identity_.pace(origin_);
}

void FetchAttemptContext::reportOutcome(bool success) {
    identity_.reportOutcome(origin_, success);
}

bool FetchAttemptContext::canReserve() const {
    return session_.canReserve(origin_);
}

HeaderList FetchAttemptContext::headers() {
    return identity_.nextHeaders(host_);
}
