#include "ArchiveFetchStrategy.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlResolver.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ArchiveFetchStrategy::ArchiveFetchStrategy(HttpTransport& transport, const CrawlConfig& config)
    : transport_(transport)
    , lookupEndpoint_(config.archiveLookupEndpoint)
    , snapshotEndpoint_(config.archiveSnapshotEndpoint)
    , timeout_(config.requestTimeout) {
    if (!snapshotEndpoint_.empty() && snapshotEndpoint_.back() != '/') {
        snapshotEndpoint_ += '/';
    }
}

std::string ArchiveFetchStrategy::lookupUrl(const std::string& url) const {
    return lookupEndpoint_ + "?url=" + topic_harvest::common::percentEncode(url) + "&collection=web&output=json";
}

std::string ArchiveFetchStrategy::snapshotUrl(const std::string& timestamp, const std::string& url) const {
    return snapshotEndpoint_ + timestamp + "/" + url;
}

std::optional<std::string> ArchiveFetchStrategy::parseLastTimestamp(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }

    auto it = parsed.find("last_ts");
    if (it == parsed.end() || it->is_null()) {
        return std::nullopt;
    }

    std::string timestamp;
    if (it->is_string()) {
        timestamp = it->get<std::string>();
    } else if (it->is_number_unsigned() || it->is_number_integer()) {
        timestamp = std::to_string(it->get<long long>());
    } else {
        return std::nullopt;
    }

    if (timestamp.empty() ||
        !std::all_of(timestamp.begin(), timestamp.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return timestamp;
}

StrategyOutcome ArchiveFetchStrategy::attempt(FetchAttemptContext& context) {
    // No point asking the index when the snapshot could not be paid for
    if (!context.canReserve() && !context.beginAttempt(kind())) {
        return StrategyOutcome::failed("budget exhausted");
    }

    const std::string lookup = lookupUrl(context.url());
    LOG_INFO("Looking up archived snapshot of " + context.url());
    context.pace();
    PageFetchResult index = transport_.get(lookup, context.headers(), timeout_);
    if (index.statusCode != 200) {
        const std::string error = "snapshot index lookup failed: " +
            (index.errorMessage.empty() ? "HTTP " + std::to_string(index.statusCode) : index.errorMessage);
        LOG_WARNING(error + " for " + context.url());
        return StrategyOutcome::failed(error, index.statusCode);
    }

    auto timestamp = parseLastTimestamp(index.content);
    if (!timestamp) {
        LOG_INFO("No archived snapshot for " + context.url());
        return StrategyOutcome::failed("no archived snapshot", index.statusCode, FailureType::PERMANENT);
    }

    if (!context.beginAttempt(kind())) {
        return StrategyOutcome::failed("budget exhausted");
    }

    const std::string snapshot = snapshotUrl(*timestamp, context.url());
    LOG_INFO("Fetching archived snapshot " + snapshot);
    PageFetchResult response = transport_.get(snapshot, context.headers(), timeout_);
    if (response.statusCode == 200 && !isHtmlContentType(response.contentType)) {
        LOG_WARNING("Archived snapshot of " + context.url() + " is not HTML (" + response.contentType + ")");
        return StrategyOutcome::failed("non-HTML snapshot: " + response.contentType,
                                       response.statusCode, FailureType::PERMANENT);
    }

    if (response.statusCode == 200 && !response.content.empty()) {
        StrategyOutcome outcome = StrategyOutcome::succeeded(std::move(response.content));
        outcome.servedFrom = snapshot;
        return outcome;
    }

    const std::string error = response.errorMessage.empty()
        ? "snapshot fetch returned HTTP " + std::to_string(response.statusCode)
        : response.errorMessage;
    LOG_WARNING("Archived snapshot fetch failed for " + context.url() + ": " + error);
    return StrategyOutcome::failed(error, response.statusCode);
}
