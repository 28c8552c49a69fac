#include "Crawler.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlResolver.h"
#include <cctype>
#include <sstream>
#include <utility>

namespace {

size_t countWords(const std::string& text) {
    std::istringstream stream(text);
    size_t count = 0;
    std::string word;
    while (stream >> word) {
        ++count;
    }
    return count;
}

// Cut after the maxWords-th word, keeping the line structure before it
std::string truncateWords(const std::string& text, size_t maxWords) {
    size_t words = 0;
    bool inWord = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const bool space = std::isspace(static_cast<unsigned char>(text[i])) != 0;
        if (space && inWord && ++words == maxWords) {
            return text.substr(0, i);
        }
        inWord = !space;
    }
    return text;
}

} // namespace

Crawler::Crawler(std::string origin,
                 const CrawlConfig& config,
                 CrawlSession& session,
                 IdentityPool& identity,
                 const FetchStrategyChain& chain,
                 const TopicRelevanceFilter& filter)
    : origin_(std::move(origin))
    , config_(config)
    , session_(session)
    , identity_(identity)
    , chain_(chain)
    , filter_(filter)
    , extractor_(config.minBlockChars) {
}

void Crawler::addSeedURL(const std::string& url) {
    LOG_DEBUG("Adding seed URL for " + origin_ + ": " + url);
    frontier_.addURL(url, 0);
}

OriginCorpus Crawler::run() {
    LOG_INFO("Starting BFS for origin " + origin_ + " with " + std::to_string(frontier_.size()) + " seed(s)");
    state_ = CrawlState::RUNNING;

    while (state_ == CrawlState::RUNNING) {
        auto entry = frontier_.next();
        if (!entry) {
            state_ = CrawlState::COMPLETED;
            break;
        }

        if (!session_.markVisited(entry->url)) {
            LOG_TRACE("Already visited, discarding: " + entry->url);
            continue;
        }

        if (entry->depth > config_.maxDepth) {
            LOG_DEBUG("Depth " + std::to_string(entry->depth) + " exceeds limit, discarding: " + entry->url);
            continue;
        }

        if (!session_.canReserve(origin_)) {
            LOG_INFO("Budget exhausted for " + origin_ + " before fetching " + entry->url);
            state_ = CrawlState::EXHAUSTED;
            break;
        }

        FetchResult fetched = chain_.fetch(entry->url, session_, identity_);
        if (fetched.budgetExhausted) {
            LOG_INFO("Budget exhausted for " + origin_ + " while fetching " + entry->url);
            state_ = CrawlState::EXHAUSTED;
            break;
        }
        if (entry->depth == 0) {
            ++seedsAttempted_;
            if (!fetched.html && fetched.hostUnreachable) {
                ++seedsUnreachable_;
            }
        }
        if (!fetched.html) {
            continue;
        }

        processPage(*entry, fetched);
    }

    OriginCorpus corpus;
    corpus.origin = origin_;
    for (const auto& block : blocks_) {
        if (!corpus.text.empty()) corpus.text += "\n\n";
        corpus.text += block;
    }
    corpus.wordCount = countWords(corpus.text);
    corpus.pagesFetched = session_.getPagesFetched(origin_);
    corpus.pagesWithText = pagesWithText_;
    corpus.seedsAttempted = seedsAttempted_;
    corpus.seedsUnreachable = seedsUnreachable_;
    corpus.finalState = state_.load();

    LOG_INFO_STREAM("BFS for " << origin_ << " ended " << crawlStateName(corpus.finalState) << ": "
                    << corpus.pagesFetched << " fetch(es), " << corpus.wordCount << " words, "
                    << frontier_.totalQueued() << " URL(s) queued, " << frontier_.size() << " left");
    return corpus;
}

void Crawler::processPage(const FrontierEntry& entry, const FetchResult& fetched) {
    ExtractedPage page = extractor_.extract(*fetched.html, entry.url, fetched.servedFrom);
    LOG_DEBUG_STREAM("Extracted '" << page.title << "' from " << entry.url << " at depth " << entry.depth
                     << ": " << page.text.size() << " chars, " << page.links.size() << " same-origin links");

    std::string filtered = filter_.filterText(page.text);
    if (config_.maxWordsPerPage > 0 && countWords(filtered) > config_.maxWordsPerPage) {
        LOG_DEBUG("Truncating text of " + entry.url + " to " + std::to_string(config_.maxWordsPerPage) + " words");
        filtered = truncateWords(filtered, config_.maxWordsPerPage);
    }
    appendText(filtered);

    if (entry.depth < config_.maxDepth) {
        enqueueLinks(filter_.filterLinks(page.links), entry.depth + 1);
    }
}

void Crawler::appendText(const std::string& text) {
    if (!config_.deduplicateParagraphs) {
        if (!text.empty()) {
            blocks_.push_back(text);
            ++pagesWithText_;
        }
        return;
    }

    std::string block;
    for (const auto& paragraph : TopicRelevanceFilter::splitParagraphs(text)) {
        bool repeated = false;
        for (const auto& kept : keptParagraphs_) {
            if (TopicRelevanceFilter::isNearDuplicate(paragraph, kept, config_.nearDuplicateThreshold)) {
                repeated = true;
                break;
            }
        }
        if (repeated) {
            LOG_TRACE("Dropping repeated paragraph: " + paragraph.substr(0, 80));
            continue;
        }
        keptParagraphs_.push_back(paragraph);
        if (!block.empty()) block += '\n';
        block += paragraph;
    }

    if (!block.empty()) {
        blocks_.push_back(std::move(block));
        ++pagesWithText_;
    }
}

void Crawler::enqueueLinks(const std::vector<ExtractedLink>& links, size_t depth) {
    size_t added = 0;
    for (const auto& link : links) {
        if (session_.isVisited(link.url)) {
            continue;
        }
        if (!session_.hasOriginCapacity(topic_harvest::common::originOf(link.url))) {
            LOG_DEBUG("Origin cap reached, not queueing " + link.url);
            continue;
        }
        if (frontier_.addURL(link.url, depth)) {
            ++added;
        }
    }
    LOG_DEBUG("Queued " + std::to_string(added) + " of " + std::to_string(links.size()) +
              " relevant links at depth " + std::to_string(depth) + " for " + origin_);
}
