#include "TopicRelevanceFilter.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/Utf8.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <utility>

using topic_harvest::common::foldCase;

namespace {

std::set<std::string> wordSet(const std::string& text) {
    std::set<std::string> words;
    std::istringstream stream(foldCase(text));
    std::string word;
    while (stream >> word) {
        words.insert(word);
    }
    return words;
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

TopicRelevanceFilter::TopicRelevanceFilter(std::string topic)
    : topic_(std::move(topic))
    , loweredTopic_(foldCase(topic_)) {
}

bool TopicRelevanceFilter::mentionsTopic(const std::string& text) const {
    return foldCase(text).find(loweredTopic_) != std::string::npos;
}

std::vector<std::string> TopicRelevanceFilter::splitParagraphs(const std::string& text) {
    std::vector<std::string> paragraphs;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!isBlank(line)) {
            paragraphs.push_back(line);
        }
    }
    return paragraphs;
}

std::string TopicRelevanceFilter::filterText(const std::string& text) const {
    std::string kept;
    size_t total = 0;
    size_t matched = 0;
    for (const auto& paragraph : splitParagraphs(text)) {
        ++total;
        if (!mentionsTopic(paragraph)) continue;
        ++matched;
        if (!kept.empty()) kept += '\n';
        kept += paragraph;
    }

    if (matched == 0) {
        // Partial relevance beats no content
        LOG_DEBUG("No paragraph mentions '" + topic_ + "', keeping all " + std::to_string(total) + " paragraphs");
        return text;
    }

    LOG_DEBUG("Kept " + std::to_string(matched) + "/" + std::to_string(total) + " paragraphs mentioning '" + topic_ + "'");
    return kept;
}

std::vector<ExtractedLink> TopicRelevanceFilter::filterLinks(const std::vector<ExtractedLink>& links) const {
    std::vector<ExtractedLink> qualifying;
    for (const auto& link : links) {
        if (mentionsTopic(link.anchorText) || mentionsTopic(link.rawHref)) {
            qualifying.push_back(link);
        }
    }
    LOG_DEBUG(std::to_string(qualifying.size()) + "/" + std::to_string(links.size()) + " links mention '" + topic_ + "'");
    return qualifying;
}

bool TopicRelevanceFilter::isNearDuplicate(const std::string& a, const std::string& b, double threshold) {
    const auto wordsA = wordSet(a);
    const auto wordsB = wordSet(b);
    if (wordsA.empty() && wordsB.empty()) {
        return true;
    }

    size_t common = 0;
    for (const auto& word : wordsA) {
        common += wordsB.count(word);
    }
    const size_t unionSize = wordsA.size() + wordsB.size() - common;
    return static_cast<double>(common) / static_cast<double>(unionSize) > threshold;
}
