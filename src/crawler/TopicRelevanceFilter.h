#pragma once

#include <string>
#include <vector>
#include "ContentExtractor.h"

/**
 * Plain case-insensitive substring matching against the crawl topic.
 * Case folding covers Latin, Greek and Cyrillic letters.
 * Deterministic; no scoring.
 */
class TopicRelevanceFilter {
public:
    explicit TopicRelevanceFilter(std::string topic);

    /**
     * Keep the lines of text that mention the topic.
     * @return the matching lines, or the whole text when no line matches
     */
    std::string filterText(const std::string& text) const;

    // Links whose anchor text or raw href mention the topic, in input order
    std::vector<ExtractedLink> filterLinks(const std::vector<ExtractedLink>& links) const;

    bool mentionsTopic(const std::string& text) const;

    const std::string& topic() const { return topic_; }

    // Jaccard similarity of the lower-cased word sets exceeds the threshold
    static bool isNearDuplicate(const std::string& a, const std::string& b, double threshold = 0.8);

    static std::vector<std::string> splitParagraphs(const std::string& text);

private:
    std::string topic_;
    std::string loweredTopic_;
};
