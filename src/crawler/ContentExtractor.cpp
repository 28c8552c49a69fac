#include "ContentExtractor.h"
#include "../../include/Logger.h"
#include "../../include/topic_harvest/common/UrlResolver.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>

namespace {

using GumboOutputPtr = std::unique_ptr<GumboOutput, void (*)(GumboOutput*)>;

GumboOutputPtr parseHtml(const std::string& html) {
    return GumboOutputPtr(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()),
                          [](GumboOutput* output) { gumbo_destroy_output(&kGumboDefaultOptions, output); });
}

bool isStripped(const GumboNode* node) {
    if (node->type == GUMBO_NODE_TEMPLATE) {
        return true;
    }
    if (node->type != GUMBO_NODE_ELEMENT) {
        return false;
    }
    switch (node->v.element.tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_ASIDE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_TEMPLATE:
            return true;
        default:
            return false;
    }
}

bool isBlock(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_ADDRESS: case GUMBO_TAG_ARTICLE: case GUMBO_TAG_BLOCKQUOTE:
        case GUMBO_TAG_BODY: case GUMBO_TAG_BR: case GUMBO_TAG_CAPTION:
        case GUMBO_TAG_DD: case GUMBO_TAG_DETAILS: case GUMBO_TAG_DIV:
        case GUMBO_TAG_DL: case GUMBO_TAG_DT: case GUMBO_TAG_FIELDSET:
        case GUMBO_TAG_FIGCAPTION: case GUMBO_TAG_FIGURE: case GUMBO_TAG_FORM:
        case GUMBO_TAG_H1: case GUMBO_TAG_H2: case GUMBO_TAG_H3:
        case GUMBO_TAG_H4: case GUMBO_TAG_H5: case GUMBO_TAG_H6:
        case GUMBO_TAG_HR: case GUMBO_TAG_HTML: case GUMBO_TAG_LI:
        case GUMBO_TAG_MAIN: case GUMBO_TAG_OL: case GUMBO_TAG_P:
        case GUMBO_TAG_PRE: case GUMBO_TAG_SECTION: case GUMBO_TAG_SUMMARY:
        case GUMBO_TAG_TABLE: case GUMBO_TAG_TD: case GUMBO_TAG_TH:
        case GUMBO_TAG_TITLE: case GUMBO_TAG_TR: case GUMBO_TAG_UL:
            return true;
        default:
            return false;
    }
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Builds text with one line per block element and single spaces between words
class TextCollector {
public:
    void addText(const char* text) {
        for (const char* p = text; *p; ++p) {
            unsigned char c = static_cast<unsigned char>(*p);
            if (std::isspace(c)) {
                pendingSpace_ = true;
                continue;
            }
            if (pendingSpace_ && !line_.empty()) {
                line_ += ' ';
            }
            pendingSpace_ = false;
            line_ += static_cast<char>(c);
        }
    }

    void addSpace() { pendingSpace_ = true; }

    void breakLine() {
        if (!line_.empty()) {
            if (!out_.empty()) out_ += '\n';
            out_ += line_;
            line_.clear();
        }
        pendingSpace_ = false;
    }

    std::string finish() {
        breakLine();
        return out_;
    }

private:
    std::string out_;
    std::string line_;
    bool pendingSpace_ = false;
};

void collectText(const GumboNode* node, TextCollector& collector) {
    if (isStripped(node)) {
        return;
    }
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
            collector.addText(node->v.text.text);
            return;
        case GUMBO_NODE_WHITESPACE:
            collector.addSpace();
            return;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_DOCUMENT:
            break;
        default:
            return;
    }

    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
        ? &node->v.document.children
        : &node->v.element.children;
    const bool block = node->type == GUMBO_NODE_ELEMENT && isBlock(node->v.element.tag);

    if (block) collector.breakLine();
    for (unsigned int i = 0; i < children->length; ++i) {
        collectText(static_cast<const GumboNode*>(children->data[i]), collector);
    }
    if (block) collector.breakLine();
}

std::string textOf(const GumboNode* node) {
    TextCollector collector;
    collectText(node, collector);
    return collector.finish();
}

bool hasClassContaining(const GumboNode* node, const std::vector<std::string>& needles) {
    const GumboAttribute* cls = gumbo_get_attribute(&node->v.element.attributes, "class");
    if (!cls) {
        return false;
    }
    const std::string value = toLower(cls->value);
    return std::any_of(needles.begin(), needles.end(),
                       [&value](const std::string& needle) { return value.find(needle) != std::string::npos; });
}

using Selector = std::function<bool(const GumboNode*)>;

// Outermost matches in document order; stripped regions are not searched
void selectAll(const GumboNode* node, const Selector& selector, std::vector<const GumboNode*>& matches) {
    if (node->type != GUMBO_NODE_ELEMENT || isStripped(node)) {
        return;
    }
    if (selector(node)) {
        matches.push_back(node);
        return;
    }
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        selectAll(static_cast<const GumboNode*>(children.data[i]), selector, matches);
    }
}

void findLargestBlock(const GumboNode* node, const GumboNode*& best, size_t& bestLength) {
    if (node->type != GUMBO_NODE_ELEMENT || isStripped(node)) {
        return;
    }
    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_DIV || tag == GUMBO_TAG_SECTION || tag == GUMBO_TAG_TD) {
        size_t length = textOf(node).size();
        if (length > bestLength) {
            best = node;
            bestLength = length;
        }
    }
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        findLargestBlock(static_cast<const GumboNode*>(children.data[i]), best, bestLength);
    }
}

bool isSkippedHref(const std::string& href) {
    if (href.empty() || href[0] == '#') {
        return true;
    }
    const std::string lower = toLower(href.substr(0, 11));
    return lower.rfind("javascript:", 0) == 0 ||
           lower.rfind("mailto:", 0) == 0 ||
           lower.rfind("tel:", 0) == 0 ||
           lower.rfind("data:", 0) == 0;
}

// Links inside archived snapshots point back into the archive; follow them to the original site
std::optional<std::string> resolveLink(const std::string& baseUrl, const std::string& rawHref) {
    using namespace topic_harvest::common;

    auto resolved = resolveUrl(baseUrl, rawHref);
    if (!resolved) {
        return std::nullopt;
    }
    if (auto original = unwrapArchiveUrl(*resolved)) {
        return original;
    }
    auto archivedBase = unwrapArchiveUrl(baseUrl);
    if (archivedBase && hostOf(*resolved) == hostOf(baseUrl)) {
        return resolveUrl(*archivedBase, rawHref);
    }
    return resolved;
}

} // namespace

ContentExtractor::ContentExtractor(size_t minBlockChars)
    : minBlockChars_(minBlockChars) {
}

ExtractedPage ContentExtractor::extract(const std::string& html,
                                        const std::string& pageUrl,
                                        const std::string& baseUrl) const {
    ExtractedPage page;
    auto output = parseHtml(html);
    if (!output) {
        LOG_ERROR("Failed to parse HTML for " + pageUrl);
        return page;
    }

    page.title = documentTitle(output->root);
    page.text = mainText(output->root);

    std::vector<std::string> seen;
    collectLinks(output->root, topic_harvest::common::originOf(pageUrl),
                 baseUrl.empty() ? pageUrl : baseUrl, page.links, seen);

    LOG_DEBUG("Extracted " + std::to_string(page.text.size()) + " chars and " +
              std::to_string(page.links.size()) + " same-origin links from " + pageUrl);
    return page;
}

std::string ContentExtractor::extractText(const std::string& html) const {
    auto output = parseHtml(html);
    if (!output) {
        LOG_ERROR("Failed to parse HTML for text extraction");
        return "";
    }
    return mainText(output->root);
}

std::vector<ExtractedLink> ContentExtractor::extractLinks(const std::string& html,
                                                          const std::string& pageUrl,
                                                          const std::string& baseUrl) const {
    std::vector<ExtractedLink> links;
    auto output = parseHtml(html);
    if (!output) {
        LOG_ERROR("Failed to parse HTML for link extraction");
        return links;
    }
    std::vector<std::string> seen;
    collectLinks(output->root, topic_harvest::common::originOf(pageUrl),
                 baseUrl.empty() ? pageUrl : baseUrl, links, seen);
    return links;
}

std::string ContentExtractor::mainText(const GumboNode* root) const {
    static const std::vector<std::string> contentClasses = {"content", "post", "article"};
    static const std::vector<std::pair<std::string, Selector>> selectors = {
        {"article", [](const GumboNode* n) { return n->v.element.tag == GUMBO_TAG_ARTICLE; }},
        {"main", [](const GumboNode* n) { return n->v.element.tag == GUMBO_TAG_MAIN; }},
        {"[class*=content|post|article]", [](const GumboNode* n) { return hasClassContaining(n, contentClasses); }},
        {"body", [](const GumboNode* n) { return n->v.element.tag == GUMBO_TAG_BODY; }}
    };

    for (const auto& [name, selector] : selectors) {
        std::vector<const GumboNode*> matches;
        selectAll(root, selector, matches);

        std::string text;
        for (const GumboNode* match : matches) {
            std::string block = textOf(match);
            if (block.empty()) continue;
            if (!text.empty()) text += '\n';
            text += block;
        }
        if (!text.empty()) {
            LOG_TRACE("Main content found with selector " + name + " (" + std::to_string(matches.size()) + " matches)");
            return text;
        }
    }

    const GumboNode* largest = nullptr;
    size_t largestLength = 0;
    findLargestBlock(root, largest, largestLength);
    if (largest && largestLength > minBlockChars_) {
        LOG_TRACE("Main content taken from largest block (" + std::to_string(largestLength) + " chars)");
        return textOf(largest);
    }

    return textOf(root);
}

std::string ContentExtractor::documentTitle(const GumboNode* root) const {
    std::vector<const GumboNode*> titles;
    selectAll(root, [](const GumboNode* n) { return n->v.element.tag == GUMBO_TAG_TITLE; }, titles);
    return titles.empty() ? "" : textOf(titles.front());
}

void ContentExtractor::collectLinks(const GumboNode* node, const std::string& pageOrigin,
                                    const std::string& baseUrl, std::vector<ExtractedLink>& links,
                                    std::vector<std::string>& seen) const {
    if (node->type != GUMBO_NODE_ELEMENT || isStripped(node)) {
        return;
    }

    if (node->v.element.tag == GUMBO_TAG_A) {
        const GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            const std::string rawHref = href->value;
            if (!isSkippedHref(rawHref)) {
                auto resolved = resolveLink(baseUrl, rawHref);
                auto normalized = resolved ? topic_harvest::common::normalizeUrl(*resolved) : std::nullopt;
                if (!normalized) {
                    LOG_DEBUG("Dropping unresolvable link: " + rawHref);
                } else if (topic_harvest::common::originOf(*normalized) != pageOrigin) {
                    LOG_TRACE("Dropping off-origin link: " + *normalized);
                } else if (std::find(seen.begin(), seen.end(), *normalized) == seen.end()) {
                    seen.push_back(*normalized);
                    links.push_back(ExtractedLink{*normalized, textOf(node), rawHref});
                }
            }
        }
    }

    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        collectLinks(static_cast<const GumboNode*>(children.data[i]), pageOrigin, baseUrl, links, seen);
    }
}
