#pragma once

#include <string>
#include <vector>
#include <gumbo.h>

struct ExtractedLink {
    std::string url;         // Resolved and normalized target
    std::string anchorText;  // Collapsed text of the <a> element
    std::string rawHref;     // href exactly as written in the page
};

struct ExtractedPage {
    std::string title;
    std::string text;
    std::vector<ExtractedLink> links;
};

/**
 * Main-content text and same-origin links of an HTML page.
 * Navigation, script and other chrome regions are ignored for both.
 */
class ContentExtractor {
public:
    explicit ContentExtractor(size_t minBlockChars = 200);

    /**
     * @param html Raw or rendered markup
     * @param pageUrl URL the page belongs to; links must share its origin
     * @param baseUrl URL relative links resolve against, when it differs from pageUrl.
     *        For an archived snapshot, links into the archive are mapped back to the original site.
     */
    ExtractedPage extract(const std::string& html,
                          const std::string& pageUrl,
                          const std::string& baseUrl = "") const;

    // Main-content text only; lines correspond to block elements
    std::string extractText(const std::string& html) const;

    std::vector<ExtractedLink> extractLinks(const std::string& html,
                                            const std::string& pageUrl,
                                            const std::string& baseUrl = "") const;

private:
    std::string mainText(const GumboNode* root) const;
    std::string documentTitle(const GumboNode* root) const;
    void collectLinks(const GumboNode* node, const std::string& pageOrigin,
                      const std::string& baseUrl, std::vector<ExtractedLink>& links,
                      std::vector<std::string>& seen) const;

    size_t minBlockChars_;
};
