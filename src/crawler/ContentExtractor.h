#pragma once

#include <string>
#include <vector>
#include <optional>
#include <gumbo.h>
#include "models/ExtractedPage.h"

namespace docs_fetch::crawler {

class HtmlDocument;

// DOM-based extraction: main-content selection, cleaned text, scored links
class ContentExtractor {
public:
    /**
     * @param maxContentLength Content bound in code points before the truncation marker
     * @param mainContentThreshold Text length an element must exceed to win the selector scan
     */
    ContentExtractor(size_t maxContentLength = 10000, size_t mainContentThreshold = 200);

    // Parse html fetched from pageUrl (the final URL after redirects)
    ExtractedPage extract(const std::string& html, const std::string& pageUrl) const;

    // Cleaned, untruncated text of the main-content element
    std::string extractText(const std::string& html) const;

    // Ordered main-content selectors, body last
    static const std::vector<std::string>& mainContentSelectors();

    /**
     * Title derived from the last path segment of url: '_' and '-' become spaces,
     * a file extension is dropped and camelCase is split. nullopt for bare hosts.
     */
    static std::optional<std::string> titleFromUrl(const std::string& url);

private:
    struct MainContent {
        const GumboNode* node = nullptr;
        std::string text;            // Cleaned
        std::string selector;
    };

    MainContent selectMainContent(const HtmlDocument& document) const;

    size_t maxContentLength;
    size_t mainContentThreshold;
};

} // namespace docs_fetch::crawler
