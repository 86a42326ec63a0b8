#pragma once

#include <string>
#include <vector>
#include <optional>
#include "../../include/docs_fetch/crawler/models/PageResult.h"

namespace docs_fetch::crawler {

class LinkScorer {
public:
    /**
     * Relevance of a link: min(length / 10, 5), plus 5 inside the main content,
     * plus 2 per distinct informative term in the text
     * @param text Collapsed, trimmed anchor text
     * @param inMainContent Whether the anchor sits inside the selected main element
     */
    static double score(const std::string& text, bool inMainContent);

    /**
     * Turn a raw anchor into a candidate
     * @return nullopt for fragment-only, javascript:, mailto: and tel: hrefs,
     *         and for targets that do not resolve to http(s)
     */
    static std::optional<LinkCandidate> makeCandidate(const std::string& href,
                                                      const std::string& rawText,
                                                      const std::string& baseUrl,
                                                      bool inMainContent);

    // Navigation and utility labels (home, login, privacy, ...)
    static bool isBoilerplate(const std::string& text);

    /**
     * Drop boilerplate labels, stable sort by relevance descending,
     * remove duplicate URLs and keep the first maxLinks
     */
    static std::vector<LinkCandidate> rank(std::vector<LinkCandidate> links, size_t maxLinks);

    static const std::vector<std::string>& informativeTerms();
};

} // namespace docs_fetch::crawler
