#pragma once

#include <string>
#include <vector>
#include <optional>
#include "../../../include/docs_fetch/crawler/models/PageResult.h"

namespace docs_fetch::crawler {

// Output of one extractor run over a fetched document
struct ExtractedPage {
    std::optional<std::string> title;
    // Cleaned and truncated main text
    std::string content;
    // Scored, in document order, not yet ranked
    std::vector<LinkCandidate> links;
    // Selector that supplied the main content, empty on the markup path
    std::string matchedSelector;
};

} // namespace docs_fetch::crawler
