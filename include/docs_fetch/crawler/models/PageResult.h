#pragma once

#include <string>
#include <vector>
#include <optional>

namespace docs_fetch::crawler {

struct LinkCandidate {
    // Absolute, resolved against the page base
    std::string url;
    std::string text;
    // Heuristic, not normalized; only the ordering matters
    double relevance = 0.0;
    bool inMainContent = false;
};

struct PageResult {
    std::string url;
    std::optional<std::string> title;
    // Bounded by ExploreConfig::maxContentLength plus the truncation marker
    std::string content;
    std::vector<LinkCandidate> links;
};

} // namespace docs_fetch::crawler
