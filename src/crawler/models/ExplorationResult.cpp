#include "../../../include/docs_fetch/crawler/models/ExplorationResult.h"

namespace docs_fetch::crawler {

std::string explorationStateName(ExplorationState state) {
    switch (state) {
        case ExplorationState::COMPLETED: return "completed";
        case ExplorationState::TIMED_OUT: return "timed_out";
        case ExplorationState::FAILED: return "failed";
    }
    return "unknown";
}

nlohmann::json toJson(const PageResult& page) {
    nlohmann::json links = nlohmann::json::array();
    for (const auto& link : page.links) {
        links.push_back({
            {"url", link.url},
            {"text", link.text}
        });
    }

    nlohmann::json out = {
        {"url", page.url}
    };
    if (page.title) {
        out["title"] = *page.title;
    }
    out["content"] = page.content;
    out["links"] = std::move(links);
    return out;
}

nlohmann::json toJson(const ExplorationResult& result) {
    nlohmann::json pages = nlohmann::json::array();
    for (const auto& page : result.content) {
        pages.push_back(toJson(page));
    }

    nlohmann::json out = {
        {"rootUrl", result.rootUrl},
        {"explorationDepth", result.explorationDepth},
        {"pagesExplored", result.pagesExplored},
        {"content", std::move(pages)}
    };
    if (result.error) {
        out["error"] = *result.error;
    }
    return out;
}

} // namespace docs_fetch::crawler
