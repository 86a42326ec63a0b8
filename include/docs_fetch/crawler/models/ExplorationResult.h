#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "PageResult.h"

namespace docs_fetch::crawler {

// Terminal states of one exploration (Idle and Exploring are transient)
enum class ExplorationState {
    COMPLETED,
    TIMED_OUT,
    FAILED
};

struct ExplorationResult {
    std::string rootUrl;
    int explorationDepth = 1;
    // Successfully completed pages, not attempts
    int pagesExplored = 0;
    std::vector<PageResult> content;
    std::optional<std::string> error;
    ExplorationState state = ExplorationState::COMPLETED;

    bool failed() const { return state == ExplorationState::FAILED; }
};

std::string explorationStateName(ExplorationState state);

// Response shape: rootUrl, explorationDepth, pagesExplored, content[{url, title?, content, links[{url, text}]}], error?
nlohmann::json toJson(const PageResult& page);
nlohmann::json toJson(const ExplorationResult& result);

} // namespace docs_fetch::crawler
