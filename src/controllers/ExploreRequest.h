#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>
#include "../../include/docs_fetch/crawler/models/ExplorationResult.h"

namespace docs_fetch::api {

constexpr int kDefaultDepth = 1;
constexpr int kMinDepth = 1;
constexpr int kMaxDepth = 5;

struct ExploreRequest {
    std::string url;
    int depth = kDefaultDepth;
};

struct ExploreRequestParse {
    bool success = false;
    ExploreRequest request;
    std::string errorMessage;
};

// From decoded query parameters: url (required), depth (optional integer)
ExploreRequestParse parseExploreQuery(const std::map<std::string, std::string>& params);

// From a JSON body: {"url": "...", "depth": 2}
ExploreRequestParse parseExploreBody(const std::string& body);

int clampDepth(long long depth);

struct ExploreResponse {
    std::string status;  // HTTP status line, e.g. "200 OK"
    nlohmann::json body;
};

// Completed and TimedOut map to 200, Failed to 502 with "isError": true
ExploreResponse buildExploreResponse(const crawler::ExplorationResult& result);

} // namespace docs_fetch::api
