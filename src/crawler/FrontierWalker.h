#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <set>
#include "VisitedSet.h"
#include "FetchLimiter.h"
#include "ContentExtractor.h"
#include "MarkupExtractor.h"
#include "../../include/docs_fetch/crawler/PageSource.h"
#include "../../include/docs_fetch/crawler/models/ExploreConfig.h"
#include "../../include/docs_fetch/crawler/models/PageResult.h"

namespace docs_fetch::crawler {

/**
 * Depth- and concurrency-bounded traversal of one site.
 * Children of a page are dispatched in groups of config.fanOut; every fetch holds
 * a FetchLimiter permit. Pages are collected with their dispatch path so the
 * snapshot comes out in pre-order no matter which branch finished first.
 */
class FrontierWalker {
public:
    FrontierWalker(const ExploreConfig& config, PageSource& source, const CancellationToken& token);

    /**
     * Explore rootUrl and its same-host neighbourhood
     * @param rootUrl Normalized absolute URL
     * @param maxDepth 1 fetches the root only
     */
    void walk(const std::string& rootUrl, int maxDepth);

    // Pages collected so far, ordered by dispatch path. Safe to call while walking.
    std::vector<PageResult> snapshot() const;

    // Describes why the root fetch failed, if it did
    std::optional<std::string> rootError() const;

private:
    using DispatchPath = std::vector<int>;

    // Branch boundary: a failing branch is logged and contributes nothing
    void visitGuarded(const std::string& url, int depth, const DispatchPath& path);
    void visit(const std::string& url, int depth, const DispatchPath& path);

    ExtractedPage extract(const FetchOutcome& outcome, const std::string& pageUrl) const;

    void record(const DispatchPath& path, PageResult page);

    // Same host as the requested root or the host the root redirected to
    bool inScope(const std::string& url) const;

    const ExploreConfig& config;
    PageSource& source;
    const CancellationToken& token;
    ContentExtractor domExtractor;
    MarkupExtractor markupExtractor;
    VisitedSet visitedSet;
    FetchLimiter fetchLimiter;

    std::string rootUrl;
    std::set<std::string> scopeHosts;
    int maxDepth = 1;

    mutable std::mutex collectorMutex;
    std::vector<std::pair<DispatchPath, PageResult>> collected;
    std::optional<std::string> rootFailure;
};

} // namespace docs_fetch::crawler
