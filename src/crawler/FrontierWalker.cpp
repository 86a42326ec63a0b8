#include "FrontierWalker.h"
#include "LinkScorer.h"
#include "../../include/docs_fetch/common/Url.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <future>

namespace docs_fetch::crawler {

FrontierWalker::FrontierWalker(const ExploreConfig& config, PageSource& source, const CancellationToken& token)
    : config(config)
    , source(source)
    , token(token)
    , domExtractor(config.maxContentLength, config.mainContentThreshold)
    , markupExtractor(config.maxContentLength)
    , fetchLimiter(config.maxConcurrentFetches) {
}

void FrontierWalker::walk(const std::string& url, int depth) {
    rootUrl = url;
    scopeHosts = {common::extractHost(url)};
    maxDepth = std::max(1, depth);

    LOG_INFO("Exploring " + rootUrl + " to depth " + std::to_string(maxDepth));
    visitedSet.tryClaim(rootUrl);
    visitGuarded(rootUrl, 0, {});

    LOG_INFO("Exploration of " + rootUrl + " finished with " + std::to_string(snapshot().size()) +
             " pages, " + std::to_string(visitedSet.size()) + " URLs claimed, peak concurrency " +
             std::to_string(fetchLimiter.peak()));
}

std::vector<PageResult> FrontierWalker::snapshot() const {
    std::vector<std::pair<DispatchPath, PageResult>> copy;
    {
        std::lock_guard<std::mutex> lock(collectorMutex);
        copy = collected;
    }
    std::sort(copy.begin(), copy.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<PageResult> pages;
    pages.reserve(copy.size());
    for (auto& entry : copy) {
        pages.push_back(std::move(entry.second));
    }
    return pages;
}

std::optional<std::string> FrontierWalker::rootError() const {
    std::lock_guard<std::mutex> lock(collectorMutex);
    return rootFailure;
}

void FrontierWalker::record(const DispatchPath& path, PageResult page) {
    std::lock_guard<std::mutex> lock(collectorMutex);
    collected.emplace_back(path, std::move(page));
}

bool FrontierWalker::inScope(const std::string& url) const {
    std::lock_guard<std::mutex> lock(collectorMutex);
    return scopeHosts.count(common::extractHost(url)) > 0;
}

void FrontierWalker::visitGuarded(const std::string& url, int depth, const DispatchPath& path) {
    try {
        visit(url, depth, path);
    } catch (const std::exception& e) {
        LOG_ERROR("Branch " + url + " failed: " + std::string(e.what()));
        if (path.empty()) {
            std::lock_guard<std::mutex> lock(collectorMutex);
            rootFailure = std::string("Failed to process ") + url + ": " + e.what();
        }
    }
}

ExtractedPage FrontierWalker::extract(const FetchOutcome& outcome, const std::string& pageUrl) const {
    // Rendered documents always go through the DOM path
    if (outcome.strategy == FetchStrategy::LIGHTWEIGHT && config.extractionMode == ExtractionMode::MARKUP) {
        return markupExtractor.extract(outcome.content, pageUrl);
    }
    return domExtractor.extract(outcome.content, pageUrl);
}

void FrontierWalker::visit(const std::string& url, int depth, const DispatchPath& path) {
    if (token.isCancelled()) {
        LOG_DEBUG("Skipping " + url + ": exploration cancelled");
        return;
    }

    FetchOutcome outcome;
    {
        auto permit = fetchLimiter.acquire(token);
        if (!permit) {
            LOG_DEBUG("Skipping " + url + ": cancelled while waiting for a fetch slot");
            return;
        }
        outcome = source.fetch(url, token);
    }

    if (!outcome.ok()) {
        LOG_WARNING("Fetch failed for " + url + " at depth " + std::to_string(depth) + ": " + outcome.describe());
        if (path.empty()) {
            std::lock_guard<std::mutex> lock(collectorMutex);
            rootFailure = "Failed to fetch " + url + ": " + outcome.describe();
        }
        return;
    }

    const std::string pageUrl = outcome.finalUrl.empty() ? url : outcome.finalUrl;
    if (pageUrl != url && !visitedSet.tryClaim(pageUrl)) {
        LOG_DEBUG("Dropping " + url + ": redirected to already visited " + pageUrl);
        return;
    }
    if (path.empty() && pageUrl != url) {
        // Relative links of the root resolve against its final host
        std::lock_guard<std::mutex> lock(collectorMutex);
        scopeHosts.insert(common::extractHost(pageUrl));
    }

    ExtractedPage extracted = extract(outcome, pageUrl);

    PageResult page;
    page.url = url;
    page.title = std::move(extracted.title);
    page.content = std::move(extracted.content);
    page.links = LinkScorer::rank(std::move(extracted.links), config.maxLinksPerPage);

    std::vector<std::string> children;
    if (depth + 1 < maxDepth) {
        for (const auto& link : page.links) {
            if (children.size() >= config.maxChildrenPerPage) break;
            if (!inScope(link.url)) continue;
            if (visitedSet.tryClaim(link.url)) {
                children.push_back(link.url);
            }
        }
    }

    if (token.isCancelled()) {
        LOG_DEBUG("Discarding " + url + ": exploration cancelled during fetch");
        return;
    }

    LOG_INFO("Collected " + url + " (depth " + std::to_string(depth) + ", " +
             std::to_string(page.links.size()) + " links, " + std::to_string(children.size()) + " children)");
    record(path, std::move(page));

    const size_t groupSize = std::max<size_t>(1, config.fanOut);
    for (size_t start = 0; start < children.size(); start += groupSize) {
        if (token.isCancelled()) {
            LOG_DEBUG("Not dispatching remaining children of " + url + ": exploration cancelled");
            break;
        }

        size_t end = std::min(start + groupSize, children.size());
        std::vector<std::future<void>> group;
        group.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            DispatchPath childPath = path;
            childPath.push_back(static_cast<int>(i));
            group.push_back(std::async(std::launch::async,
                                       [this, childUrl = children[i], depth, childPath]() {
                                           visitGuarded(childUrl, depth + 1, childPath);
                                       }));
        }
        for (auto& branch : group) {
            branch.get();
        }
    }
}

} // namespace docs_fetch::crawler
