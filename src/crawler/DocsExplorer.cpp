#include "../../include/docs_fetch/crawler/DocsExplorer.h"
#include "PageFetcher.h"
#include "RenderedFetcher.h"
#include "FetchStrategySelector.h"
#include "FrontierWalker.h"
#include "DeadlineGuard.h"
#include "../../include/docs_fetch/common/Url.h"
#include "../../include/Logger.h"
#include <algorithm>

namespace docs_fetch::crawler {

DocsExplorer::DocsExplorer(ExploreConfig config)
    : exploreConfig(std::move(config)) {
    const ExploreConfig& cfg = exploreConfig;
    lightweightFactory = [cfg]() -> std::unique_ptr<PageSource> {
        return std::make_unique<PageFetcher>(cfg);
    };
    renderedFactory = [cfg]() -> std::unique_ptr<PageSource> {
        return std::make_unique<RenderedFetcher>(cfg);
    };
}

DocsExplorer::DocsExplorer(ExploreConfig config, SourceFactory lightweight, SourceFactory rendered)
    : exploreConfig(std::move(config))
    , lightweightFactory(std::move(lightweight))
    , renderedFactory(std::move(rendered)) {
}

ExplorationResult DocsExplorer::explore(const std::string& url, int depth) {
    const int effectiveDepth = std::max(1, depth);
    auto rootUrl = common::normalizeUrl(url);
    if (!rootUrl) {
        LOG_WARNING("Rejecting exploration of invalid URL: " + url);
        ExplorationResult result;
        result.rootUrl = url;
        result.explorationDepth = effectiveDepth;
        result.state = ExplorationState::FAILED;
        result.error = fetchErrorName(FetchError::INVALID_URL) + ": '" + url + "' is not an absolute http(s) URL";
        return result;
    }

    try {
        return runExploration(*rootUrl, effectiveDepth);
    } catch (const std::exception& e) {
        LOG_ERROR("Exploration of " + *rootUrl + " failed: " + std::string(e.what()));
        ExplorationResult result;
        result.rootUrl = *rootUrl;
        result.explorationDepth = effectiveDepth;
        result.state = ExplorationState::FAILED;
        result.error = std::string("Exploration failed: ") + e.what();
        return result;
    }
}

ExplorationResult DocsExplorer::runExploration(const std::string& rootUrl, int depth) {
    ExplorationResult result;
    result.rootUrl = rootUrl;
    result.explorationDepth = depth;

    LOG_DEBUG("Exploration state: idle -> exploring (" + rootUrl + ")");

    // Per-request resources, all released before the result is returned
    CancellationToken token;
    std::unique_ptr<PageSource> lightweight = lightweightFactory();
    std::unique_ptr<PageSource> rendered;
    if (exploreConfig.spaRenderingEnabled && renderedFactory) {
        rendered = renderedFactory();
    }
    FetchStrategySelector selector(*lightweight, rendered.get());
    FrontierWalker walker(exploreConfig, selector, token);
    DeadlineGuard guard(exploreConfig.deadline);

    bool finished = guard.run(token, [&walker, &rootUrl, depth]() {
        walker.walk(rootUrl, depth);
    });

    result.content = walker.snapshot();
    result.pagesExplored = static_cast<int>(result.content.size());

    if (!finished) {
        result.state = ExplorationState::TIMED_OUT;
        result.error = "Exploration timed out after " + std::to_string(guard.budget().count()) +
                       " ms; returning " + std::to_string(result.pagesExplored) + " pages gathered so far";
    } else if (result.content.empty()) {
        result.state = ExplorationState::FAILED;
        result.error = walker.rootError().value_or("No content could be retrieved from " + rootUrl);
    } else {
        result.state = ExplorationState::COMPLETED;
    }

    LOG_INFO("Exploration state: exploring -> " + explorationStateName(result.state) + " (" + rootUrl + ", " +
             std::to_string(result.pagesExplored) + " pages)");
    return result;
}

} // namespace docs_fetch::crawler
