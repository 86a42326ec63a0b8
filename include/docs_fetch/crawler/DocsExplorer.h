#pragma once

#include <string>
#include <memory>
#include <functional>
#include "PageSource.h"
#include "models/ExploreConfig.h"
#include "models/ExplorationResult.h"

namespace docs_fetch::crawler {

/**
 * Entry point of the traversal engine.
 *
 * Every explore() call builds its own fetchers, visited set, limiter and
 * rendering session and tears them down before returning; nothing is shared
 * between calls, so one DocsExplorer may serve concurrent requests.
 */
class DocsExplorer {
public:
    using SourceFactory = std::function<std::unique_ptr<PageSource>()>;

    // libcurl lightweight fetcher, Browserless fallback when config.spaRenderingEnabled
    explicit DocsExplorer(ExploreConfig config = ExploreConfig());

    // Custom sources; an empty rendered factory disables the fallback
    DocsExplorer(ExploreConfig config, SourceFactory lightweight, SourceFactory rendered);

    /**
     * Explore url and its same-host neighbourhood up to depth levels (root is level 1).
     * Never throws: invalid input, root failure and timeouts are reported through
     * ExplorationResult::state and ExplorationResult::error.
     */
    ExplorationResult explore(const std::string& url, int depth);

    const ExploreConfig& config() const { return exploreConfig; }

private:
    ExplorationResult runExploration(const std::string& rootUrl, int depth);

    ExploreConfig exploreConfig;
    SourceFactory lightweightFactory;
    SourceFactory renderedFactory;
};

} // namespace docs_fetch::crawler
