#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <functional>
#include "RenderService.h"
#include "ContentExtractor.h"
#include "../../include/docs_fetch/crawler/PageSource.h"
#include "../../include/docs_fetch/crawler/models/ExploreConfig.h"

namespace docs_fetch::crawler {

/**
 * Fetches pages through a headless browser. The rendering session is launched lazily
 * on the first fetch, shared by all branches of one request and closed on destruction.
 */
class RenderedFetcher : public PageSource {
public:
    using ServiceFactory = std::function<std::unique_ptr<RenderService>()>;

    // Uses a BrowserlessClient pointed at config.browserlessUrl
    explicit RenderedFetcher(const ExploreConfig& config);
    RenderedFetcher(const ExploreConfig& config, ServiceFactory factory);
    ~RenderedFetcher() override;

    FetchOutcome fetch(const std::string& url, const CancellationToken& token) override;

    // Number of launch probes issued so far
    int launchAttempts() const;

private:
    // Launch the session if needed; false when the service never became available
    bool ensureSession(const CancellationToken& token);

    FetchOutcome classify(const std::string& url, RenderResponse response) const;

    ExploreConfig config;
    ServiceFactory factory;
    ContentExtractor extractor;

    mutable std::mutex sessionMutex;
    std::unique_ptr<RenderService> session;
    bool launchFailed = false;
    int launchAttemptCount = 0;
};

} // namespace docs_fetch::crawler
