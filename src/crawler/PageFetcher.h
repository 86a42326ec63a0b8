#pragma once

#include <string>
#include <vector>
#include <chrono>
#include "../../include/docs_fetch/crawler/PageSource.h"
#include "../../include/docs_fetch/crawler/models/ExploreConfig.h"

namespace docs_fetch::crawler {

// Lightweight fetcher: one direct GET with browser-identifying headers and a short timeout
class PageFetcher : public PageSource {
public:
    explicit PageFetcher(const ExploreConfig& config);
    ~PageFetcher() override;

    FetchOutcome fetch(const std::string& url, const CancellationToken& token) override;

    /**
     * Check if a page is likely a SPA (Single Page Application) shell
     * that needs a headless browser before its content is visible
     */
    static bool isSpaPage(const std::string& html);

private:
    std::string userAgent;
    std::string acceptHeader;
    std::string acceptLanguage;
    std::chrono::milliseconds timeout;
    bool followRedirects;
    long maxRedirects;
    size_t maxBodyBytes;
    size_t spaTextThreshold;
};

} // namespace docs_fetch::crawler
