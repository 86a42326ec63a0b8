#pragma once

#include <string>
#include <chrono>
#include <vector>
#include <functional>

namespace docs_fetch::crawler {

// Which extractor turns lightweight HTML into text and links
enum class ExtractionMode {
    DOM,    // gumbo tree with the main-content selector list
    MARKUP  // regex tag stripping, no main-content detection
};

struct ExploreConfig {
    // Global budget for one explore() call
    std::chrono::milliseconds deadline{45000};

    // Timeout for a lightweight GET
    std::chrono::milliseconds lightweightTimeout{10000};

    // Per navigation attempt on the rendering service
    std::chrono::milliseconds renderNavigationTimeout{10000};

    // Cap over all navigation attempts of one rendered fetch
    std::chrono::milliseconds renderTotalTimeout{30000};

    // Navigation attempts per rendered fetch
    int renderMaxAttempts = 3;

    // Fixed delay between navigation attempts
    std::chrono::milliseconds renderRetryBackoff{1000};

    // Launch probes of the rendering service before giving up
    int launchMaxAttempts = 3;

    // Fixed delay between launch probes
    std::chrono::milliseconds launchRetryBackoff{1000};

    // Rendered text shorter than this is EmptyContent
    size_t minRenderedContentLength = 100;

    // Lightweight pages with SPA markers and less visible text than this go to the renderer
    size_t spaTextThreshold = 200;

    // An element whose text exceeds this wins the selector scan
    size_t mainContentThreshold = 200;

    // Content bound in code points, the truncation marker comes on top
    size_t maxContentLength = 10000;

    // Response body cap for lightweight fetches
    size_t maxBodyBytes = 5 * 1024 * 1024;

    // Links kept per page (K)
    size_t maxLinksPerPage = 10;

    // Same-host links recursed into per page (M)
    size_t maxChildrenPerPage = 5;

    // Children dispatched concurrently per page
    size_t fanOut = 3;

    // Simultaneous fetches across the whole request
    size_t maxConcurrentFetches = 6;

    // Follow redirects on lightweight fetches
    bool followRedirects = true;
    long maxRedirects = 5;

    // Fall back to the rendering service for pages the lightweight path cannot serve
    bool spaRenderingEnabled = true;

    // Browserless service URL for rendered fetches
    std::string browserlessUrl = "http://browserless:3000";

    ExtractionMode extractionMode = ExtractionMode::DOM;

    std::string userAgent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36";
    std::string acceptHeader = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    std::string acceptLanguage = "en-US,en;q=0.9";

    // Resource types the renderer does not load
    std::vector<std::string> blockedResourceTypes = {"image", "stylesheet", "font", "media"};
};

/**
 * Build a config from the defaults above, overridden by environment variables:
 * BROWSERLESS_URL, SPA_RENDERING_ENABLED, EXPLORE_DEADLINE_MS, LIGHTWEIGHT_TIMEOUT_MS,
 * RENDER_NAVIGATION_TIMEOUT_MS, EXPLORE_FAN_OUT, EXPLORE_MAX_CONCURRENT_FETCHES,
 * EXPLORE_EXTRACTION_MODE (dom|markup) and EXPLORE_USER_AGENT.
 * Invalid values are logged and ignored.
 */
ExploreConfig loadExploreConfigFromEnv();

/**
 * Same as loadExploreConfigFromEnv() but reads variables through the given lookup,
 * which returns nullptr for unset names.
 */
using EnvLookup = std::function<const char*(const char*)>;
ExploreConfig loadExploreConfig(const EnvLookup& lookup);

} // namespace docs_fetch::crawler
