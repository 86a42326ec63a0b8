#include "PageFetcher.h"
#include "CurlTransfer.h"
#include "FetchClassifier.h"
#include "MarkupExtractor.h"
#include "../../include/Logger.h"
#include "../../include/docs_fetch/common/Url.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include <algorithm>
#include <numeric>

namespace docs_fetch::crawler {

PageFetcher::PageFetcher(const ExploreConfig& config)
    : userAgent(config.userAgent)
    , acceptHeader(config.acceptHeader)
    , acceptLanguage(config.acceptLanguage)
    , timeout(config.lightweightTimeout)
    , followRedirects(config.followRedirects)
    , maxRedirects(config.maxRedirects)
    , maxBodyBytes(config.maxBodyBytes)
    // Thin SPA shells only matter when there is a renderer to hand them to
    , spaTextThreshold(config.spaRenderingEnabled ? config.spaTextThreshold : 0) {
    LOG_DEBUG("PageFetcher constructor called with userAgent: " + userAgent);
    initCurlGlobal();
}

PageFetcher::~PageFetcher() {
    LOG_DEBUG("PageFetcher destructor called");
}

FetchOutcome PageFetcher::fetch(const std::string& url, const CancellationToken& token) {
    const std::string cleanedUrl = common::sanitizeUrl(url);
    LOG_INFO("PageFetcher::fetch called for URL: " + cleanedUrl);

    if (token.isCancelled()) {
        return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Cancelled before fetch");
    }

    // Use a local curl handle for this request to avoid multi-threading issues
    CurlEasyHandle curl(curl_easy_init());
    if (!curl) {
        LOG_ERROR("Failed to create local CURL handle");
        return FetchOutcome::retryable(FetchError::NETWORK_ERROR, "Failed to create local CURL handle");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
    // Empty string enables every encoding curl was built with
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

    // Never wait past the request deadline
    long timeoutMs = static_cast<long>(std::min(timeout, token.remaining()).count());
    if (timeoutMs <= 0) {
        return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "No time left for fetch");
    }
    LOG_DEBUG("Setting timeout: " + std::to_string(timeoutMs) + "ms");
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(timeoutMs, 5000L));

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, maxRedirects);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_slist* rawHeaders = nullptr;
    rawHeaders = curl_slist_append(rawHeaders, ("Accept: " + acceptHeader).c_str());
    rawHeaders = curl_slist_append(rawHeaders, ("Accept-Language: " + acceptLanguage).c_str());
    CurlHeaderList headers(rawHeaders);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    CurlTransfer transfer;
    transfer.token = &token;
    transfer.maxBodyBytes = maxBodyBytes;
    transfer.attach(curl.get());

    LOG_DEBUG("Performing CURL request");
    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        std::string message = std::string(curl_easy_strerror(res)) + (errbuf[0] ? std::string(" | errbuf=") + errbuf : "");
        LOG_WARNING("CURL error for " + cleanedUrl + ": " + message);
        return FetchClassifier::classifyTransferError(res, message, token.isCancelled(), transfer.bodyTooLarge);
    }

    long statusCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &statusCode);
    LOG_INFO("===> HTTP Response status code: " + std::to_string(statusCode) + " for URL: " + cleanedUrl);

    std::string contentType;
    char* rawContentType = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &rawContentType);
    if (rawContentType) {
        contentType = rawContentType;
        LOG_DEBUG("Response content type: " + contentType);
    }

    std::string finalUrl = cleanedUrl;
    char* effectiveUrl = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effectiveUrl);
    if (effectiveUrl) {
        finalUrl = effectiveUrl;
        LOG_DEBUG("Final URL (after redirects): " + finalUrl);
    }

    if (auto failure = FetchClassifier::classifyResponse(static_cast<int>(statusCode), contentType,
                                                         transfer.body, FetchStrategy::LIGHTWEIGHT)) {
        failure->finalUrl = finalUrl;
        LOG_INFO("Lightweight fetch rejected for " + cleanedUrl + ": " + failure->describe());
        return *failure;
    }

    // SPA shells render their content client side: give the renderer a chance
    if (spaTextThreshold > 0 && isSpaPage(transfer.body)) {
        size_t visible = common::utf8Length(MarkupExtractor::extractText(transfer.body));
        if (visible < spaTextThreshold) {
            LOG_INFO("SPA shell detected for " + cleanedUrl + " (" + std::to_string(visible) +
                     " visible chars), needs rendering");
            auto outcome = FetchOutcome::retryable(FetchError::EMPTY_CONTENT,
                                                   "Page needs client-side rendering",
                                                   static_cast<int>(statusCode));
            outcome.finalUrl = finalUrl;
            return outcome;
        }
    }

    LOG_INFO("Request successful, content size: " + std::to_string(transfer.body.size()) + " bytes");
    return FetchOutcome::success(std::move(transfer.body), finalUrl, static_cast<int>(statusCode),
                                 contentType, FetchStrategy::LIGHTWEIGHT);
}

bool PageFetcher::isSpaPage(const std::string& html) {
    // Framework fingerprints that only appear in client-rendered applications
    static const std::vector<std::string> definiteSpaIndicators = {
        // React
        "data-reactroot", "ReactDOM.render", "ReactDOM.createRoot", "ReactDOM.hydrate",
        "<div id=\"root\"></div>",
        // Next.js
        "__NEXT_DATA__", "_next/static/chunks/",
        // Nuxt.js
        "__NUXT__", "window.__NUXT__", "_nuxt/",
        // Gatsby
        "___gatsby", "window.___loader",
        // AngularJS and Angular
        "ng-app=\"", "<app-root>", "<app-root ", "ng-version",
        // Vue
        "<div id=\"app\"></div>", "Vue.createApp", "new Vue(",
        // Ember
        "ember-application",
        // Docusaurus/VitePress/Docsify style shells
        "window.$docsify", "__VITEPRESS_", "<noscript>You need to enable JavaScript"
    };

    std::vector<std::string> foundIndicators;
    for (const auto& indicator : definiteSpaIndicators) {
        if (html.find(indicator) != std::string::npos) {
            foundIndicators.push_back(indicator);
        }
    }

    if (!foundIndicators.empty()) {
        LOG_DEBUG("SPA indicators found: " + std::accumulate(foundIndicators.begin(), foundIndicators.end(), std::string(),
            [](const std::string& a, const std::string& b) { return a + (a.empty() ? "" : ", ") + b; }));
        return true;
    }
    return false;
}

} // namespace docs_fetch::crawler
