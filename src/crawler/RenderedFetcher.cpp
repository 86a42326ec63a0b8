#include "RenderedFetcher.h"
#include "BrowserlessClient.h"
#include "FetchClassifier.h"
#include "../../include/docs_fetch/common/TextUtils.h"
#include "../../include/Logger.h"
#include <algorithm>

namespace docs_fetch::crawler {

RenderedFetcher::RenderedFetcher(const ExploreConfig& config)
    : RenderedFetcher(config, [config]() -> std::unique_ptr<RenderService> {
          return std::make_unique<BrowserlessClient>(config.browserlessUrl, config.userAgent,
                                                     config.blockedResourceTypes);
      }) {
}

RenderedFetcher::RenderedFetcher(const ExploreConfig& config, ServiceFactory factory)
    : config(config)
    , factory(std::move(factory))
    , extractor(config.maxContentLength, config.mainContentThreshold) {
}

RenderedFetcher::~RenderedFetcher() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    if (session) {
        LOG_DEBUG("Closing rendering session");
        session->close();
        session.reset();
    }
}

int RenderedFetcher::launchAttempts() const {
    std::lock_guard<std::mutex> lock(sessionMutex);
    return launchAttemptCount;
}

bool RenderedFetcher::ensureSession(const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(sessionMutex);
    if (session) return true;
    if (launchFailed) return false;

    auto candidate = factory();
    for (int attempt = 1; attempt <= config.launchMaxAttempts; ++attempt) {
        if (token.isCancelled()) return false;
        ++launchAttemptCount;
        if (candidate->probe(token)) {
            LOG_INFO("Rendering session launched (attempt " + std::to_string(attempt) + ")");
            session = std::move(candidate);
            return true;
        }
        LOG_WARNING("Rendering service launch attempt " + std::to_string(attempt) + "/" +
                    std::to_string(config.launchMaxAttempts) + " failed");
        if (attempt < config.launchMaxAttempts && !token.sleepFor(config.launchRetryBackoff)) {
            return false;
        }
    }

    // Remember for this request so later branches fail fast
    if (!token.isCancelled()) {
        launchFailed = true;
    }
    return false;
}

FetchOutcome RenderedFetcher::classify(const std::string& url, RenderResponse response) const {
    int status = response.targetStatus > 0 ? response.targetStatus : response.serviceStatus;
    if (auto failure = FetchClassifier::classifyResponse(status, "text/html", response.html,
                                                         FetchStrategy::RENDERED)) {
        failure->strategy = FetchStrategy::RENDERED;
        return *failure;
    }

    size_t textLength = common::utf8Length(extractor.extractText(response.html));
    if (textLength < config.minRenderedContentLength) {
        LOG_INFO("Rendered page " + url + " has only " + std::to_string(textLength) + " chars of text");
        auto outcome = FetchOutcome::fatal(FetchError::EMPTY_CONTENT,
                                           "Rendered page has " + std::to_string(textLength) + " chars of text",
                                           status);
        outcome.strategy = FetchStrategy::RENDERED;
        return outcome;
    }

    std::string finalUrl = response.finalUrl.empty() ? url : response.finalUrl;
    return FetchOutcome::success(std::move(response.html), finalUrl, status, "text/html",
                                 FetchStrategy::RENDERED);
}

FetchOutcome RenderedFetcher::fetch(const std::string& url, const CancellationToken& token) {
    if (token.isCancelled()) {
        return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Cancelled before render");
    }

    if (!ensureSession(token)) {
        if (token.isCancelled()) {
            return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Cancelled while launching renderer");
        }
        return FetchOutcome::fatal(FetchError::NETWORK_ERROR, "Rendering service unavailable");
    }

    RenderService* service = nullptr;
    {
        std::lock_guard<std::mutex> lock(sessionMutex);
        service = session.get();
    }

    const auto started = CancellationToken::Clock::now();
    std::string lastError;
    bool allTimedOut = true;

    for (int attempt = 1; attempt <= config.renderMaxAttempts; ++attempt) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(CancellationToken::Clock::now() - started);
        auto budgetLeft = config.renderTotalTimeout - elapsed;
        auto navigationTimeout = std::min(config.renderNavigationTimeout, budgetLeft);
        if (navigationTimeout.count() <= 0) {
            LOG_WARNING("Render budget exhausted for " + url + " after " + std::to_string(attempt - 1) + " attempts");
            break;
        }

        LOG_DEBUG("Render attempt " + std::to_string(attempt) + "/" + std::to_string(config.renderMaxAttempts) +
                  " for " + url + " (timeout " + std::to_string(navigationTimeout.count()) + "ms)");
        RenderResponse response = service->render(url, navigationTimeout, token);

        if (token.isCancelled()) {
            return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Cancelled during render");
        }

        if (response.success) {
            return classify(url, std::move(response));
        }

        lastError = response.error;
        allTimedOut = allTimedOut && response.timedOut;

        if (attempt < config.renderMaxAttempts && !token.sleepFor(config.renderRetryBackoff)) {
            return FetchOutcome::fatal(FetchError::DEADLINE_EXCEEDED, "Cancelled during render backoff");
        }
    }

    FetchOutcome failure = allTimedOut
        ? FetchOutcome::fatal(FetchError::RENDER_TIMEOUT, "Navigation timed out: " + lastError)
        : FetchOutcome::fatal(FetchError::NETWORK_ERROR, lastError);
    failure.strategy = FetchStrategy::RENDERED;
    return failure;
}

} // namespace docs_fetch::crawler
