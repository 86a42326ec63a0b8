#include <catch2/catch_test_macros.hpp>
#include "RenderedFetcher.h"
#include "FakeSite.h"
#include <deque>
#include <thread>

using namespace docs_fetch::crawler;
using namespace std::chrono_literals;
using docs_fetch::testing::docPage;
using docs_fetch::testing::paragraph;

namespace {

// Observations shared between a test and the service owned by the fetcher
struct ServiceLog {
    std::mutex mutex;
    int probes = 0;
    int renders = 0;
    bool closed = false;
    std::vector<std::chrono::milliseconds> navigationTimeouts;
};

class FakeRenderService : public RenderService {
public:
    FakeRenderService(std::shared_ptr<ServiceLog> log, int failingProbes, std::deque<RenderResponse> script,
                      std::chrono::milliseconds renderLatency)
        : log(std::move(log)), failingProbes(failingProbes), script(std::move(script)), renderLatency(renderLatency) {}

    bool probe(const CancellationToken&) override {
        std::lock_guard<std::mutex> lock(log->mutex);
        return ++log->probes > failingProbes;
    }

    RenderResponse render(const std::string&, std::chrono::milliseconds navigationTimeout,
                          const CancellationToken& token) override {
        {
            std::lock_guard<std::mutex> lock(log->mutex);
            ++log->renders;
            log->navigationTimeouts.push_back(navigationTimeout);
        }
        if (renderLatency.count() > 0) {
            token.sleepFor(std::min(renderLatency, navigationTimeout));
        }
        std::lock_guard<std::mutex> lock(log->mutex);
        if (script.empty()) {
            RenderResponse timeout;
            timeout.timedOut = true;
            timeout.error = "Navigation timeout";
            return timeout;
        }
        RenderResponse next = script.front();
        if (script.size() > 1) script.pop_front();
        return next;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(log->mutex);
        log->closed = true;
    }

private:
    std::shared_ptr<ServiceLog> log;
    int failingProbes;
    std::deque<RenderResponse> script;
    std::chrono::milliseconds renderLatency;
};

ExploreConfig fastConfig() {
    ExploreConfig config;
    config.launchRetryBackoff = 1ms;
    config.renderRetryBackoff = 1ms;
    return config;
}

RenderResponse rendered(const std::string& html, int targetStatus = 200, const std::string& finalUrl = "") {
    RenderResponse response;
    response.success = true;
    response.html = html;
    response.serviceStatus = 200;
    response.targetStatus = targetStatus;
    response.finalUrl = finalUrl;
    return response;
}

RenderResponse failed(const std::string& error, bool timedOut) {
    RenderResponse response;
    response.error = error;
    response.timedOut = timedOut;
    response.serviceStatus = timedOut ? 408 : 500;
    return response;
}

RenderedFetcher::ServiceFactory factoryFor(std::shared_ptr<ServiceLog> log, int failingProbes,
                                           std::deque<RenderResponse> script,
                                           std::chrono::milliseconds latency = 0ms) {
    return [log, failingProbes, script, latency]() -> std::unique_ptr<RenderService> {
        return std::make_unique<FakeRenderService>(log, failingProbes, script, latency);
    };
}

const std::string kRichPage = docPage("Rendered", paragraph("client-side rendering"));

} // namespace

TEST_CASE("RenderedFetcher launches the session lazily", "[RenderedFetcher]") {
    auto log = std::make_shared<ServiceLog>();
    CancellationToken token;

    SECTION("Retries the launch probe and succeeds") {
        RenderedFetcher fetcher(fastConfig(), factoryFor(log, 2, {rendered(kRichPage)}));
        REQUIRE(log->probes == 0);

        auto outcome = fetcher.fetch("https://spa.example.com/", token);
        REQUIRE(outcome.ok());
        REQUIRE(outcome.strategy == FetchStrategy::RENDERED);
        REQUIRE(fetcher.launchAttempts() == 3);
    }

    SECTION("Gives up after three failed probes and remembers it") {
        RenderedFetcher fetcher(fastConfig(), factoryFor(log, 100, {rendered(kRichPage)}));

        auto first = fetcher.fetch("https://spa.example.com/a", token);
        REQUIRE(first.disposition == FetchDisposition::FATAL);
        REQUIRE(first.error == FetchError::NETWORK_ERROR);
        REQUIRE(fetcher.launchAttempts() == 3);

        auto second = fetcher.fetch("https://spa.example.com/b", token);
        REQUIRE(second.disposition == FetchDisposition::FATAL);
        REQUIRE(fetcher.launchAttempts() == 3);
        REQUIRE(log->renders == 0);
    }

    SECTION("One session serves every fetch and is closed on destruction") {
        {
            RenderedFetcher fetcher(fastConfig(), factoryFor(log, 0, {rendered(kRichPage)}));
            REQUIRE(fetcher.fetch("https://spa.example.com/a", token).ok());
            REQUIRE(fetcher.fetch("https://spa.example.com/b", token).ok());
            REQUIRE(log->probes == 1);
            REQUIRE_FALSE(log->closed);
        }
        REQUIRE(log->closed);
    }
}

TEST_CASE("RenderedFetcher classifies rendered documents", "[RenderedFetcher]") {
    auto log = std::make_shared<ServiceLog>();
    CancellationToken token;

    SECTION("Reports the final URL after navigation") {
        RenderedFetcher fetcher(fastConfig(),
                                factoryFor(log, 0, {rendered(kRichPage, 200, "https://spa.example.com/home")}));
        auto outcome = fetcher.fetch("https://spa.example.com/", token);
        REQUIRE(outcome.ok());
        REQUIRE(outcome.finalUrl == "https://spa.example.com/home");
        REQUIRE(outcome.content == kRichPage);
    }

    SECTION("Nearly empty documents are fatal and not retried") {
        RenderedFetcher fetcher(fastConfig(), factoryFor(log, 0, {rendered(docPage("Empty", "<p>Loading</p>"))}));
        auto outcome = fetcher.fetch("https://spa.example.com/", token);
        REQUIRE(outcome.disposition == FetchDisposition::FATAL);
        REQUIRE(outcome.error == FetchError::EMPTY_CONTENT);
        REQUIRE(log->renders == 1);
    }

    SECTION("Error statuses of the target page are fatal") {
        RenderedFetcher fetcher(fastConfig(), factoryFor(log, 0, {rendered(kRichPage, 404)}));
        auto outcome = fetcher.fetch("https://spa.example.com/missing", token);
        REQUIRE(outcome.disposition == FetchDisposition::FATAL);
        REQUIRE(outcome.error == FetchError::HTTP_STATUS_ERROR);
        REQUIRE(outcome.statusCode == 404);
        REQUIRE(log->renders == 1);
    }
}

TEST_CASE("RenderedFetcher retries navigation", "[RenderedFetcher]") {
    auto log = std::make_shared<ServiceLog>();
    CancellationToken token;

    SECTION("Transient failures are retried") {
        RenderedFetcher fetcher(fastConfig(),
                                factoryFor(log, 0, {failed("Service error", false), rendered(kRichPage)}));
        auto outcome = fetcher.fetch("https://spa.example.com/", token);
        REQUIRE(outcome.ok());
        REQUIRE(log->renders == 2);
    }

    SECTION("Three timeouts end in RenderTimeout") {
        RenderedFetcher fetcher(fastConfig(), factoryFor(log, 0, {}));
        auto outcome = fetcher.fetch("https://spa.example.com/slow", token);
        REQUIRE(outcome.disposition == FetchDisposition::FATAL);
        REQUIRE(outcome.error == FetchError::RENDER_TIMEOUT);
        REQUIRE(log->renders == 3);
    }

    SECTION("Mixed failures end in NetworkError") {
        RenderedFetcher fetcher(fastConfig(),
                                factoryFor(log, 0, {failed("Navigation timeout", true), failed("Crashed", false)}));
        auto outcome = fetcher.fetch("https://spa.example.com/flaky", token);
        REQUIRE(outcome.error == FetchError::NETWORK_ERROR);
        REQUIRE(outcome.reason == "Crashed");
    }

    SECTION("Attempts stay within the total render budget") {
        ExploreConfig config = fastConfig();
        config.renderTotalTimeout = 50ms;
        RenderedFetcher fetcher(config, factoryFor(log, 0, {}, 30ms));
        auto outcome = fetcher.fetch("https://spa.example.com/slow", token);

        REQUIRE(outcome.error == FetchError::RENDER_TIMEOUT);
        REQUIRE(log->renders < 3);
        for (auto timeout : log->navigationTimeouts) {
            REQUIRE(timeout <= 50ms);
        }
    }

    SECTION("Cancellation stops the fetch") {
        RenderedFetcher fetcher(fastConfig(), factoryFor(log, 0, {rendered(kRichPage)}));
        token.cancel();
        auto outcome = fetcher.fetch("https://spa.example.com/", token);
        REQUIRE(outcome.error == FetchError::DEADLINE_EXCEEDED);
        REQUIRE(log->renders == 0);
    }
}
