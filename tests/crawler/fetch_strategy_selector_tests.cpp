#include <catch2/catch_test_macros.hpp>
#include "FetchStrategySelector.h"
#include "FakeSite.h"

using namespace docs_fetch::crawler;
using docs_fetch::testing::FakeSite;
using docs_fetch::testing::docPage;
using docs_fetch::testing::paragraph;

TEST_CASE("FetchStrategySelector prefers the lightweight source", "[FetchStrategySelector]") {
    FakeSite lightweight;
    FakeSite rendered;
    rendered.strategy = FetchStrategy::RENDERED;
    CancellationToken token;
    FetchStrategySelector selector(lightweight, &rendered);

    SECTION("Lightweight success is returned directly") {
        lightweight.add("https://example.com/", docPage("Home", paragraph("static pages")));
        auto outcome = selector.fetch("https://example.com/", token);
        REQUIRE(outcome.ok());
        REQUIRE(outcome.strategy == FetchStrategy::LIGHTWEIGHT);
        REQUIRE(rendered.requests().empty());
    }

    SECTION("Retryable failures fall back to rendering") {
        lightweight.fail("https://spa.example.com/",
                         FetchOutcome::retryable(FetchError::EMPTY_CONTENT, "Page needs client-side rendering"));
        rendered.add("https://spa.example.com/", docPage("App", paragraph("rendered views")));
        auto outcome = selector.fetch("https://spa.example.com/", token);
        REQUIRE(outcome.ok());
        REQUIRE(outcome.strategy == FetchStrategy::RENDERED);
        REQUIRE(rendered.requests().size() == 1);
    }

    SECTION("Fatal failures never fall back") {
        lightweight.fail("https://example.com/bad", FetchOutcome::fatal(FetchError::INVALID_URL, "Bad URL"));
        auto outcome = selector.fetch("https://example.com/bad", token);
        REQUIRE(outcome.error == FetchError::INVALID_URL);
        REQUIRE(rendered.requests().empty());
    }

    SECTION("Rendered failures are reported as-is") {
        lightweight.fail("https://example.com/gone", FetchOutcome::retryable(FetchError::HTTP_STATUS_ERROR, "HTTP 404", 404));
        rendered.fail("https://example.com/gone", FetchOutcome::fatal(FetchError::HTTP_STATUS_ERROR, "HTTP 404", 404));
        auto outcome = selector.fetch("https://example.com/gone", token);
        REQUIRE(outcome.disposition == FetchDisposition::FATAL);
        REQUIRE(outcome.describe() == "HttpStatusError{404}: HTTP 404");
    }

    SECTION("Cancelled requests fetch nothing") {
        token.cancel();
        auto outcome = selector.fetch("https://example.com/", token);
        REQUIRE(outcome.error == FetchError::DEADLINE_EXCEEDED);
        REQUIRE(lightweight.requests().empty());
    }
}

TEST_CASE("FetchStrategySelector without a rendered source", "[FetchStrategySelector]") {
    FakeSite lightweight;
    CancellationToken token;
    FetchStrategySelector selector(lightweight, nullptr);

    lightweight.fail("https://spa.example.com/",
                     FetchOutcome::retryable(FetchError::EMPTY_CONTENT, "Page needs client-side rendering"));
    auto outcome = selector.fetch("https://spa.example.com/", token);
    REQUIRE(outcome.disposition == FetchDisposition::RETRYABLE);
    REQUIRE(outcome.error == FetchError::EMPTY_CONTENT);
}
