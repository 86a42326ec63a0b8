#include <catch2/catch_test_macros.hpp>
#include "docs_fetch/crawler/models/ExploreConfig.h"
#include <map>
#include <string>

using namespace docs_fetch::crawler;
using namespace std::chrono_literals;

namespace {

EnvLookup lookupFrom(const std::map<std::string, std::string>& env) {
    return [env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST_CASE("ExploreConfig defaults", "[ExploreConfig]") {
    ExploreConfig config = loadExploreConfig(lookupFrom({}));
    REQUIRE(config.deadline == 45000ms);
    REQUIRE(config.lightweightTimeout == 10000ms);
    REQUIRE(config.renderNavigationTimeout == 10000ms);
    REQUIRE(config.renderTotalTimeout == 30000ms);
    REQUIRE(config.renderMaxAttempts == 3);
    REQUIRE(config.launchMaxAttempts == 3);
    REQUIRE(config.minRenderedContentLength == 100);
    REQUIRE(config.maxContentLength == 10000);
    REQUIRE(config.maxLinksPerPage == 10);
    REQUIRE(config.maxChildrenPerPage == 5);
    REQUIRE(config.fanOut == 3);
    REQUIRE(config.maxConcurrentFetches == 6);
    REQUIRE(config.spaRenderingEnabled);
    REQUIRE(config.browserlessUrl == "http://browserless:3000");
    REQUIRE(config.extractionMode == ExtractionMode::DOM);
}

TEST_CASE("ExploreConfig reads environment overrides", "[ExploreConfig]") {
    ExploreConfig config = loadExploreConfig(lookupFrom({
        {"BROWSERLESS_URL", "http://localhost:3001"},
        {"SPA_RENDERING_ENABLED", "off"},
        {"EXPLORE_DEADLINE_MS", "20000"},
        {"LIGHTWEIGHT_TIMEOUT_MS", "5000"},
        {"RENDER_NAVIGATION_TIMEOUT_MS", "8000"},
        {"EXPLORE_FAN_OUT", "2"},
        {"EXPLORE_MAX_CONCURRENT_FETCHES", "4"},
        {"EXPLORE_EXTRACTION_MODE", "Markup"},
        {"EXPLORE_USER_AGENT", "DocsBot/1.0"},
    }));

    REQUIRE(config.browserlessUrl == "http://localhost:3001");
    REQUIRE_FALSE(config.spaRenderingEnabled);
    REQUIRE(config.deadline == 20000ms);
    REQUIRE(config.lightweightTimeout == 5000ms);
    REQUIRE(config.renderNavigationTimeout == 8000ms);
    REQUIRE(config.fanOut == 2);
    REQUIRE(config.maxConcurrentFetches == 4);
    REQUIRE(config.extractionMode == ExtractionMode::MARKUP);
    REQUIRE(config.userAgent == "DocsBot/1.0");
}

TEST_CASE("ExploreConfig ignores invalid values", "[ExploreConfig]") {
    ExploreConfig config = loadExploreConfig(lookupFrom({
        {"SPA_RENDERING_ENABLED", "maybe"},
        {"EXPLORE_DEADLINE_MS", "soon"},
        {"LIGHTWEIGHT_TIMEOUT_MS", "-5"},
        {"EXPLORE_FAN_OUT", "0"},
        {"EXPLORE_MAX_CONCURRENT_FETCHES", "4x"},
        {"EXPLORE_EXTRACTION_MODE", "xpath"},
        {"BROWSERLESS_URL", ""},
    }));

    REQUIRE(config.spaRenderingEnabled);
    REQUIRE(config.deadline == 45000ms);
    REQUIRE(config.lightweightTimeout == 10000ms);
    REQUIRE(config.fanOut == 3);
    REQUIRE(config.maxConcurrentFetches == 6);
    REQUIRE(config.extractionMode == ExtractionMode::DOM);
    REQUIRE(config.browserlessUrl == "http://browserless:3000");
}
