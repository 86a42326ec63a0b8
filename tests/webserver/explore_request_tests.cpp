#include <catch2/catch_test_macros.hpp>
#include "ExploreRequest.h"

using namespace docs_fetch::api;
using docs_fetch::crawler::ExplorationResult;
using docs_fetch::crawler::ExplorationState;

TEST_CASE("Explore query parameters are validated", "[ExploreRequest]") {
    SECTION("URL with default depth") {
        auto parse = parseExploreQuery({{"url", "https://docs.example.com/guide"}});
        REQUIRE(parse.success);
        REQUIRE(parse.request.url == "https://docs.example.com/guide");
        REQUIRE(parse.request.depth == kDefaultDepth);
    }

    SECTION("Explicit depth is clamped to the supported range") {
        REQUIRE(parseExploreQuery({{"url", "https://a.example.com/"}, {"depth", "3"}}).request.depth == 3);
        REQUIRE(parseExploreQuery({{"url", "https://a.example.com/"}, {"depth", "0"}}).request.depth == kMinDepth);
        REQUIRE(parseExploreQuery({{"url", "https://a.example.com/"}, {"depth", "42"}}).request.depth == kMaxDepth);
        REQUIRE(parseExploreQuery({{"url", "https://a.example.com/"}, {"depth", "-7"}}).request.depth == kMinDepth);
        REQUIRE(parseExploreQuery({{"url", "https://a.example.com/"}, {"depth", ""}}).request.depth == kDefaultDepth);
    }

    SECTION("Non-integer depth is rejected") {
        auto parse = parseExploreQuery({{"url", "https://a.example.com/"}, {"depth", "two"}});
        REQUIRE_FALSE(parse.success);
        REQUIRE(parse.errorMessage == "Invalid depth: must be an integer");
        REQUIRE_FALSE(parseExploreQuery({{"url", "https://a.example.com/"}, {"depth", "1.5"}}).success);
    }

    SECTION("URL is required and must be absolute http(s)") {
        REQUIRE(parseExploreQuery({}).errorMessage == "Missing required parameter: url");
        REQUIRE(parseExploreQuery({{"url", "   "}}).errorMessage == "Missing required parameter: url");
        REQUIRE(parseExploreQuery({{"url", "docs/intro"}}).errorMessage ==
                "Invalid url: must be an absolute http or https URL");
        REQUIRE_FALSE(parseExploreQuery({{"url", "file:///etc/passwd"}}).success);
    }
}

TEST_CASE("Explore JSON bodies are validated", "[ExploreRequest]") {
    SECTION("Accepts url and integer depth") {
        auto parse = parseExploreBody(R"({"url": "https://docs.example.com/", "depth": 2})");
        REQUIRE(parse.success);
        REQUIRE(parse.request.url == "https://docs.example.com/");
        REQUIRE(parse.request.depth == 2);
    }

    SECTION("Accepts integral floats and numeric strings") {
        REQUIRE(parseExploreBody(R"({"url": "https://a.example.com/", "depth": 3.0})").request.depth == 3);
        REQUIRE(parseExploreBody(R"({"url": "https://a.example.com/", "depth": "4"})").request.depth == 4);
        REQUIRE(parseExploreBody(R"({"url": "https://a.example.com/", "depth": null})").request.depth == kDefaultDepth);
        REQUIRE(parseExploreBody(R"({"url": "https://a.example.com/", "depth": 99})").request.depth == kMaxDepth);
    }

    SECTION("Rejects malformed input") {
        REQUIRE(parseExploreBody("not json").errorMessage.rfind("Invalid JSON body", 0) == 0);
        REQUIRE(parseExploreBody("[1, 2]").errorMessage == "Request body must be a JSON object");
        REQUIRE(parseExploreBody(R"({"depth": 2})").errorMessage == "Missing required parameter: url");
        REQUIRE(parseExploreBody(R"({"url": 42})").errorMessage == "Missing required parameter: url");
        REQUIRE(parseExploreBody(R"({"url": "https://a.example.com/", "depth": 1.5})").errorMessage ==
                "Invalid depth: must be an integer");
        REQUIRE(parseExploreBody(R"({"url": "https://a.example.com/", "depth": true})").errorMessage ==
                "Invalid depth: must be an integer");
    }
}

TEST_CASE("Exploration results map to HTTP responses", "[ExploreRequest]") {
    ExplorationResult result;
    result.rootUrl = "https://docs.example.com/";

    SECTION("Completed explorations are 200") {
        result.state = ExplorationState::COMPLETED;
        result.pagesExplored = 0;
        auto response = buildExploreResponse(result);
        REQUIRE(response.status == "200 OK");
        REQUIRE_FALSE(response.body.contains("isError"));
        REQUIRE(response.body["rootUrl"] == "https://docs.example.com/");
    }

    SECTION("Timed out explorations are 200 with an error") {
        result.state = ExplorationState::TIMED_OUT;
        result.error = "Exploration timed out after 45000 ms; returning 0 pages gathered so far";
        auto response = buildExploreResponse(result);
        REQUIRE(response.status == "200 OK");
        REQUIRE(response.body["error"] == *result.error);
        REQUIRE_FALSE(response.body.contains("isError"));
    }

    SECTION("Failed explorations are 502") {
        result.state = ExplorationState::FAILED;
        result.error = "Failed to fetch https://docs.example.com/: NetworkError: Connection refused";
        auto response = buildExploreResponse(result);
        REQUIRE(response.status == "502 Bad Gateway");
        REQUIRE(response.body["isError"] == true);
        REQUIRE(response.body["error"] == *result.error);
    }
}
