#include <catch2/catch_test_macros.hpp>
#include "routing/UnmatchedRequest.h"

using routing::unmatchedRequestError;

TEST_CASE("Unmatched requests map to 404 or 405", "[Routing]") {
    SECTION("Known path with another method") {
        auto error = unmatchedRequestError("post", "/api/health", true);
        REQUIRE(error.status == "405 Method Not Allowed");
        REQUIRE(error.code == "METHOD_NOT_ALLOWED");
        REQUIRE(error.message == "Method POST is not supported on /api/health");
    }

    SECTION("Unknown path") {
        auto error = unmatchedRequestError("get", "/api/missing", false);
        REQUIRE(error.status == "404 Not Found");
        REQUIRE(error.code == "NOT_FOUND");
        REQUIRE(error.message == "No route for GET /api/missing");
    }
}
