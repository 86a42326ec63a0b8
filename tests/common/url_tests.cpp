#include <catch2/catch_test_macros.hpp>
#include "docs_fetch/common/Url.h"

using namespace docs_fetch::common;

TEST_CASE("normalizeUrl canonicalizes absolute http(s) URLs", "[Url]") {
    SECTION("Lower-cases scheme and host and drops the fragment") {
        auto url = normalizeUrl("HTTPS://Docs.Example.COM/Guide/Intro#setup");
        REQUIRE(url.has_value());
        REQUIRE(*url == "https://docs.example.com/Guide/Intro");
    }

    SECTION("Adds the root path to a bare host") {
        auto url = normalizeUrl("https://example.com");
        REQUIRE(url.has_value());
        REQUIRE(*url == "https://example.com/");
    }

    SECTION("Keeps the query string") {
        auto url = normalizeUrl("https://example.com/search?q=api");
        REQUIRE(url.has_value());
        REQUIRE(*url == "https://example.com/search?q=api");
    }

    SECTION("Strips invisible characters and surrounding whitespace") {
        auto url = normalizeUrl("  \xE2\x80\x8Bhttps://example.com/docs\xEF\xBB\xBF \n");
        REQUIRE(url.has_value());
        REQUIRE(*url == "https://example.com/docs");
    }

    SECTION("Rejects relative, empty and non-http URLs") {
        REQUIRE_FALSE(normalizeUrl("").has_value());
        REQUIRE_FALSE(normalizeUrl("/docs/intro").has_value());
        REQUIRE_FALSE(normalizeUrl("ftp://example.com/file").has_value());
        REQUIRE_FALSE(normalizeUrl("mailto:someone@example.com").has_value());
        REQUIRE_FALSE(normalizeUrl("not a url").has_value());
    }
}

TEST_CASE("resolveUrl resolves references against a base", "[Url]") {
    const std::string base = "https://example.com/docs/guide/intro.html";

    REQUIRE(resolveUrl("setup.html", base) == std::optional<std::string>("https://example.com/docs/guide/setup.html"));
    REQUIRE(resolveUrl("../api/", base) == std::optional<std::string>("https://example.com/docs/api/"));
    REQUIRE(resolveUrl("/blog", base) == std::optional<std::string>("https://example.com/blog"));
    REQUIRE(resolveUrl("//cdn.example.org/x", base) == std::optional<std::string>("https://cdn.example.org/x"));
    REQUIRE(resolveUrl("https://Other.org/page#frag", base) == std::optional<std::string>("https://other.org/page"));

    SECTION("Rejects targets that are not http(s)") {
        REQUIRE_FALSE(resolveUrl("ftp://example.com/file", base).has_value());
        REQUIRE_FALSE(resolveUrl("", base).has_value());
    }
}

TEST_CASE("Host and path helpers", "[Url]") {
    REQUIRE(extractHost("https://Docs.Example.com/a/b") == "docs.example.com");
    REQUIRE(extractHost("garbage").empty());
    REQUIRE(isSameHost("https://example.com/a", "http://EXAMPLE.com/b"));
    REQUIRE_FALSE(isSameHost("https://example.com/a", "https://www.example.com/a"));

    auto path = extractPath("https://example.com/docs/getting%20started");
    REQUIRE(path.has_value());
    REQUIRE(*path == "/docs/getting started");
}

TEST_CASE("Query string decoding", "[Url]") {
    SECTION("urlDecode handles escapes and plus signs") {
        REQUIRE(urlDecode("https%3A%2F%2Fexample.com%2Fdocs") == "https://example.com/docs");
        REQUIRE(urlDecode("a+b") == "a b");
        REQUIRE(urlDecode("100%") == "100%");
        REQUIRE(urlDecode("%zz") == "%zz");
    }

    SECTION("parseQueryString splits and decodes pairs") {
        auto params = parseQueryString("url=https%3A%2F%2Fexample.com&depth=2&flag");
        REQUIRE(params.size() == 3);
        REQUIRE(params["url"] == "https://example.com");
        REQUIRE(params["depth"] == "2");
        REQUIRE(params["flag"].empty());
    }

    SECTION("Later keys overwrite earlier ones") {
        auto params = parseQueryString("depth=1&depth=3");
        REQUIRE(params["depth"] == "3");
    }

    SECTION("Empty query yields no parameters") {
        REQUIRE(parseQueryString("").empty());
    }
}

TEST_CASE("sanitizeUrl removes pasted invisible characters", "[Url]") {
    SECTION("Zero-width space, BOM and bidi marks") {
        REQUIRE(sanitizeUrl("\xEF\xBB\xBFhttps://exa\xE2\x80\x8Bmple.com/\xE2\x80\x8F" "docs") ==
                "https://example.com/docs");
    }

    SECTION("Control characters and surrounding spaces") {
        REQUIRE(sanitizeUrl("  https://example.com/a\tb\r\n  ") == "https://example.com/ab");
        REQUIRE(sanitizeUrl(" \xE2\x80\x8B https://example.com/") == "https://example.com/");
    }

    SECTION("Keeps other non-ASCII text and drops malformed bytes") {
        REQUIRE(sanitizeUrl("https://example.com/caf\xC3\xA9") == "https://example.com/caf\xC3\xA9");
        REQUIRE(sanitizeUrl("https://example.com/\x80x\xC3") == "https://example.com/x");
    }

    SECTION("Blank input") {
        REQUIRE(sanitizeUrl("   ").empty());
        REQUIRE(sanitizeUrl("").empty());
    }
}
