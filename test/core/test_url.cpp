#include <catch2/catch_test_macros.hpp>

#include <openapi_mcp/core/url.hpp>

using namespace openapi_mcp;

// ===========================================================================
// UrlEncode
// ===========================================================================

TEST_CASE("UrlEncode: unreserved characters pass through", "[url]") {
    CHECK(UrlEncode("abcXYZ019-_.~") == "abcXYZ019-_.~");
}

TEST_CASE("UrlEncode: reserved characters are escaped", "[url]") {
    CHECK(UrlEncode("a b") == "a%20b");
    CHECK(UrlEncode("a/b?c=d&e") == "a%2Fb%3Fc%3Dd%26e");
    CHECK(UrlEncode("{id}") == "%7Bid%7D");
}

// ===========================================================================
// Query strings
// ===========================================================================

TEST_CASE("BuildQueryString: encodes names and values", "[url]") {
    QueryParams params{{"q", "cats & dogs"}, {"page", "2"}};
    CHECK(BuildQueryString(params) == "q=cats%20%26%20dogs&page=2");
    CHECK(BuildQueryString({}) == "");
}

TEST_CASE("SetQueryParam: replaces every existing occurrence", "[url]") {
    QueryParams params{{"key", "old"}, {"limit", "5"}, {"key", "older"}};
    SetQueryParam(params, "key", "abc");

    REQUIRE(params.size() == 2);
    CHECK(params[0] == QueryParams::value_type{"limit", "5"});
    CHECK(params[1] == QueryParams::value_type{"key", "abc"});
}

TEST_CASE("SetQueryParam: appends when absent", "[url]") {
    QueryParams params;
    SetQueryParam(params, "key", "abc");
    REQUIRE(params.size() == 1);
    CHECK(BuildQueryString(params) == "key=abc");
}

// ===========================================================================
// ParseBaseUrl
// ===========================================================================

TEST_CASE("ParseBaseUrl: origin only", "[url]") {
    auto r = ParseBaseUrl("https://api.example.com");
    REQUIRE(r.IsOk());
    CHECK(r.Value().origin == "https://api.example.com");
    CHECK(r.Value().path_prefix.empty());
}

TEST_CASE("ParseBaseUrl: port and path prefix, trailing slash dropped", "[url]") {
    auto r = ParseBaseUrl("http://localhost:8080/api/v3/");
    REQUIRE(r.IsOk());
    CHECK(r.Value().origin == "http://localhost:8080");
    CHECK(r.Value().path_prefix == "/api/v3");
}

TEST_CASE("ParseBaseUrl: rejects non-http URLs", "[url]") {
    CHECK(ParseBaseUrl("ftp://example.com").IsErr());
    CHECK(ParseBaseUrl("/relative/path").IsErr());
    CHECK(ParseBaseUrl("https://").IsErr());
}

TEST_CASE("IsHttpUrl", "[url]") {
    CHECK(IsHttpUrl("http://x"));
    CHECK(IsHttpUrl("https://x"));
    CHECK_FALSE(IsHttpUrl("./petstore.yaml"));
    CHECK_FALSE(IsHttpUrl("httpx://x"));
}
