#include <catch2/catch_test_macros.hpp>

#include <openapi_mcp/auth/request_augmentation.hpp>

#include <string>

using namespace openapi_mcp;

namespace {

RequestAugmentation Augment(AuthScheme scheme, HttpHeaders custom = {}) {
    AuthConfig config;
    config.scheme = std::move(scheme);
    config.custom_headers = std::move(custom);
    return BuildRequestAugmentation(config);
}

} // anonymous namespace

TEST_CASE("AugmentationKindName", "[auth][augmentation]") {
    CHECK(std::string(AugmentationKindName(AugmentationKind::None)) == "none");
    CHECK(std::string(AugmentationKindName(AugmentationKind::StaticHeaders)) ==
          "static-headers");
    CHECK(std::string(AugmentationKindName(AugmentationKind::QueryInjection)) ==
          "query-injection");
    CHECK(std::string(AugmentationKindName(AugmentationKind::BasicCredentials)) ==
          "basic-credentials");
}

TEST_CASE("RequestAugmentation: no auth leaves the request alone", "[auth][augmentation]") {
    auto aug = Augment(NoAuth{});
    CHECK(aug.kind == AugmentationKind::None);

    OutgoingRequest request;
    request.path = "/pets";
    request.query = {{"limit", "5"}};
    aug.Apply(request);
    CHECK(request.headers.empty());
    CHECK(request.query == QueryParams{{"limit", "5"}});
    CHECK_FALSE(request.basic_auth.has_value());
}

TEST_CASE("RequestAugmentation: api key header", "[auth][augmentation]") {
    auto aug = Augment(ApiKeyAuth{ApiKeyLocation::Header, "X-API-Key", "abc"});
    CHECK(aug.kind == AugmentationKind::StaticHeaders);

    OutgoingRequest request;
    aug.Apply(request);
    CHECK(request.headers.at("X-API-Key") == "abc");
    CHECK(request.query.empty());
}

TEST_CASE("RequestAugmentation: api key query replaces caller value",
          "[auth][augmentation]") {
    auto aug = Augment(ApiKeyAuth{ApiKeyLocation::Query, "key", "abc"});
    CHECK(aug.kind == AugmentationKind::QueryInjection);
    CHECK(aug.headers.empty());

    OutgoingRequest request;
    request.query = {{"key", "zzz"}, {"limit", "5"}, {"key", "yyy"}};
    aug.Apply(request);
    CHECK(request.query == QueryParams{{"limit", "5"}, {"key", "abc"}});
}

TEST_CASE("RequestAugmentation: api key query added when absent",
          "[auth][augmentation]") {
    auto aug = Augment(ApiKeyAuth{ApiKeyLocation::Query, "api_key", "abc"});
    OutgoingRequest request;
    aug.Apply(request);
    CHECK(request.query == QueryParams{{"api_key", "abc"}});
}

TEST_CASE("RequestAugmentation: bearer token", "[auth][augmentation]") {
    auto aug = Augment(BearerAuth{"t0ken"});
    CHECK(aug.kind == AugmentationKind::StaticHeaders);

    OutgoingRequest request;
    aug.Apply(request);
    CHECK(request.headers.at("authorization") == "Bearer t0ken");
}

TEST_CASE("RequestAugmentation: basic credentials", "[auth][augmentation]") {
    auto aug = Augment(BasicAuth{"alice", "s3cret"});
    CHECK(aug.kind == AugmentationKind::BasicCredentials);
    CHECK(aug.headers.empty());

    OutgoingRequest request;
    aug.Apply(request);
    REQUIRE(request.basic_auth.has_value());
    CHECK(request.basic_auth->username == "alice");
    CHECK(request.basic_auth->password == "s3cret");
}

TEST_CASE("RequestAugmentation: custom headers", "[auth][augmentation]") {
    SECTION("alone they make a static-headers augmentation") {
        HttpHeaders custom;
        custom["X-Team"] = "platform";
        auto aug = Augment(NoAuth{}, custom);
        CHECK(aug.kind == AugmentationKind::StaticHeaders);
        CHECK(aug.headers.at("X-Team") == "platform");
    }
    SECTION("they override an auth header of the same name") {
        HttpHeaders custom;
        custom["Authorization"] = "Token override";
        auto aug = Augment(BearerAuth{"t0ken"}, custom);
        REQUIRE(aug.headers.size() == 1);
        CHECK(aug.headers.at("Authorization") == "Token override");
    }
    SECTION("they combine with basic credentials") {
        HttpHeaders custom;
        custom["X-Team"] = "platform";
        auto aug = Augment(BasicAuth{"alice", "pw"}, custom);
        CHECK(aug.kind == AugmentationKind::BasicCredentials);
        OutgoingRequest request;
        aug.Apply(request);
        CHECK(request.headers.at("X-Team") == "platform");
        CHECK(request.basic_auth.has_value());
    }
}

TEST_CASE("RequestAugmentation: request headers are not overwritten",
          "[auth][augmentation]") {
    HttpHeaders custom;
    custom["X-Request-Id"] = "static";
    auto aug = Augment(NoAuth{}, custom);

    OutgoingRequest request;
    request.headers["x-request-id"] = "per-call";
    aug.Apply(request);
    CHECK(request.headers.size() == 1);
    CHECK(request.headers.at("X-Request-Id") == "per-call");
}

TEST_CASE("RequestAugmentation: applying twice is stable", "[auth][augmentation]") {
    auto aug = Augment(ApiKeyAuth{ApiKeyLocation::Query, "key", "abc"});
    OutgoingRequest request;
    aug.Apply(request);
    aug.Apply(request);
    CHECK(request.query == QueryParams{{"key", "abc"}});
}
