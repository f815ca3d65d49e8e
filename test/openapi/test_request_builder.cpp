#include <catch2/catch_test_macros.hpp>

#include <openapi_mcp/openapi/request_builder.hpp>

#include <string>

using namespace openapi_mcp;

namespace {

CallTemplate PetCall() {
    CallTemplate call;
    call.base_url = "https://api.example.com/v1";
    call.method = HttpMethod::Put;
    call.path_template = "/owners/{ownerId}/pets/{petId}";
    call.parameters = {
        {"ownerId", ParameterLocation::Path, true},
        {"petId", ParameterLocation::Path, true},
        {"status", ParameterLocation::Query, false},
        {"tags", ParameterLocation::Query, false},
        {"X-Request-Id", ParameterLocation::Header, false},
        {"body", ParameterLocation::Body, false},
    };
    return call;
}

} // anonymous namespace

TEST_CASE("ArgumentToString: scalar rendering", "[openapi][request]") {
    CHECK(ArgumentToString("plain") == "plain");
    CHECK(ArgumentToString(42) == "42");
    CHECK(ArgumentToString(true) == "true");
    CHECK(ArgumentToString(nullptr) == "");
    CHECK(ArgumentToString(nlohmann::json::array({1, 2})) == "[1,2]");
}

TEST_CASE("BuildRequest: all parameter locations", "[openapi][request]") {
    nlohmann::json args = {
        {"ownerId", 7},
        {"petId", "rex/2"},
        {"status", "available"},
        {"tags", {"a", "b"}},
        {"X-Request-Id", "req-1"},
        {"body", {{"name", "Rex"}}},
    };
    auto result = BuildRequest(PetCall(), args);
    REQUIRE(result.IsOk());
    const auto& req = result.Value();

    CHECK(req.method == HttpMethod::Put);
    CHECK(req.path == "/owners/7/pets/rex%2F2");
    CHECK(req.query == QueryParams{{"status", "available"}, {"tags", "a"}, {"tags", "b"}});
    CHECK(req.headers.at("x-request-id") == "req-1");
    REQUIRE(req.body.has_value());
    CHECK(nlohmann::json::parse(*req.body) == nlohmann::json{{"name", "Rex"}});
    CHECK(req.content_type == "application/json");
}

TEST_CASE("BuildRequest: optional arguments omitted", "[openapi][request]") {
    auto result = BuildRequest(PetCall(), {{"ownerId", 1}, {"petId", 2}, {"status", nullptr}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().path == "/owners/1/pets/2");
    CHECK(result.Value().query.empty());
    CHECK(result.Value().headers.empty());
    CHECK_FALSE(result.Value().body.has_value());
}

TEST_CASE("BuildRequest: unknown arguments are ignored", "[openapi][request]") {
    auto result = BuildRequest(PetCall(), {{"ownerId", 1}, {"petId", 2}, {"extra", "x"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().query.empty());
}

TEST_CASE("BuildRequest: missing required arguments", "[openapi][request]") {
    auto result = BuildRequest(PetCall(), {{"status", "sold"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Validation);
    CHECK(result.Error().message == "Missing required argument(s): ownerId, petId");
    CHECK(result.Error().subject == "PUT /owners/{ownerId}/pets/{petId}");
}

TEST_CASE("BuildRequest: null required argument counts as missing",
          "[openapi][request]") {
    auto result = BuildRequest(PetCall(), {{"ownerId", 1}, {"petId", nullptr}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing required argument(s): petId");
}

TEST_CASE("BuildRequest: arguments must be an object", "[openapi][request]") {
    auto result = BuildRequest(PetCall(), nlohmann::json::array({1, 2}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Validation);
}

TEST_CASE("BuildRequest: null arguments for a parameterless call", "[openapi][request]") {
    CallTemplate call;
    call.method = HttpMethod::Get;
    call.path_template = "/health";
    auto result = BuildRequest(call, nullptr);
    REQUIRE(result.IsOk());
    CHECK(result.Value().path == "/health");
}

TEST_CASE("BuildRequest: undeclared placeholder is reported", "[openapi][request]") {
    CallTemplate call;
    call.method = HttpMethod::Get;
    call.path_template = "/pets/{petId}";
    auto result = BuildRequest(call, nlohmann::json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Unresolved path parameter") != std::string::npos);
}
