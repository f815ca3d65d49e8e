#include <catch2/catch_test_macros.hpp>

#include <openapi_mcp/workflow/server_setup.hpp>

#include <string>
#include <vector>

using namespace openapi_mcp;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/workflow
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

nlohmann::json Petstore() {
    auto doc = LoadOpenApiSource(TestDataPath("petstore.yaml"));
    REQUIRE(doc.IsOk());
    return std::move(doc).Value();
}

AppConfig BaseConfig() {
    AppConfig config;
    config.openapi_source = TestDataPath("petstore.yaml");
    return config;
}

std::vector<std::string> ToolNames(const ServerPlan& plan) {
    std::vector<std::string> names;
    for (const auto& [name, binding] : plan.classification.tools) {
        names.push_back(name);
    }
    return names;
}

} // anonymous namespace

TEST_CASE("PlanServer: defaults expose every operation", "[workflow][setup]") {
    auto result = PlanServer(BaseConfig(), Petstore());
    REQUIRE(result.IsOk());
    const auto& plan = result.Value();

    CHECK(plan.server_name == kDefaultServerName);
    CHECK(plan.api.title == "Swagger Petstore");
    CHECK(plan.base_url.origin == "https://api.petstore.example.com");
    CHECK(plan.base_url.path_prefix == "/v1");
    CHECK(ToolNames(plan) == std::vector<std::string>{
                                 "delete_pets_petid", "get_pets", "get_pets_petid",
                                 "get_store_inventory", "post_pets"});
    CHECK(plan.classification.excluded.empty());
    CHECK(plan.augmentation.kind == AugmentationKind::None);
    CHECK(plan.warnings.empty());

    const auto& binding = plan.classification.tools.at("get_pets");
    CHECK(binding.call.base_url == "https://api.petstore.example.com/v1");
}

TEST_CASE("PlanServer: instructions name the API", "[workflow][setup]") {
    auto result = PlanServer(BaseConfig(), Petstore());
    REQUIRE(result.IsOk());
    auto text = result.Value().Instructions();
    CHECK(text.find("Swagger Petstore") != std::string::npos);
    CHECK(text.find("1.0.7") != std::string::npos);
    CHECK(text.find("https://api.petstore.example.com/v1") != std::string::npos);
}

TEST_CASE("PlanServer: filters and base URL override", "[workflow][setup]") {
    auto config = BaseConfig();
    config.base_url = "http://localhost:4010";
    config.filters.methods = "GET,DELETE";
    config.filters.exclude_tags = "admin";

    auto result = PlanServer(config, Petstore());
    REQUIRE(result.IsOk());
    const auto& plan = result.Value();
    CHECK(plan.base_url.origin == "http://localhost:4010");
    CHECK(plan.base_url.path_prefix.empty());
    CHECK(ToolNames(plan) == std::vector<std::string>{
                                 "get_pets", "get_pets_petid", "get_store_inventory"});
    REQUIRE(plan.classification.excluded.size() == 2);
    CHECK(plan.classification.excluded[0].Label() == "POST /pets");
    CHECK(plan.classification.excluded[1].Label() == "DELETE /pets/{petId}");
}

TEST_CASE("PlanServer: every filter problem is reported", "[workflow][setup]") {
    auto config = BaseConfig();
    config.filters.methods = "GET,FETCH";
    config.filters.exclude_paths = "([a-";

    auto result = PlanServer(config, Petstore());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Validation);
    CHECK(result.Error().subject == "filters");
    CHECK(result.Error().message.find("FETCH") != std::string::npos);
    CHECK(result.Error().message.find("; ") != std::string::npos);
}

TEST_CASE("PlanServer: auth settings", "[workflow][setup]") {
    SECTION("missing credential") {
        auto config = BaseConfig();
        config.auth.auth_type = "basic";
        config.auth.username = "alice";
        auto result = PlanServer(config, Petstore());
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::MissingCredential);
    }
    SECTION("api key in query") {
        auto config = BaseConfig();
        config.auth.auth_type = "api_key";
        config.auth.api_key = "abc";
        config.auth.api_key_location = "query";
        auto result = PlanServer(config, Petstore());
        REQUIRE(result.IsOk());
        CHECK(result.Value().augmentation.kind == AugmentationKind::QueryInjection);
    }
    SECTION("malformed header lines become warnings") {
        auto config = BaseConfig();
        config.auth.headers = {"X-Team: platform", "garbage"};
        auto result = PlanServer(config, Petstore());
        REQUIRE(result.IsOk());
        const auto& plan = result.Value();
        CHECK(plan.warnings == std::vector<std::string>{"Invalid header format: garbage"});
        CHECK(plan.augmentation.kind == AugmentationKind::StaticHeaders);
        CHECK(plan.augmentation.headers.at("X-Team") == "platform");
    }
}

TEST_CASE("PlanServer: document problems", "[workflow][setup]") {
    SECTION("no base URL") {
        nlohmann::json doc = {{"paths", nlohmann::json::object()}};
        auto result = PlanServer(BaseConfig(), doc);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("colliding tool names") {
        nlohmann::json doc = {
            {"servers", {{{"url", "https://api.example.com"}}}},
            {"paths", {
                {"/widget/{id}", {{"get", nlohmann::json::object()}}},
                {"/widget/:id", {{"get", nlohmann::json::object()}}},
            }},
        };
        auto result = PlanServer(BaseConfig(), doc);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::NameCollision);
    }
}
