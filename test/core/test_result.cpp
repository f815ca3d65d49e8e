#include <catch2/catch_test_macros.hpp>

#include <openapi_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

using namespace openapi_mcp;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: reading the wrong side throws", "[result]") {
    auto ok = Result<int, std::string>::Ok(1);
    CHECK_THROWS_AS(ok.Error(), std::bad_variant_access);
    auto none = Result<void, std::string>::Ok();
    CHECK_THROWS_AS(none.Error(), std::bad_optional_access);
}

TEST_CASE("Result: move-only type in Ok", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(42));
    REQUIRE(r.IsOk());
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 42);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error struct
// ===========================================================================

TEST_CASE("Error: ToString with all fields", "[error]") {
    Error e{"tools/call", "GET /pets", 500, "Upstream server error",
            "database offline", ErrorCategory::Http};
    auto s = e.ToString();
    CHECK(s.find("tools/call") != std::string::npos);
    CHECK(s.find("GET /pets") != std::string::npos);
    CHECK(s.find("HTTP 500") != std::string::npos);
    CHECK(s.find("Upstream server error") != std::string::npos);
    CHECK(s.find("database offline") != std::string::npos);
}

TEST_CASE("Error: ToString layout", "[error]") {
    Error e{"get_pets_petid", "GET /pets/{petId}", 404, "Not found", "Pet not found",
            ErrorCategory::Http};
    CHECK(e.ToString() ==
          "get_pets_petid [GET /pets/{petId}] (HTTP 404): Not found (API: Pet not found)");
}

TEST_CASE("Error: ToString without optional fields", "[error]") {
    Error e{"Connect", "", std::nullopt, "timeout", std::nullopt};
    auto s = e.ToString();
    CHECK(s == "Connect: timeout");
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e{"Op", "", std::nullopt, "msg", std::nullopt};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: ExitCode mapping", "[error]") {
    const auto code = [](ErrorCategory c) {
        return Error{"", "", std::nullopt, "", std::nullopt, c}.ExitCode();
    };
    CHECK(code(ErrorCategory::Validation) == 2);
    CHECK(code(ErrorCategory::InvalidPattern) == 2);
    CHECK(code(ErrorCategory::MissingCredential) == 2);
    CHECK(code(ErrorCategory::Config) == 2);
    CHECK(code(ErrorCategory::NameCollision) == 3);
    CHECK(code(ErrorCategory::Document) == 4);
    CHECK(code(ErrorCategory::Connection) == 5);
    CHECK(code(ErrorCategory::Timeout) == 6);
    CHECK(code(ErrorCategory::Http) == 7);
    CHECK(code(ErrorCategory::Internal) == 99);
}

TEST_CASE("Error: ToJson contains required fields", "[error]") {
    Error e{"PathPattern", "([", std::nullopt, "unbalanced", std::nullopt,
            ErrorCategory::InvalidPattern};
    auto json = nlohmann::json::parse(e.ToJson());
    const auto& body = json.at("error");
    CHECK(body["category"] == "invalid_pattern");
    CHECK(body["operation"] == "PathPattern");
    CHECK(body["subject"] == "([");
    CHECK(body["message"] == "unbalanced");
    CHECK(body["exit_code"] == 2);
    CHECK_FALSE(body.contains("http_status"));
    CHECK_FALSE(body.contains("api_error"));
}

TEST_CASE("Error: ToToolJson leaves out the exit code", "[error]") {
    Error e{"get_pets", "GET /pets", 503, "Upstream server unavailable", "maintenance",
            ErrorCategory::Connection};
    auto body = nlohmann::json::parse(e.ToToolJson()).at("error");
    CHECK(body["category"] == "connection");
    CHECK(body["http_status"] == 503);
    CHECK(body["api_error"] == "maintenance");
    CHECK_FALSE(body.contains("exit_code"));
}

TEST_CASE("Error: ToJson escapes special characters", "[error]") {
    Error e{"Op\"Quoted\"", "/path", 500, "line1\nline2", std::nullopt,
            ErrorCategory::Http};
    auto json = e.ToJson();
    CHECK(json.find("\\n") != std::string::npos);
    CHECK(json.find("\\\"Quoted\\\"") != std::string::npos);
    CHECK_NOTHROW(nlohmann::json::parse(json));
}

TEST_CASE("Error: equality includes category", "[error]") {
    Error e1{"Op", "", std::nullopt, "msg", std::nullopt, ErrorCategory::Connection};
    Error e2{"Op", "", std::nullopt, "msg", std::nullopt, ErrorCategory::Connection};
    Error e3{"Op", "", std::nullopt, "msg", std::nullopt, ErrorCategory::Timeout};
    CHECK(e1 == e2);
    CHECK(e1 != e3);
}

// ===========================================================================
// Error::FromHttpStatus
// ===========================================================================

TEST_CASE("FromHttpStatus: client errors map to Http", "[error]") {
    for (int code : {400, 401, 403, 404, 409, 422}) {
        auto e = Error::FromHttpStatus("get_pets", "GET /pets", code);
        CHECK(e.category == ErrorCategory::Http);
        CHECK(e.http_status == code);
    }
}

TEST_CASE("FromHttpStatus: 408 is a timeout, 429 an HTTP error", "[error]") {
    CHECK(Error::FromHttpStatus("Op", "/ep", 408).category == ErrorCategory::Timeout);
    auto throttled = Error::FromHttpStatus("Op", "/ep", 429);
    CHECK(throttled.category == ErrorCategory::Http);
    CHECK(throttled.ExitCode() == 7);
}

TEST_CASE("FromHttpStatus: 502/503/504 map to Connection", "[error]") {
    for (int code : {502, 503, 504}) {
        auto e = Error::FromHttpStatus("Op", "/ep", code);
        CHECK(e.category == ErrorCategory::Connection);
        CHECK(e.message.find("unavailable") != std::string::npos);
    }
}

TEST_CASE("FromHttpStatus: unknown code names the status", "[error]") {
    auto e = Error::FromHttpStatus("Op", "/ep", 418);
    CHECK(e.category == ErrorCategory::Http);
    CHECK(e.message.find("418") != std::string::npos);
}

TEST_CASE("FromHttpStatus: extracts API error from JSON body", "[error]") {
    SECTION("message") {
        auto e = Error::FromHttpStatus("Op", "/ep", 404, R"({"message":"Pet not found"})");
        REQUIRE(e.api_error.has_value());
        CHECK(*e.api_error == "Pet not found");
    }
    SECTION("nested error.message") {
        auto e = Error::FromHttpStatus("Op", "/ep", 400,
                                       R"({"error":{"code":7,"message":"bad id"}})");
        REQUIRE(e.api_error.has_value());
        CHECK(*e.api_error == "bad id");
    }
    SECTION("problem details") {
        auto e = Error::FromHttpStatus("Op", "/ep", 422,
                                       R"({"title":"Invalid","detail":"name is required"})");
        REQUIRE(e.api_error.has_value());
        CHECK(*e.api_error == "name is required");
    }
    SECTION("non-JSON body is kept trimmed") {
        auto e = Error::FromHttpStatus("Op", "/ep", 500, "  <html>oops</html>\r\n");
        REQUIRE(e.api_error.has_value());
        CHECK(*e.api_error == "<html>oops</html>");
    }
    SECTION("long raw body is truncated") {
        auto e = Error::FromHttpStatus("Op", "/ep", 502, std::string(5000, 'x'));
        REQUIRE(e.api_error.has_value());
        CHECK(e.api_error->size() < 1100);
        CHECK(e.api_error->find("(truncated)") != std::string::npos);
    }
    SECTION("empty or blank body") {
        CHECK_FALSE(Error::FromHttpStatus("Op", "/ep", 500, "").api_error.has_value());
        CHECK_FALSE(Error::FromHttpStatus("Op", "/ep", 500, " \n").api_error.has_value());
    }
}
