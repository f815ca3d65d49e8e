#pragma once

#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/http/i_http_client.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace openapi_mcp {

// ---------------------------------------------------------------------------
// AuthSettings: authentication options as they arrive from CLI/YAML/env.
// Loosely typed; BuildAuthConfig turns them into an AuthConfig or rejects
// them.
// ---------------------------------------------------------------------------
struct AuthSettings {
    std::string auth_type = "none";  // none | api_key | bearer | basic
    std::optional<std::string> api_key;
    std::string api_key_header = "X-API-Key";
    std::string api_key_location = "header";  // header | query
    std::string api_key_param_name = "key";
    std::optional<std::string> bearer_token;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::vector<std::string> headers;  // raw "Name: Value" lines
};

enum class ApiKeyLocation {
    Header,
    Query,
};

struct NoAuth {};

struct ApiKeyAuth {
    ApiKeyLocation location = ApiKeyLocation::Header;
    std::string name;  // header name or query parameter name
    std::string value;
};

struct BearerAuth {
    std::string token;
};

struct BasicAuth {
    std::string username;
    std::string password;
};

using AuthScheme = std::variant<NoAuth, ApiKeyAuth, BearerAuth, BasicAuth>;

// ---------------------------------------------------------------------------
// AuthConfig: exactly one active scheme plus always-applied custom headers.
// Built once at startup and shared read-only by every outgoing call.
// ---------------------------------------------------------------------------
struct AuthConfig {
    AuthScheme scheme = NoAuth{};
    HttpHeaders custom_headers;
};

struct ParsedHeaders {
    HttpHeaders headers;
    std::vector<std::string> warnings;
};

/// Parse "Name: Value" lines. Name and value are trimmed; the value may
/// itself contain ':'. A line without ':' is skipped and produces a warning.
ParsedHeaders ParseCustomHeaders(const std::vector<std::string>& lines);

/// Validate settings and build the closed AuthConfig.
///
/// Fails with ErrorCategory::MissingCredential when the selected type lacks
/// a required field (all missing fields are named), and with
/// ErrorCategory::Config for an unknown type or an inconsistent api-key
/// location/parameter combination.
Result<AuthConfig, Error> BuildAuthConfig(const AuthSettings& settings,
                                          HttpHeaders custom_headers = {});

} // namespace openapi_mcp
