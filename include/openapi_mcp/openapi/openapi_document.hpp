#pragma once

#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/openapi/operation.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace openapi_mcp {

struct ApiInfo {
    std::string title = "Unknown API";
    std::string version = "1.0.0";
};

/// Load an OpenAPI document from a local file or an http(s) URL and decode
/// it (JSON first, YAML as fallback). Fails with ErrorCategory::Document.
Result<nlohmann::json, Error> LoadOpenApiSource(
    const std::string& source,
    std::chrono::seconds timeout = std::chrono::seconds(30));

/// Decode document text. `origin` only appears in error messages.
Result<nlohmann::json, Error> ParseOpenApiText(std::string_view content,
                                               const std::string& origin);

/// info.title / info.version with defaults for missing fields.
ApiInfo ReadApiInfo(const nlohmann::json& document);

/// Base URL for outgoing calls, in priority order:
///   1. `override_url` when given
///   2. servers[0].url, with {variables} replaced by their defaults and a
///      relative URL resolved against `source` when that is an http(s) URL
///   3. Swagger 2.0 schemes[0]://host + basePath
/// Trailing '/' is removed. Fails with ErrorCategory::Config when none apply.
Result<std::string, Error> ResolveBaseUrl(const nlohmann::json& document,
                                          const std::optional<std::string>& override_url,
                                          const std::string& source);

/// Decompose `paths` into operation descriptors.
///
/// Paths are visited in key order, methods in canonical order (GET, POST,
/// PUT, PATCH, DELETE, HEAD, OPTIONS); other keys such as "trace" or
/// "parameters" are not operations. Local "$ref"s ("#/...") are inlined.
/// Cookie and form parameters are not exposed. A JSON request body (OpenAPI
/// 3 requestBody or Swagger 2 "in: body") becomes a parameter named "body".
Result<std::vector<OperationDescriptor>, Error> ExtractOperations(
    const nlohmann::json& document);

} // namespace openapi_mcp
