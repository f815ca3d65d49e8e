#pragma once

#include <openapi_mcp/core/result.hpp>

#include <array>
#include <string>
#include <string_view>

namespace openapi_mcp {

// ---------------------------------------------------------------------------
// HttpMethod: the seven verbs an OpenAPI operation can be declared under.
// Declaration order is the canonical order used wherever methods are listed.
// ---------------------------------------------------------------------------
enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Head,
    Options,
};

inline constexpr std::array<HttpMethod, 7> kAllHttpMethods = {
    HttpMethod::Get,   HttpMethod::Post, HttpMethod::Put,
    HttpMethod::Patch, HttpMethod::Delete, HttpMethod::Head,
    HttpMethod::Options,
};

/// Upper-case wire name: "GET", "POST", ...
const char* HttpMethodName(HttpMethod method);

/// Case-insensitive parse ("get", "Get", "GET"). Surrounding whitespace is
/// not trimmed.
Result<HttpMethod, std::string> ParseHttpMethod(std::string_view name);

/// "GET, POST, PUT, PATCH, DELETE, HEAD, OPTIONS".
std::string ValidHttpMethodList();

// ---------------------------------------------------------------------------
// ParameterLocation: where an operation parameter travels on the wire.
// The request body is modelled as a parameter named "body".
// ---------------------------------------------------------------------------
enum class ParameterLocation {
    Path,
    Query,
    Header,
    Body,
};

const char* ParameterLocationName(ParameterLocation location);

} // namespace openapi_mcp
