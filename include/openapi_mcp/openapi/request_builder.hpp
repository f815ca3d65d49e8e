#pragma once

#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/http/i_http_client.hpp>
#include <openapi_mcp/openapi/operation_classifier.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace openapi_mcp {

/// Scalar argument as it appears in a path, query or header: strings as-is,
/// numbers and booleans in JSON notation, anything else JSON-serialised.
std::string ArgumentToString(const nlohmann::json& value);

/// Materialise one call from tool arguments.
///
/// Path parameters are percent-encoded into the template, query parameters
/// appended in declaration order (arrays repeat the name), header
/// parameters copied, and the "body" argument serialised as JSON.
/// Arguments the template does not declare are ignored. A missing required
/// argument, or a non-object argument set, is a Validation error.
Result<OutgoingRequest, Error> BuildRequest(const CallTemplate& call,
                                            const nlohmann::json& arguments);

} // namespace openapi_mcp
