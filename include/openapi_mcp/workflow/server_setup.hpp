#pragma once

#include <openapi_mcp/auth/request_augmentation.hpp>
#include <openapi_mcp/config/app_config.hpp>
#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/core/url.hpp>
#include <openapi_mcp/openapi/openapi_document.hpp>
#include <openapi_mcp/openapi/operation_classifier.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace openapi_mcp {

// ---------------------------------------------------------------------------
// ServerPlan: everything the MCP server needs, resolved before the first
// request is served.
// ---------------------------------------------------------------------------
struct ServerPlan {
    std::string server_name;
    ApiInfo api;
    BaseUrl base_url;
    Classification classification;
    RequestAugmentation augmentation;
    std::vector<std::string> warnings;

    /// Text for the MCP initialize "instructions" field.
    [[nodiscard]] std::string Instructions() const;
};

// ---------------------------------------------------------------------------
// PlanServer: validate filters and auth, then classify the document.
//
// Steps, stopping at the first failure:
//   1. ValidateFilterOptions (all problems reported in one Validation error)
//   2. BuildRouteMaps
//   3. ParseCustomHeaders + BuildAuthConfig
//   4. ResolveBaseUrl
//   5. ExtractOperations + ClassifyOperations
// ---------------------------------------------------------------------------
Result<ServerPlan, Error> PlanServer(const AppConfig& config,
                                     const nlohmann::json& document);

} // namespace openapi_mcp
