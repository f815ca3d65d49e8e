#pragma once

#include <openapi_mcp/core/types.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace openapi_mcp {

// ---------------------------------------------------------------------------
// OperationParameter: one input of an operation.
// ---------------------------------------------------------------------------
struct OperationParameter {
    std::string name;
    ParameterLocation location = ParameterLocation::Query;
    bool required = false;
    nlohmann::json schema = nlohmann::json::object();
    std::optional<std::string> description;
};

// ---------------------------------------------------------------------------
// OperationDescriptor: one (method, path) pair from the OpenAPI document.
//
// Parameters keep document order: path-level parameters first, then the
// operation's own, with the operation's declaration winning on a clash. A
// JSON request body appears as a parameter named "body" located in Body.
// ---------------------------------------------------------------------------
struct OperationDescriptor {
    HttpMethod method = HttpMethod::Get;
    std::string path;
    std::vector<OperationParameter> parameters;
    std::set<std::string> tags;
    std::optional<std::string> summary;
    std::optional<std::string> description;
    std::optional<std::string> operation_id;

    /// "GET /pets/{id}"
    [[nodiscard]] std::string Label() const {
        return std::string(HttpMethodName(method)) + " " + path;
    }
};

} // namespace openapi_mcp
