#pragma once

#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/filter/route_map.hpp>
#include <openapi_mcp/openapi/operation.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace openapi_mcp {

// ---------------------------------------------------------------------------
// CallTemplate: everything needed to turn tool arguments into one request.
// ---------------------------------------------------------------------------
struct ParameterBinding {
    std::string name;
    ParameterLocation location = ParameterLocation::Query;
    bool required = false;
};

struct CallTemplate {
    std::string base_url;
    HttpMethod method = HttpMethod::Get;
    std::string path_template;
    std::vector<ParameterBinding> parameters;
};

// ---------------------------------------------------------------------------
// ToolBinding: one exposed tool. Immutable after classification.
// ---------------------------------------------------------------------------
struct ToolBinding {
    std::string name;
    OperationDescriptor operation;
    CallTemplate call;
    std::string description;
    nlohmann::json input_schema;
};

struct Classification {
    // Ordered by tool name so tools/list output is stable.
    std::map<std::string, ToolBinding> tools;
    // Document order.
    std::vector<OperationDescriptor> excluded;
};

/// Deterministic tool name from method and path: lower-case method, '_',
/// then the path with every run of non-alphanumeric characters collapsed to
/// a single '_' and leading/trailing '_' removed.
///   GET /widget/{id}  -> get_widget_id
///   GET /widget/:id   -> get_widget_id
///   POST /            -> post
std::string DeriveToolName(HttpMethod method, std::string_view path);

/// JSON Schema object describing the tool's arguments.
nlohmann::json BuildInputSchema(const OperationDescriptor& operation);

/// Summary and description joined by a blank line; "METHOD /path" when the
/// document provides neither.
std::string BuildToolDescription(const OperationDescriptor& operation);

/// Disposition of one operation: the first matching rule decides; no rules,
/// or no matching rule, means Tool.
RouteOutcome ClassifyOperation(const OperationDescriptor& operation,
                               const std::optional<RouteRules>& rules);

/// Partition operations into tools and exclusions. Fails with NameCollision
/// when two tool operations derive the same name.
Result<Classification, Error> ClassifyOperations(
    const std::vector<OperationDescriptor>& operations,
    const std::optional<RouteRules>& rules,
    const std::string& base_url);

} // namespace openapi_mcp
