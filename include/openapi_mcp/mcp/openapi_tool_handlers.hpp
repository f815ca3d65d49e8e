#pragma once

#include <openapi_mcp/http/i_http_client.hpp>
#include <openapi_mcp/mcp/tool_registry.hpp>
#include <openapi_mcp/openapi/operation_classifier.hpp>

namespace openapi_mcp {

// Register one MCP tool per classified binding. Each handler captures
// &client by reference; the client must outlive the registry.
void RegisterOpenApiTools(ToolRegistry& registry,
                          const Classification& classification,
                          IHttpClient& client);

// Execute one binding: materialise the request, send it, and map the
// response. Non-2xx statuses and transport failures become error results
// carrying the structured error JSON.
ToolResult InvokeTool(const ToolBinding& binding,
                      const nlohmann::json& arguments,
                      IHttpClient& client);

} // namespace openapi_mcp
