#pragma once

#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace openapi_mcp {

struct McpServerInfo {
    std::string name = "OpenAPI MCP Server";
    std::string instructions;
};

// MCP 2024-11-05 over stdio: one JSON-RPC 2.0 message per line in, one
// reply per request line out. Notifications get no reply. Supported methods
// are initialize, ping, tools/list and tools/call.
class McpServer {
public:
    McpServer(ToolRegistry registry,
              McpServerInfo info,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Blocks until EOF on the input stream.
    void Run();

    // nullopt for notifications and for versionless messages without an id.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

private:
    struct RpcError {
        int code;
        std::string message;
    };
    using RpcResult = Result<nlohmann::json, RpcError>;

    RpcResult Initialize(const nlohmann::json& params);
    RpcResult Ping(const nlohmann::json& params);
    RpcResult ListTools(const nlohmann::json& params);
    RpcResult CallTool(const nlohmann::json& params);

    void Write(const nlohmann::json& reply);

    ToolRegistry registry_;
    McpServerInfo info_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

} // namespace openapi_mcp
