#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace openapi_mcp {

// One entry of a tools/list reply.
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// tools/call outcome. `content` is an array of MCP content blocks; an
// upstream failure is still a successful JSON-RPC reply with is_error set.
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// Tools in the order they were registered. Names are unique; the first
// registration of a name wins.
class ToolRegistry {
public:
    bool Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] std::vector<ToolSchema> Tools() const;
    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Never throws: unknown names and handler exceptions come back as
    /// error results.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    struct Entry {
        ToolSchema schema;
        ToolHandler handler;
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> by_name_;
};

ToolResult MakeTextResult(const std::string& text, bool is_error = false);

} // namespace openapi_mcp
