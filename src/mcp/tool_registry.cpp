#include <openapi_mcp/mcp/tool_registry.hpp>
#include <openapi_mcp/core/log.hpp>

namespace openapi_mcp {

ToolResult MakeTextResult(const std::string& text, bool is_error) {
    ToolResult result;
    result.is_error = is_error;
    result.content = nlohmann::json::array();
    result.content.push_back({{"type", "text"}, {"text", text}});
    return result;
}

bool ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (!by_name_.emplace(name, entries_.size()).second) {
        return false;
    }
    entries_.push_back(Entry{ToolSchema{name, description, input_schema}, std::move(handler)});
    return true;
}

std::vector<ToolSchema> ToolRegistry::Tools() const {
    std::vector<ToolSchema> schemas;
    schemas.reserve(entries_.size());
    for (const auto& entry : entries_) {
        schemas.push_back(entry.schema);
    }
    return schemas;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return by_name_.find(name) != by_name_.end();
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return MakeTextResult("Unknown tool: " + name, true);
    }

    const auto& entry = entries_[it->second];
    try {
        return entry.handler(arguments);
    } catch (const std::exception& e) {
        LogError("tools", name + " failed: " + e.what());
        return MakeTextResult(std::string("Tool error: ") + e.what(), true);
    }
}

} // namespace openapi_mcp
