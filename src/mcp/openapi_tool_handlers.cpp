#include <openapi_mcp/mcp/openapi_tool_handlers.hpp>

#include <openapi_mcp/core/log.hpp>
#include <openapi_mcp/openapi/request_builder.hpp>

namespace openapi_mcp {

namespace {

ToolResult MakeErrorResult(const Error& error) {
    return MakeTextResult(error.ToToolJson(), true);
}

std::string SuccessText(const HttpResponse& response) {
    if (response.body.empty()) {
        return "HTTP " + std::to_string(response.status_code);
    }
    return response.body;
}

} // anonymous namespace

ToolResult InvokeTool(const ToolBinding& binding,
                      const nlohmann::json& arguments,
                      IHttpClient& client) {
    auto request = BuildRequest(binding.call, arguments);
    if (request.IsErr()) {
        LogWarn("tools", binding.name + ": " + request.Error().message);
        return MakeErrorResult(request.Error());
    }

    LogInfo("tools", "Invoking " + binding.name + " (" + binding.operation.Label() + ")");
    auto response = client.Send(request.Value());
    if (response.IsErr()) {
        LogWarn("tools", binding.name + ": " + response.Error().ToString());
        return MakeErrorResult(response.Error());
    }

    const auto& res = response.Value();
    if (res.status_code < 200 || res.status_code >= 300) {
        return MakeErrorResult(Error::FromHttpStatus(
            binding.name, binding.operation.Label(), res.status_code, res.body));
    }
    return MakeTextResult(SuccessText(res));
}

void RegisterOpenApiTools(ToolRegistry& registry,
                          const Classification& classification,
                          IHttpClient& client) {
    for (const auto& [name, binding] : classification.tools) {
        auto registered = registry.Register(
            name, binding.description, binding.input_schema,
            [binding, &client](const nlohmann::json& arguments) {
                return InvokeTool(binding, arguments, client);
            });
        if (!registered) {
            LogWarn("tools", "Tool '" + name + "' already registered, skipped");
            continue;
        }
        if (GlobalLogger().Enabled(LogLevel::Debug)) {
            std::string inputs;
            for (const auto& param : binding.call.parameters) {
                inputs += inputs.empty() ? " " : ", ";
                inputs += param.name + "(" + ParameterLocationName(param.location) +
                          (param.required ? ", required)" : ")");
            }
            LogDebug("tools", "Registered " + name + " -> " + binding.operation.Label() + inputs);
        }
    }
}

} // namespace openapi_mcp
