#include <openapi_mcp/mcp/mcp_server.hpp>

#include <openapi_mcp/core/log.hpp>
#include <openapi_mcp/core/version.hpp>

#include <string>
#include <utility>

namespace openapi_mcp {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC 2.0 error codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

nlohmann::json Envelope(const nlohmann::json& id) {
    return {{"jsonrpc", "2.0"}, {"id", id}};
}

nlohmann::json ErrorReply(const nlohmann::json& id, int code, const std::string& message) {
    auto reply = Envelope(id);
    reply["error"] = {{"code", code}, {"message", message}};
    return reply;
}

nlohmann::json ResultReply(const nlohmann::json& id, nlohmann::json result) {
    auto reply = Envelope(id);
    reply["result"] = std::move(result);
    return reply;
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     McpServerInfo info,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), info_(std::move(info)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", info_.name + ": serving " + std::to_string(registry_.Size()) +
                       " tool(s) on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            LogWarn("mcp", "Discarding unparseable line (" +
                               std::to_string(line.size()) + " bytes)");
            Write(ErrorReply(nullptr, kParseError, "Parse error"));
            continue;
        }
        if (auto reply = HandleMessage(message)) {
            Write(*reply);
        }
    }
    LogInfo("mcp", "stdin closed, shutting down");
}

void McpServer::Write(const nlohmann::json& reply) {
    // Tool output may echo arbitrary upstream bytes.
    out_ << reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
}

std::optional<nlohmann::json> McpServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return ErrorReply(nullptr, kInvalidRequest, "Invalid Request");
    }

    const bool has_id = message.contains("id");
    const auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        if (!has_id) return std::nullopt;
        return ErrorReply(message["id"], kInvalidRequest, "Invalid JSON-RPC version");
    }

    const auto method_it = message.find("method");
    const std::string method = method_it != message.end() && method_it->is_string()
                                   ? method_it->get<std::string>()
                                   : std::string{};

    if (!has_id) {
        LogDebug("mcp", "notification " + method);
        return std::nullopt;
    }

    const auto& id = message["id"];
    auto params = message.value("params", nlohmann::json::object());
    LogDebug("mcp", "request " + method);

    using Handler = RpcResult (McpServer::*)(const nlohmann::json&);
    static const std::pair<const char*, Handler> kMethods[] = {
        {"initialize", &McpServer::Initialize},
        {"ping", &McpServer::Ping},
        {"tools/list", &McpServer::ListTools},
        {"tools/call", &McpServer::CallTool},
    };
    for (const auto& [name, handler] : kMethods) {
        if (method != name) continue;
        auto outcome = (this->*handler)(params);
        if (outcome.IsErr()) {
            return ErrorReply(id, outcome.Error().code, outcome.Error().message);
        }
        return ResultReply(id, std::move(outcome).Value());
    }
    return ErrorReply(id, kMethodNotFound, "Method not found: " + method);
}

McpServer::RpcResult McpServer::Initialize(const nlohmann::json& /*params*/) {
    initialized_ = true;

    nlohmann::json result = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", info_.name}, {"version", kVersion}}},
    };
    if (!info_.instructions.empty()) {
        result["instructions"] = info_.instructions;
    }
    return RpcResult::Ok(std::move(result));
}

McpServer::RpcResult McpServer::Ping(const nlohmann::json& /*params*/) {
    return RpcResult::Ok(nlohmann::json::object());
}

McpServer::RpcResult McpServer::ListTools(const nlohmann::json& /*params*/) {
    auto tools = nlohmann::json::array();
    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema},
        });
    }
    return RpcResult::Ok(nlohmann::json{{"tools", std::move(tools)}});
}

McpServer::RpcResult McpServer::CallTool(const nlohmann::json& params) {
    const auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return RpcResult::Err({kInvalidParams, "Missing 'name' parameter"});
    }
    const auto tool_name = name_it->get<std::string>();
    if (!registry_.HasTool(tool_name)) {
        return RpcResult::Err({kInvalidParams, "Unknown tool: " + tool_name});
    }

    auto arguments = params.value("arguments", nlohmann::json::object());
    auto outcome = registry_.Execute(tool_name, arguments);

    nlohmann::json result = {{"content", std::move(outcome.content)}};
    if (outcome.is_error) {
        result["isError"] = true;
    }
    return RpcResult::Ok(std::move(result));
}

} // namespace openapi_mcp
