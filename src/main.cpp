#include <openapi_mcp/config/config_loader.hpp>
#include <openapi_mcp/core/log.hpp>
#include <openapi_mcp/core/terminal.hpp>
#include <openapi_mcp/http/http_client.hpp>
#include <openapi_mcp/mcp/mcp_server.hpp>
#include <openapi_mcp/mcp/openapi_tool_handlers.hpp>
#include <openapi_mcp/openapi/openapi_document.hpp>
#include <openapi_mcp/workflow/server_setup.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

void PrintError(const openapi_mcp::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// Logs go to stderr (or --log-file); stdout carries the MCP protocol.
void InitLogging(const openapi_mcp::LoggingConfig& logging) {
    using namespace openapi_mcp;

    const auto level = LevelForFlags(logging.verbose, logging.debug);

    static std::ofstream log_file;
    std::ostream* out = &std::cerr;
    bool to_terminal = true;
    if (logging.log_file.has_value()) {
        log_file.open(*logging.log_file, std::ios::app);
        if (log_file) {
            out = &log_file;
            to_terminal = false;
        } else {
            std::cerr << "Warning: cannot open log file " << *logging.log_file
                      << ", logging to stderr\n";
        }
    }

    if (logging.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(*out), level);
    } else {
        bool use_color = ResolveLogColor(to_terminal, logging.no_color);
        InitGlobalLogger(std::make_unique<ConsoleSink>(use_color, *out), level);
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace openapi_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error(), false);
        return cli.Error().ExitCode();
    }

    AppConfig config = std::move(cli).Value();
    if (config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*config.config_file);
        if (yaml.IsErr()) {
            PrintError(yaml.Error(), config.logging.json);
            return yaml.Error().ExitCode();
        }
        config = MergeConfigs(yaml.Value(), config);
    }
    config = ResolveEnvironment(std::move(config));

    InitLogging(config.logging);
    const bool json_errors = config.logging.json;

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), json_errors);
        return valid.Error().ExitCode();
    }

    const auto timeout = std::chrono::seconds(config.timeout_seconds);
    auto document = LoadOpenApiSource(config.openapi_source, timeout);
    if (document.IsErr()) {
        PrintError(document.Error(), json_errors);
        return document.Error().ExitCode();
    }

    auto plan_result = PlanServer(config, document.Value());
    if (plan_result.IsErr()) {
        PrintError(plan_result.Error(), json_errors);
        return plan_result.Error().ExitCode();
    }
    auto plan = std::move(plan_result).Value();

    HttpClientOptions http_options;
    http_options.timeout = timeout;
    http_options.disable_tls_verify = config.disable_tls_verify;
    HttpClient client(plan.base_url, plan.augmentation, http_options);

    ToolRegistry registry;
    RegisterOpenApiTools(registry, plan.classification, client);
    LogInfo("main", plan.api.title + " " + plan.api.version + ": " +
                        std::to_string(registry.Size()) + " tool(s) at " +
                        plan.base_url.origin + plan.base_url.path_prefix);

    McpServer server(std::move(registry),
                     McpServerInfo{plan.server_name, plan.Instructions()});
    server.Run();

    return kExitSuccess;
}
