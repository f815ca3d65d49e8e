#pragma once

#include <openapi_mcp/auth/auth_config.hpp>
#include <openapi_mcp/filter/filter_options.hpp>

#include <optional>
#include <string>

namespace openapi_mcp {

inline constexpr const char* kDefaultServerName = "OpenAPI MCP Server";
inline constexpr int kDefaultTimeoutSeconds = 30;

struct LoggingConfig {
    bool verbose = false;
    bool debug = false;
    bool json = false;
    bool no_color = false;
    std::optional<std::string> log_file;
};

struct AppConfig {
    std::string openapi_source;             // file path or http(s) URL
    std::optional<std::string> config_file; // -c/--config
    std::string server_name = kDefaultServerName;
    std::optional<std::string> base_url;
    int timeout_seconds = kDefaultTimeoutSeconds;
    bool disable_tls_verify = false;
    AuthSettings auth;
    FilterOptions filters;
    LoggingConfig logging;
};

} // namespace openapi_mcp
