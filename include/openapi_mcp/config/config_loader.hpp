#pragma once

#include <openapi_mcp/config/app_config.hpp>
#include <openapi_mcp/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace openapi_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// A CLI field still holding its default does not replace the YAML value.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> GetEnv(const std::string& name);

// Fill auth settings from the environment: API_KEY, BEARER_TOKEN, USERNAME
// and PASSWORD when not configured; API_KEY_LOCATION and
// API_KEY_PARAM_NAME while those settings still hold their defaults.
AppConfig ResolveEnvironment(AppConfig config, const EnvLookup& lookup = GetEnv);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace openapi_mcp
