#include <openapi_mcp/config/config_loader.hpp>

#include <openapi_mcp/core/url.hpp>
#include <openapi_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <vector>

namespace openapi_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

// Filter fields accept either "a,b" or a YAML sequence [a, b].
std::optional<std::string> ReadListField(const YAML::Node& node) {
    if (!node) return std::nullopt;
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!joined.empty()) joined += ",";
            joined += item.as<std::string>();
        }
        return joined;
    }
    return node.as<std::string>();
}

void ReadOptionalString(const YAML::Node& node, std::optional<std::string>& out) {
    if (node) out = node.as<std::string>();
}

void ReadString(const YAML::Node& node, std::string& out) {
    if (node) out = node.as<std::string>();
}

void ReadBool(const YAML::Node& node, bool& out) {
    if (node) out = node.as<bool>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        ReadString(root["openapi"], config.openapi_source);
        ReadString(root["name"], config.server_name);
        ReadOptionalString(root["base_url"], config.base_url);
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        ReadBool(root["insecure"], config.disable_tls_verify);

        // -- Auth --
        if (const auto auth = root["auth"]) {
            ReadString(auth["type"], config.auth.auth_type);
            ReadOptionalString(auth["api_key"], config.auth.api_key);
            ReadString(auth["api_key_header"], config.auth.api_key_header);
            ReadString(auth["api_key_location"], config.auth.api_key_location);
            ReadString(auth["api_key_param_name"], config.auth.api_key_param_name);
            ReadOptionalString(auth["bearer_token"], config.auth.bearer_token);
            ReadOptionalString(auth["username"], config.auth.username);
            ReadOptionalString(auth["password"], config.auth.password);
        }
        if (const auto headers = root["headers"]) {
            if (headers.IsMap()) {
                for (const auto& kv : headers) {
                    config.auth.headers.push_back(kv.first.as<std::string>() + ": " +
                                                  kv.second.as<std::string>());
                }
            } else {
                for (const auto& line : headers) {
                    config.auth.headers.push_back(line.as<std::string>());
                }
            }
        }

        // -- Filters --
        if (const auto filters = root["filters"]) {
            config.filters.methods = ReadListField(filters["methods"]);
            config.filters.include_paths = ReadListField(filters["include_paths"]);
            config.filters.exclude_paths = ReadListField(filters["exclude_paths"]);
            config.filters.include_tags = ReadListField(filters["include_tags"]);
            config.filters.exclude_tags = ReadListField(filters["exclude_tags"]);
            if (filters["precedence"]) {
                auto parsed = ParseFilterPrecedence(filters["precedence"].as<std::string>());
                if (parsed.IsErr()) {
                    return Result<AppConfig, Error>::Err(MakeConfigError(parsed.Error()));
                }
                config.filters.precedence = parsed.Value();
            }
        }

        // -- Logging --
        if (const auto logging = root["logging"]) {
            ReadBool(logging["verbose"], config.logging.verbose);
            ReadBool(logging["debug"], config.logging.debug);
            ReadBool(logging["json"], config.logging.json);
            ReadBool(logging["no_color"], config.logging.no_color);
            ReadOptionalString(logging["file"], config.logging.log_file);
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("openapi-mcp", kVersion);
    program.add_description(
        "Expose the operations of an OpenAPI document as MCP tools over stdio.");

    program.add_argument("openapi")
        .help("OpenAPI document: file path or http(s) URL")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string{});

    // Server
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--name")
        .help("Server name reported to MCP clients");
    program.add_argument("--base-url")
        .help("Override the API base URL from the document");
    program.add_argument("--timeout")
        .help("Outgoing request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);

    // Authentication
    program.add_argument("--auth-type")
        .help("Authentication type: none, api_key, bearer, basic");
    program.add_argument("--api-key")
        .help("API key (env: API_KEY)");
    program.add_argument("--api-key-header")
        .help("Header carrying the API key (default: X-API-Key)");
    program.add_argument("--api-key-location")
        .help("Where the API key goes: header or query (env: API_KEY_LOCATION)");
    program.add_argument("--api-key-param-name")
        .help("Query parameter name for the API key (env: API_KEY_PARAM_NAME)");
    program.add_argument("--bearer-token")
        .help("Bearer token (env: BEARER_TOKEN)");
    program.add_argument("--username")
        .help("Basic auth username (env: USERNAME)");
    program.add_argument("--password")
        .help("Basic auth password (env: PASSWORD)");
    program.add_argument("--header")
        .help("Custom header 'Name: Value', may be repeated")
        .append();

    // Filters
    program.add_argument("--methods")
        .help("Comma-separated HTTP methods to expose (e.g. GET,POST)");
    program.add_argument("--include-paths")
        .help("Comma-separated regex patterns of paths to include");
    program.add_argument("--exclude-paths")
        .help("Comma-separated regex patterns of paths to exclude");
    program.add_argument("--include-tags")
        .help("Comma-separated tags to include");
    program.add_argument("--exclude-tags")
        .help("Comma-separated tags to exclude");
    program.add_argument("--filter-precedence")
        .help("exclusion-wins (default) or first-match");

    // Logging
    program.add_argument("-v", "--verbose")
        .help("Log requests at info level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Log at debug level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-json")
        .help("Emit log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write logs to a file instead of stderr");
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    config.openapi_source = program.get<std::string>("openapi");
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--name")) {
        config.server_name = *val;
    }
    if (auto val = program.present("--base-url")) {
        config.base_url = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.disable_tls_verify = true;
    }

    // Authentication
    if (auto val = program.present("--auth-type")) {
        config.auth.auth_type = *val;
    }
    if (auto val = program.present("--api-key")) {
        config.auth.api_key = *val;
    }
    if (auto val = program.present("--api-key-header")) {
        config.auth.api_key_header = *val;
    }
    if (auto val = program.present("--api-key-location")) {
        config.auth.api_key_location = *val;
    }
    if (auto val = program.present("--api-key-param-name")) {
        config.auth.api_key_param_name = *val;
    }
    if (auto val = program.present("--bearer-token")) {
        config.auth.bearer_token = *val;
    }
    if (auto val = program.present("--username")) {
        config.auth.username = *val;
    }
    if (auto val = program.present("--password")) {
        config.auth.password = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--header")) {
        config.auth.headers = *val;
    }

    // Filters
    config.filters.methods = program.present("--methods");
    config.filters.include_paths = program.present("--include-paths");
    config.filters.exclude_paths = program.present("--exclude-paths");
    config.filters.include_tags = program.present("--include-tags");
    config.filters.exclude_tags = program.present("--exclude-tags");
    if (auto val = program.present("--filter-precedence")) {
        auto parsed = ParseFilterPrecedence(*val);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --filter-precedence: " + parsed.Error()));
        }
        config.filters.precedence = parsed.Value();
    }

    // Logging
    config.logging.verbose = program.get<bool>("--verbose");
    config.logging.debug = program.get<bool>("--debug");
    config.logging.json = program.get<bool>("--log-json");
    config.logging.no_color = program.get<bool>("--no-color");
    if (auto val = program.present("--log-file")) {
        config.logging.log_file = *val;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const AppConfig defaults;

    if (!cli_overrides.openapi_source.empty()) {
        merged.openapi_source = cli_overrides.openapi_source;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.server_name != defaults.server_name) {
        merged.server_name = cli_overrides.server_name;
    }
    if (cli_overrides.base_url.has_value()) {
        merged.base_url = cli_overrides.base_url;
    }
    if (cli_overrides.timeout_seconds != defaults.timeout_seconds) {
        merged.timeout_seconds = cli_overrides.timeout_seconds;
    }
    if (cli_overrides.disable_tls_verify) {
        merged.disable_tls_verify = true;
    }

    // Authentication
    const auto& cli_auth = cli_overrides.auth;
    if (cli_auth.auth_type != defaults.auth.auth_type) {
        merged.auth.auth_type = cli_auth.auth_type;
    }
    if (cli_auth.api_key.has_value()) {
        merged.auth.api_key = cli_auth.api_key;
    }
    if (cli_auth.api_key_header != defaults.auth.api_key_header) {
        merged.auth.api_key_header = cli_auth.api_key_header;
    }
    if (cli_auth.api_key_location != defaults.auth.api_key_location) {
        merged.auth.api_key_location = cli_auth.api_key_location;
    }
    if (cli_auth.api_key_param_name != defaults.auth.api_key_param_name) {
        merged.auth.api_key_param_name = cli_auth.api_key_param_name;
    }
    if (cli_auth.bearer_token.has_value()) {
        merged.auth.bearer_token = cli_auth.bearer_token;
    }
    if (cli_auth.username.has_value()) {
        merged.auth.username = cli_auth.username;
    }
    if (cli_auth.password.has_value()) {
        merged.auth.password = cli_auth.password;
    }
    // Header lists accumulate; CLI lines come last so they win on a clash.
    merged.auth.headers.insert(merged.auth.headers.end(),
                               cli_auth.headers.begin(), cli_auth.headers.end());

    // Filters
    const auto& cli_filters = cli_overrides.filters;
    if (cli_filters.methods.has_value()) {
        merged.filters.methods = cli_filters.methods;
    }
    if (cli_filters.include_paths.has_value()) {
        merged.filters.include_paths = cli_filters.include_paths;
    }
    if (cli_filters.exclude_paths.has_value()) {
        merged.filters.exclude_paths = cli_filters.exclude_paths;
    }
    if (cli_filters.include_tags.has_value()) {
        merged.filters.include_tags = cli_filters.include_tags;
    }
    if (cli_filters.exclude_tags.has_value()) {
        merged.filters.exclude_tags = cli_filters.exclude_tags;
    }
    if (cli_filters.precedence != defaults.filters.precedence) {
        merged.filters.precedence = cli_filters.precedence;
    }

    // Logging
    if (cli_overrides.logging.verbose) {
        merged.logging.verbose = true;
    }
    if (cli_overrides.logging.debug) {
        merged.logging.debug = true;
    }
    if (cli_overrides.logging.json) {
        merged.logging.json = true;
    }
    if (cli_overrides.logging.no_color) {
        merged.logging.no_color = true;
    }
    if (cli_overrides.logging.log_file.has_value()) {
        merged.logging.log_file = cli_overrides.logging.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveEnvironment
// ---------------------------------------------------------------------------
std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

AppConfig ResolveEnvironment(AppConfig config, const EnvLookup& lookup) {
    auto& auth = config.auth;
    const AuthSettings defaults;

    const auto fill = [&lookup](std::optional<std::string>& field,
                                const std::string& env_name) {
        if (field.has_value() && !field->empty()) return;
        if (auto val = lookup(env_name)) {
            field = *val;
        }
    };
    fill(auth.api_key, "API_KEY");
    fill(auth.bearer_token, "BEARER_TOKEN");
    fill(auth.username, "USERNAME");
    fill(auth.password, "PASSWORD");

    if (auth.api_key_location == defaults.api_key_location) {
        if (auto val = lookup("API_KEY_LOCATION"); val && !val->empty()) {
            auth.api_key_location = *val;
        }
    }
    if (auth.api_key_param_name == defaults.api_key_param_name) {
        if (auto val = lookup("API_KEY_PARAM_NAME"); val && !val->empty()) {
            auth.api_key_param_name = *val;
        }
    }

    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.openapi_source.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing OpenAPI document: pass a file path or URL, or set 'openapi' in the config file"));
    }
    if (config.server_name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.timeout_seconds)));
    }
    if (config.base_url.has_value() && !IsHttpUrl(*config.base_url)) {
        return Result<void, Error>::Err(
            MakeConfigError("Base URL must start with http:// or https://, got '" +
                            *config.base_url + "'"));
    }
    return Result<void, Error>::Ok();
}

} // namespace openapi_mcp
