#include <openapi_mcp/auth/auth_config.hpp>

namespace openapi_mcp {

namespace {

Error MakeAuthError(const std::string& auth_type, const std::string& message,
                    ErrorCategory category = ErrorCategory::Config) {
    return Error{"BuildAuthConfig", auth_type, std::nullopt, message, std::nullopt,
                 category};
}

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

bool Present(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

} // anonymous namespace

ParsedHeaders ParseCustomHeaders(const std::vector<std::string>& lines) {
    ParsedHeaders parsed;
    for (const auto& line : lines) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            parsed.warnings.push_back("Invalid header format: " + line);
            continue;
        }
        auto name = Trim(line.substr(0, colon));
        if (name.empty()) {
            parsed.warnings.push_back("Invalid header format: " + line);
            continue;
        }
        parsed.headers[name] = Trim(line.substr(colon + 1));
    }
    return parsed;
}

Result<AuthConfig, Error> BuildAuthConfig(const AuthSettings& settings,
                                          HttpHeaders custom_headers) {
    using R = Result<AuthConfig, Error>;
    const auto& type = settings.auth_type;

    if (type != "none" && type != "api_key" && type != "bearer" && type != "basic") {
        return R::Err(MakeAuthError(
            type, "Unknown auth type '" + type +
                      "' (expected none, api_key, bearer or basic)"));
    }

    std::vector<std::string> missing;
    if (type == "api_key" && !Present(settings.api_key)) {
        missing.push_back("api_key");
    }
    if (type == "bearer" && !Present(settings.bearer_token)) {
        missing.push_back("bearer_token");
    }
    if (type == "basic") {
        if (!Present(settings.username)) missing.push_back("username");
        if (!Present(settings.password)) missing.push_back("password");
    }
    if (!missing.empty()) {
        std::string joined;
        for (const auto& field : missing) {
            if (!joined.empty()) joined += ", ";
            joined += field;
        }
        return R::Err(MakeAuthError(
            type, joined + " required for " + type + " authentication",
            ErrorCategory::MissingCredential));
    }

    if (type != "api_key") {
        if (settings.api_key_location != "header") {
            return R::Err(MakeAuthError(
                type, "api_key_location is only valid when auth type is api_key"));
        }
    } else if (settings.api_key_location != "header" &&
               settings.api_key_location != "query") {
        return R::Err(MakeAuthError(
            type, "api_key_location must be either 'header' or 'query', got '" +
                      settings.api_key_location + "'"));
    }

    AuthConfig config;
    config.custom_headers = std::move(custom_headers);

    if (type == "api_key") {
        ApiKeyAuth api_key;
        api_key.value = *settings.api_key;
        if (settings.api_key_location == "query") {
            if (settings.api_key_param_name.empty()) {
                return R::Err(MakeAuthError(
                    type, "api_key_param_name must be provided when "
                          "api_key_location is query"));
            }
            api_key.location = ApiKeyLocation::Query;
            api_key.name = settings.api_key_param_name;
        } else {
            if (settings.api_key_header.empty()) {
                return R::Err(MakeAuthError(
                    type, "api_key_header must not be empty"));
            }
            api_key.location = ApiKeyLocation::Header;
            api_key.name = settings.api_key_header;
        }
        config.scheme = std::move(api_key);
    } else if (type == "bearer") {
        config.scheme = BearerAuth{*settings.bearer_token};
    } else if (type == "basic") {
        config.scheme = BasicAuth{*settings.username, *settings.password};
    }

    return R::Ok(std::move(config));
}

} // namespace openapi_mcp
