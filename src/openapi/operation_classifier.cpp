#include <openapi_mcp/openapi/operation_classifier.hpp>

namespace openapi_mcp {

namespace {

bool IsAsciiAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9');
}

char AsciiLower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

ToolBinding MakeBinding(std::string name,
                        const OperationDescriptor& operation,
                        const std::string& base_url) {
    CallTemplate call;
    call.base_url = base_url;
    call.method = operation.method;
    call.path_template = operation.path;
    for (const auto& param : operation.parameters) {
        call.parameters.push_back({param.name, param.location, param.required});
    }

    return ToolBinding{std::move(name), operation, std::move(call),
                       BuildToolDescription(operation),
                       BuildInputSchema(operation)};
}

// Tool arguments are keyed by name alone, so one name in two locations
// cannot be told apart.
std::optional<Error> CheckParameterNames(const OperationDescriptor& operation) {
    for (size_t i = 0; i < operation.parameters.size(); ++i) {
        const auto& later = operation.parameters[i];
        for (size_t j = 0; j < i; ++j) {
            const auto& earlier = operation.parameters[j];
            if (earlier.name != later.name) continue;
            return Error{"ClassifyOperations", operation.Label(), std::nullopt,
                         "Parameter '" + later.name + "' is declared in both " +
                             ParameterLocationName(earlier.location) + " and " +
                             ParameterLocationName(later.location),
                         std::nullopt, ErrorCategory::Document};
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::string DeriveToolName(HttpMethod method, std::string_view path) {
    std::string name;
    for (const char* p = HttpMethodName(method); *p != '\0'; ++p) {
        name += AsciiLower(*p);
    }

    // The method prefix is always separated from the first path token.
    bool pending_separator = true;
    for (char c : path) {
        if (IsAsciiAlnum(c)) {
            if (pending_separator) {
                name += '_';
                pending_separator = false;
            }
            name += AsciiLower(c);
        } else {
            pending_separator = true;
        }
    }
    return name;
}

nlohmann::json BuildInputSchema(const OperationDescriptor& operation) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& param : operation.parameters) {
        if (properties.contains(param.name)) {
            continue;
        }
        nlohmann::json prop = param.schema.is_object()
                                  ? param.schema
                                  : nlohmann::json::object();
        if (param.description.has_value() && !prop.contains("description")) {
            prop["description"] = *param.description;
        }
        properties[param.name] = std::move(prop);
        if (param.required) {
            required.push_back(param.name);
        }
    }

    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

std::string BuildToolDescription(const OperationDescriptor& operation) {
    std::string text;
    if (operation.summary.has_value() && !operation.summary->empty()) {
        text = *operation.summary;
    }
    if (operation.description.has_value() && !operation.description->empty()) {
        if (!text.empty()) text += "\n\n";
        text += *operation.description;
    }
    if (text.empty()) {
        text = operation.Label();
    }
    return text;
}

RouteOutcome ClassifyOperation(const OperationDescriptor& operation,
                               const std::optional<RouteRules>& rules) {
    if (!rules.has_value()) {
        return RouteOutcome::Tool;
    }
    for (const auto& rule : *rules) {
        if (rule.Matches(operation)) {
            return rule.outcome;
        }
    }
    return RouteOutcome::Tool;
}

Result<Classification, Error> ClassifyOperations(
    const std::vector<OperationDescriptor>& operations,
    const std::optional<RouteRules>& rules,
    const std::string& base_url) {
    Classification result;

    for (const auto& operation : operations) {
        if (ClassifyOperation(operation, rules) == RouteOutcome::Exclude) {
            result.excluded.push_back(operation);
            continue;
        }
        if (auto clash = CheckParameterNames(operation)) {
            return Result<Classification, Error>::Err(std::move(*clash));
        }

        auto name = DeriveToolName(operation.method, operation.path);
        auto existing = result.tools.find(name);
        if (existing != result.tools.end()) {
            return Result<Classification, Error>::Err(Error{
                "ClassifyOperations", name, std::nullopt,
                "Tool name '" + name + "' is derived from both " +
                    existing->second.operation.Label() + " and " +
                    operation.Label(),
                std::nullopt, ErrorCategory::NameCollision});
        }
        result.tools.emplace(name, MakeBinding(name, operation, base_url));
    }

    return Result<Classification, Error>::Ok(std::move(result));
}

} // namespace openapi_mcp
