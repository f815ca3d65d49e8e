#include <openapi_mcp/openapi/request_builder.hpp>

#include <vector>

namespace openapi_mcp {

namespace {

Error MakeArgumentError(const CallTemplate& call, const std::string& message) {
    return Error{"BuildRequest",
                 std::string(HttpMethodName(call.method)) + " " + call.path_template,
                 std::nullopt, message, std::nullopt, ErrorCategory::Validation};
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

std::string ArgumentToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

Result<OutgoingRequest, Error> BuildRequest(const CallTemplate& call,
                                            const nlohmann::json& arguments) {
    using R = Result<OutgoingRequest, Error>;

    if (!arguments.is_null() && !arguments.is_object()) {
        return R::Err(MakeArgumentError(call, "Tool arguments must be a JSON object"));
    }
    static const nlohmann::json kNoArguments = nlohmann::json::object();
    const auto& args = arguments.is_object() ? arguments : kNoArguments;

    std::vector<std::string> missing;
    for (const auto& param : call.parameters) {
        auto it = args.find(param.name);
        if (param.required && (it == args.end() || it->is_null())) {
            missing.push_back(param.name);
        }
    }
    if (!missing.empty()) {
        std::string joined;
        for (const auto& name : missing) {
            if (!joined.empty()) joined += ", ";
            joined += name;
        }
        return R::Err(MakeArgumentError(call, "Missing required argument(s): " + joined));
    }

    OutgoingRequest request;
    request.method = call.method;
    request.path = call.path_template;

    for (const auto& param : call.parameters) {
        auto it = args.find(param.name);
        if (it == args.end() || it->is_null()) {
            continue;
        }
        const auto& value = *it;

        switch (param.location) {
            case ParameterLocation::Path:
                ReplaceAll(request.path, "{" + param.name + "}",
                           UrlEncode(ArgumentToString(value)));
                break;
            case ParameterLocation::Query:
                if (value.is_array()) {
                    for (const auto& item : value) {
                        request.query.emplace_back(param.name, ArgumentToString(item));
                    }
                } else {
                    request.query.emplace_back(param.name, ArgumentToString(value));
                }
                break;
            case ParameterLocation::Header:
                request.headers[param.name] = ArgumentToString(value);
                break;
            case ParameterLocation::Body:
                request.body = value.dump();
                request.content_type = "application/json";
                break;
        }
    }

    auto open = request.path.find('{');
    if (open != std::string::npos && request.path.find('}', open) != std::string::npos) {
        return R::Err(MakeArgumentError(
            call, "Unresolved path parameter in " + request.path));
    }

    return R::Ok(std::move(request));
}

} // namespace openapi_mcp
