#include <openapi_mcp/openapi/openapi_document.hpp>

#include <openapi_mcp/core/log.hpp>
#include <openapi_mcp/core/url.hpp>

#include <httplib.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace openapi_mcp {

namespace {

// Upper bound on nodes produced while inlining one subtree. Schemas that
// share a definition from many places are expanded once per use; past the
// budget further references are left as empty schemas.
constexpr size_t kMaxInlinedNodes = 100000;

Error MakeDocumentError(const std::string& subject, const std::string& message) {
    return Error{"OpenApiDocument", subject, std::nullopt, message, std::nullopt,
                 ErrorCategory::Document};
}

// ---------------------------------------------------------------------------
// YAML -> JSON
// ---------------------------------------------------------------------------

nlohmann::json ScalarToJson(const YAML::Node& node) {
    const auto& text = node.Scalar();
    // Quoted scalars carry the non-specific tag "!" and stay strings.
    if (node.Tag() == "!") {
        return text;
    }
    if (text.empty() || text == "~" || text == "null" || text == "Null" ||
        text == "NULL") {
        return nullptr;
    }
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;

    try {
        return node.as<long long>();
    } catch (const YAML::BadConversion&) {
    }
    try {
        return node.as<double>();
    } catch (const YAML::BadConversion&) {
    }
    return text;
}

nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return ScalarToJson(node);
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// $ref inlining
// ---------------------------------------------------------------------------

// Replaces local $refs with their targets. A reference to a definition that
// is already being expanded further up (a cycle) becomes {}, the empty
// schema, so recursive types stay finite.
class RefInliner {
public:
    explicit RefInliner(const nlohmann::json& document) : document_(document) {}

    Result<nlohmann::json, Error> Inline(const nlohmann::json& node) {
        using R = Result<nlohmann::json, Error>;
        ++emitted_;

        if (node.is_object()) {
            auto ref = node.find("$ref");
            if (ref != node.end() && ref->is_string()) {
                return Expand(ref->get<std::string>());
            }
            auto out = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                auto inlined = Inline(it.value());
                if (inlined.IsErr()) return inlined;
                out[it.key()] = std::move(inlined).Value();
            }
            return R::Ok(std::move(out));
        }

        if (node.is_array()) {
            auto out = nlohmann::json::array();
            for (const auto& item : node) {
                auto inlined = Inline(item);
                if (inlined.IsErr()) return inlined;
                out.push_back(std::move(inlined).Value());
            }
            return R::Ok(std::move(out));
        }

        return R::Ok(node);
    }

private:
    Result<nlohmann::json, Error> Expand(const std::string& target) {
        using R = Result<nlohmann::json, Error>;
        if (target.rfind("#/", 0) != 0) {
            return R::Err(MakeDocumentError(
                target, "Only local references (#/...) are supported"));
        }

        const nlohmann::json* resolved = nullptr;
        try {
            resolved = &document_.at(nlohmann::json::json_pointer(target.substr(1)));
        } catch (const nlohmann::json::exception&) {
            return R::Err(MakeDocumentError(target, "Unresolvable $ref"));
        }

        if (std::find(active_.begin(), active_.end(), target) != active_.end()) {
            return R::Ok(nlohmann::json::object());
        }
        if (emitted_ > kMaxInlinedNodes) {
            if (!budget_reported_) {
                LogWarn("openapi", "Schema too large to inline, truncated at " + target);
                budget_reported_ = true;
            }
            return R::Ok(nlohmann::json::object());
        }

        active_.push_back(target);
        auto inlined = Inline(*resolved);
        active_.pop_back();
        return inlined;
    }

    const nlohmann::json& document_;
    std::vector<std::string> active_;
    size_t emitted_ = 0;
    bool budget_reported_ = false;
};

Result<nlohmann::json, Error> InlineRefs(const nlohmann::json& document,
                                         const nlohmann::json& node) {
    return RefInliner(document).Inline(node);
}

// ---------------------------------------------------------------------------
// Parameters
// ---------------------------------------------------------------------------

std::optional<std::string> OptString(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// Swagger 2.0 declares type/format/items/enum directly on the parameter.
nlohmann::json Swagger2Schema(const nlohmann::json& param) {
    auto schema = nlohmann::json::object();
    for (const char* key : {"type", "format", "items", "enum", "default",
                            "minimum", "maximum", "pattern"}) {
        if (param.contains(key)) {
            schema[key] = param[key];
        }
    }
    return schema;
}

// nullopt for parameters that are not exposed (cookie, formData).
std::optional<OperationParameter> ToParameter(const nlohmann::json& param) {
    const auto in = OptString(param, "in").value_or("");
    const auto name = OptString(param, "name").value_or("");

    OperationParameter out;
    if (in == "path") {
        out.location = ParameterLocation::Path;
    } else if (in == "query") {
        out.location = ParameterLocation::Query;
    } else if (in == "header") {
        out.location = ParameterLocation::Header;
    } else if (in == "body") {
        out.location = ParameterLocation::Body;
    } else {
        return std::nullopt;
    }

    if (out.location == ParameterLocation::Body) {
        out.name = "body";
    } else if (name.empty()) {
        return std::nullopt;
    } else {
        out.name = name;
    }

    out.required = out.location == ParameterLocation::Path ||
                   param.value("required", false);
    if (param.contains("schema") && param["schema"].is_object()) {
        out.schema = param["schema"];
    } else {
        out.schema = Swagger2Schema(param);
    }
    out.description = OptString(param, "description");
    return out;
}

Result<std::vector<OperationParameter>, Error> CollectParameters(
    const nlohmann::json& document,
    const nlohmann::json& path_item,
    const nlohmann::json& operation,
    const std::string& label) {
    using R = Result<std::vector<OperationParameter>, Error>;

    std::vector<OperationParameter> merged;
    auto add_all = [&](const nlohmann::json& owner) -> Result<void, Error> {
        auto it = owner.find("parameters");
        if (it == owner.end()) return Result<void, Error>::Ok();
        if (!it->is_array()) {
            return Result<void, Error>::Err(
                MakeDocumentError(label, "'parameters' must be an array"));
        }
        for (const auto& raw : *it) {
            auto inlined = InlineRefs(document, raw);
            if (inlined.IsErr()) {
                return Result<void, Error>::Err(std::move(inlined).Error());
            }
            auto param = ToParameter(inlined.Value());
            if (!param.has_value()) {
                LogDebug("openapi", label + ": skipping unsupported parameter " +
                                        inlined.Value().dump());
                continue;
            }
            // A later declaration (operation level) replaces an earlier one
            // with the same name and location (path level).
            bool replaced = false;
            for (auto& existing : merged) {
                if (existing.name == param->name &&
                    existing.location == param->location) {
                    existing = *param;
                    replaced = true;
                    break;
                }
            }
            if (!replaced) merged.push_back(std::move(*param));
        }
        return Result<void, Error>::Ok();
    };

    auto path_level = add_all(path_item);
    if (path_level.IsErr()) return R::Err(std::move(path_level).Error());
    auto op_level = add_all(operation);
    if (op_level.IsErr()) return R::Err(std::move(op_level).Error());
    return R::Ok(std::move(merged));
}

// OpenAPI 3 requestBody -> "body" parameter. Prefers application/json, then
// any *json media type, then the first declared one.
Result<std::optional<OperationParameter>, Error> RequestBodyParameter(
    const nlohmann::json& document, const nlohmann::json& operation) {
    using R = Result<std::optional<OperationParameter>, Error>;

    auto it = operation.find("requestBody");
    if (it == operation.end()) return R::Ok(std::optional<OperationParameter>());

    auto inlined = InlineRefs(document, *it);
    if (inlined.IsErr()) return R::Err(std::move(inlined).Error());
    const auto& body = inlined.Value();

    OperationParameter param;
    param.name = "body";
    param.location = ParameterLocation::Body;
    param.required = body.value("required", false);
    param.description = OptString(body, "description");

    auto content = body.find("content");
    if (content != body.end() && content->is_object() && !content->empty()) {
        auto media = content->find("application/json");
        if (media == content->end()) {
            for (auto c = content->begin(); c != content->end(); ++c) {
                if (c.key().find("json") != std::string::npos) {
                    media = c;
                    break;
                }
            }
        }
        if (media == content->end()) {
            media = content->begin();
        }
        if (media->is_object() && media->contains("schema")) {
            param.schema = (*media)["schema"];
        }
    }
    return R::Ok(std::optional<OperationParameter>(std::move(param)));
}

std::string SubstituteServerVariables(std::string url, const nlohmann::json& server) {
    auto vars = server.find("variables");
    if (vars == server.end() || !vars->is_object()) return url;
    for (auto it = vars->begin(); it != vars->end(); ++it) {
        if (!it->is_object() || !it->contains("default")) continue;
        const auto placeholder = "{" + it.key() + "}";
        const auto value = (*it)["default"].is_string()
                               ? (*it)["default"].get<std::string>()
                               : (*it)["default"].dump();
        for (auto pos = url.find(placeholder); pos != std::string::npos;
             pos = url.find(placeholder, pos + value.size())) {
            url.replace(pos, placeholder.size(), value);
        }
    }
    return url;
}

std::string StripTrailingSlash(std::string url) {
    while (url.size() > 1 && url.back() == '/') url.pop_back();
    return url;
}

Result<std::string, Error> FetchUrl(const std::string& url,
                                    std::chrono::seconds timeout) {
    using R = Result<std::string, Error>;

    auto base = ParseBaseUrl(url);
    if (base.IsErr()) {
        return R::Err(MakeDocumentError(url, base.Error()));
    }
    // Everything after the origin, query string included.
    auto path = url.substr(base.Value().origin.size());
    if (path.empty()) path = "/";

    httplib::Client client(base.Value().origin);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_follow_location(true);

    LogInfo("openapi", "Fetching OpenAPI document from " + url);
    auto res = client.Get(path);
    if (!res) {
        return R::Err(MakeDocumentError(
            url, "HTTP request failed: " + httplib::to_string(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        auto err = Error::FromHttpStatus("OpenApiDocument", url, res->status, res->body);
        err.category = ErrorCategory::Document;
        return R::Err(std::move(err));
    }
    return R::Ok(res->body);
}

Result<std::string, Error> ReadFile(const std::string& path) {
    using R = Result<std::string, Error>;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::Err(MakeDocumentError(path, "File not found: " + path));
    }
    LogInfo("openapi", "Loading OpenAPI document from " + path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return R::Ok(buffer.str());
}

} // anonymous namespace

Result<nlohmann::json, Error> LoadOpenApiSource(const std::string& source,
                                                std::chrono::seconds timeout) {
    auto content = IsHttpUrl(source) ? FetchUrl(source, timeout) : ReadFile(source);
    if (content.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(content).Error());
    }
    return ParseOpenApiText(content.Value(), source);
}

Result<nlohmann::json, Error> ParseOpenApiText(std::string_view content,
                                               const std::string& origin) {
    using R = Result<nlohmann::json, Error>;

    auto parsed = nlohmann::json::parse(content.begin(), content.end(), nullptr, false);
    if (!parsed.is_discarded()) {
        if (!parsed.is_object()) {
            return R::Err(MakeDocumentError(origin, "Document root must be an object"));
        }
        return R::Ok(std::move(parsed));
    }

    nlohmann::json converted;
    try {
        converted = YamlToJson(YAML::Load(std::string(content)));
    } catch (const YAML::Exception& e) {
        return R::Err(MakeDocumentError(
            origin, "Document is neither valid JSON nor YAML: " + std::string(e.what())));
    }
    if (!converted.is_object()) {
        return R::Err(MakeDocumentError(origin, "Document root must be an object"));
    }
    return R::Ok(std::move(converted));
}

ApiInfo ReadApiInfo(const nlohmann::json& document) {
    ApiInfo info;
    auto it = document.find("info");
    if (it == document.end() || !it->is_object()) return info;
    if (auto title = OptString(*it, "title")) info.title = *title;
    if (auto version = OptString(*it, "version")) info.version = *version;
    return info;
}

Result<std::string, Error> ResolveBaseUrl(const nlohmann::json& document,
                                          const std::optional<std::string>& override_url,
                                          const std::string& source) {
    using R = Result<std::string, Error>;
    auto config_error = [](const std::string& message) {
        return Error{"ResolveBaseUrl", "", std::nullopt, message, std::nullopt,
                     ErrorCategory::Config};
    };

    if (override_url.has_value() && !override_url->empty()) {
        return R::Ok(StripTrailingSlash(*override_url));
    }

    auto servers = document.find("servers");
    if (servers != document.end() && servers->is_array() && !servers->empty()) {
        const auto& server = servers->front();
        if (auto url = OptString(server, "url")) {
            auto resolved = SubstituteServerVariables(*url, server);
            if (IsHttpUrl(resolved)) {
                return R::Ok(StripTrailingSlash(resolved));
            }
            if (!resolved.empty() && resolved.front() == '/' && IsHttpUrl(source)) {
                auto origin = ParseBaseUrl(source);
                if (origin.IsOk()) {
                    return R::Ok(StripTrailingSlash(origin.Value().origin + resolved));
                }
            }
            return R::Err(config_error("Server URL '" + resolved +
                                       "' is relative; pass --base-url"));
        }
    }

    if (auto host = OptString(document, "host")) {
        std::string scheme = "https";
        auto schemes = document.find("schemes");
        if (schemes != document.end() && schemes->is_array() && !schemes->empty() &&
            schemes->front().is_string()) {
            scheme = schemes->front().get<std::string>();
        }
        auto base_path = OptString(document, "basePath").value_or("");
        return R::Ok(StripTrailingSlash(scheme + "://" + *host + base_path));
    }

    return R::Err(config_error(
        "No base URL: the document declares no servers; pass --base-url"));
}

Result<std::vector<OperationDescriptor>, Error> ExtractOperations(
    const nlohmann::json& document) {
    using R = Result<std::vector<OperationDescriptor>, Error>;

    auto paths = document.find("paths");
    if (paths == document.end() || !paths->is_object()) {
        return R::Err(MakeDocumentError("paths", "Document has no 'paths' object"));
    }

    std::vector<OperationDescriptor> operations;
    for (auto path_it = paths->begin(); path_it != paths->end(); ++path_it) {
        auto path_item_result = InlineRefs(document, path_it.value());
        if (path_item_result.IsErr()) return R::Err(std::move(path_item_result).Error());
        const auto& path_item = path_item_result.Value();
        if (!path_item.is_object()) continue;

        for (auto method : kAllHttpMethods) {
            std::string key = HttpMethodName(method);
            for (auto& c : key) c = static_cast<char>(c - 'A' + 'a');

            auto op_it = path_item.find(key);
            if (op_it == path_item.end() || !op_it->is_object()) continue;
            const auto& op = *op_it;

            OperationDescriptor descriptor;
            descriptor.method = method;
            descriptor.path = path_it.key();
            descriptor.summary = OptString(op, "summary");
            descriptor.description = OptString(op, "description");
            descriptor.operation_id = OptString(op, "operationId");
            if (op.contains("tags") && op["tags"].is_array()) {
                for (const auto& tag : op["tags"]) {
                    if (tag.is_string()) descriptor.tags.insert(tag.get<std::string>());
                }
            }

            auto params = CollectParameters(document, path_item, op, descriptor.Label());
            if (params.IsErr()) return R::Err(std::move(params).Error());
            descriptor.parameters = std::move(params).Value();

            auto body = RequestBodyParameter(document, op);
            if (body.IsErr()) return R::Err(std::move(body).Error());
            if (body.Value().has_value()) {
                descriptor.parameters.push_back(*body.Value());
            }

            operations.push_back(std::move(descriptor));
        }
    }
    return R::Ok(std::move(operations));
}

} // namespace openapi_mcp
