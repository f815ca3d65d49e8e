#include <openapi_mcp/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace openapi_mcp {

const char* HttpMethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:     return "GET";
        case HttpMethod::Post:    return "POST";
        case HttpMethod::Put:     return "PUT";
        case HttpMethod::Patch:   return "PATCH";
        case HttpMethod::Delete:  return "DELETE";
        case HttpMethod::Head:    return "HEAD";
        case HttpMethod::Options: return "OPTIONS";
    }
    return "GET";
}

Result<HttpMethod, std::string> ParseHttpMethod(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (auto method : kAllHttpMethods) {
        if (upper == HttpMethodName(method)) {
            return Result<HttpMethod, std::string>::Ok(method);
        }
    }
    return Result<HttpMethod, std::string>::Err(
        "Unknown HTTP method: " + std::string(name));
}

std::string ValidHttpMethodList() {
    std::string out;
    for (auto method : kAllHttpMethods) {
        if (!out.empty()) out += ", ";
        out += HttpMethodName(method);
    }
    return out;
}

const char* ParameterLocationName(ParameterLocation location) {
    switch (location) {
        case ParameterLocation::Path:   return "path";
        case ParameterLocation::Query:  return "query";
        case ParameterLocation::Header: return "header";
        case ParameterLocation::Body:   return "body";
    }
    return "query";
}

} // namespace openapi_mcp
