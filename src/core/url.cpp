#include <openapi_mcp/core/url.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace openapi_mcp {

namespace {

bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string BuildQueryString(const QueryParams& params) {
    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out += '&';
        out += UrlEncode(name);
        out += '=';
        out += UrlEncode(value);
    }
    return out;
}

void SetQueryParam(QueryParams& params, const std::string& name,
                   const std::string& value) {
    params.erase(std::remove_if(params.begin(), params.end(),
                                [&](const auto& kv) { return kv.first == name; }),
                 params.end());
    params.emplace_back(name, value);
}

Result<BaseUrl, std::string> ParseBaseUrl(std::string_view url) {
    if (!IsHttpUrl(url)) {
        return Result<BaseUrl, std::string>::Err(
            "Base URL must start with http:// or https://, got '" +
            std::string(url) + "'");
    }
    const auto scheme_end = url.find("://") + 3;
    const auto path_start = url.find('/', scheme_end);
    BaseUrl base;
    if (path_start == std::string_view::npos) {
        base.origin = std::string(url);
    } else {
        base.origin = std::string(url.substr(0, path_start));
        base.path_prefix = std::string(url.substr(path_start));
    }
    if (base.origin.size() <= scheme_end) {
        return Result<BaseUrl, std::string>::Err(
            "Base URL has no host: '" + std::string(url) + "'");
    }
    while (!base.path_prefix.empty() && base.path_prefix.back() == '/') {
        base.path_prefix.pop_back();
    }
    return Result<BaseUrl, std::string>::Ok(std::move(base));
}

bool IsHttpUrl(std::string_view source) {
    return StartsWith(source, "http://") || StartsWith(source, "https://");
}

} // namespace openapi_mcp
