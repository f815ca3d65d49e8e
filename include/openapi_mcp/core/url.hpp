#pragma once

#include <openapi_mcp/core/result.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace openapi_mcp {

// Ordered query parameters. Order is preserved when serialising; the same
// name may appear more than once.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// "a=1&b=two%20words", names and values percent-encoded.
std::string BuildQueryString(const QueryParams& params);

// Remove every occurrence of `name`, then append name=value once.
void SetQueryParam(QueryParams& params, const std::string& name,
                   const std::string& value);

// ---------------------------------------------------------------------------
// BaseUrl: an API base URL split into origin and path prefix.
//   "https://api.example.com:8443/v1/" -> origin "https://api.example.com:8443",
//                                         path_prefix "/v1"
// ---------------------------------------------------------------------------
struct BaseUrl {
    std::string origin;
    std::string path_prefix;
};

Result<BaseUrl, std::string> ParseBaseUrl(std::string_view url);

// True for sources starting with http:// or https://.
bool IsHttpUrl(std::string_view source);

} // namespace openapi_mcp
