#pragma once

#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/core/types.hpp>
#include <openapi_mcp/core/url.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>

namespace openapi_mcp {

// Header names compare case-insensitively, as on the wire.
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) {
                return std::tolower(x) < std::tolower(y);
            });
    }
};

using HttpHeaders = std::map<std::string, std::string, HeaderNameLess>;

struct BasicCredentials {
    std::string username;
    std::string password;
};

// ---------------------------------------------------------------------------
// OutgoingRequest: one materialised call, relative to the API base URL.
// ---------------------------------------------------------------------------
struct OutgoingRequest {
    HttpMethod method = HttpMethod::Get;
    std::string path;  // e.g. "/pets/42", base URL path prefix not included
    QueryParams query;
    HttpHeaders headers;
    std::optional<std::string> body;
    std::string content_type;
    std::optional<BasicCredentials> basic_auth;
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpClient: abstract outbound transport used by tool handlers.
//
// Implementations apply the server's request augmentation and enforce the
// per-call timeout. Transport failures are returned as Error values; HTTP
// error statuses are returned as ordinary responses.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Send(
        const OutgoingRequest& request) = 0;

protected:
    IHttpClient() = default;
};

} // namespace openapi_mcp
