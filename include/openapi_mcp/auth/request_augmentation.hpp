#pragma once

#include <openapi_mcp/auth/auth_config.hpp>
#include <openapi_mcp/http/i_http_client.hpp>

#include <functional>
#include <optional>

namespace openapi_mcp {

enum class AugmentationKind {
    None,
    StaticHeaders,
    QueryInjection,
    BasicCredentials,
};

const char* AugmentationKindName(AugmentationKind kind);

using RequestHook = std::function<void(OutgoingRequest&)>;

// ---------------------------------------------------------------------------
// RequestAugmentation: what the HTTP client must add to every outgoing
// request. Immutable after construction and safe to share across calls.
//
//   headers            static headers (auth header merged with custom
//                      headers, custom wins on a name clash)
//   request_hook       per-request mutation (query-string api key)
//   basic_credentials  user/password for the transport's Basic auth
// ---------------------------------------------------------------------------
struct RequestAugmentation {
    AugmentationKind kind = AugmentationKind::None;
    HttpHeaders headers;
    RequestHook request_hook;
    std::optional<BasicCredentials> basic_credentials;

    /// Apply to a request in place. Headers already set on the request by
    /// the tool call are left alone.
    void Apply(OutgoingRequest& request) const;
};

RequestAugmentation BuildRequestAugmentation(const AuthConfig& config);

} // namespace openapi_mcp
