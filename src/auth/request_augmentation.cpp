#include <openapi_mcp/auth/request_augmentation.hpp>

#include <type_traits>

namespace openapi_mcp {

const char* AugmentationKindName(AugmentationKind kind) {
    switch (kind) {
        case AugmentationKind::None:             return "none";
        case AugmentationKind::StaticHeaders:    return "static-headers";
        case AugmentationKind::QueryInjection:   return "query-injection";
        case AugmentationKind::BasicCredentials: return "basic-credentials";
    }
    return "none";
}

void RequestAugmentation::Apply(OutgoingRequest& request) const {
    for (const auto& [name, value] : headers) {
        request.headers.emplace(name, value);
    }
    if (basic_credentials.has_value()) {
        request.basic_auth = basic_credentials;
    }
    if (request_hook) {
        request_hook(request);
    }
}

RequestAugmentation BuildRequestAugmentation(const AuthConfig& config) {
    RequestAugmentation aug;

    std::visit([&aug](const auto& scheme) {
        using T = std::decay_t<decltype(scheme)>;
        if constexpr (std::is_same_v<T, ApiKeyAuth>) {
            if (scheme.location == ApiKeyLocation::Header) {
                aug.kind = AugmentationKind::StaticHeaders;
                aug.headers[scheme.name] = scheme.value;
            } else {
                aug.kind = AugmentationKind::QueryInjection;
                auto param = scheme.name;
                auto value = scheme.value;
                aug.request_hook = [param, value](OutgoingRequest& request) {
                    SetQueryParam(request.query, param, value);
                };
            }
        } else if constexpr (std::is_same_v<T, BearerAuth>) {
            aug.kind = AugmentationKind::StaticHeaders;
            aug.headers["Authorization"] = "Bearer " + scheme.token;
        } else if constexpr (std::is_same_v<T, BasicAuth>) {
            aug.kind = AugmentationKind::BasicCredentials;
            aug.basic_credentials = BasicCredentials{scheme.username, scheme.password};
        }
    }, config.scheme);

    // Custom headers override auth headers of the same name.
    for (const auto& [name, value] : config.custom_headers) {
        aug.headers[name] = value;
    }
    if (aug.kind == AugmentationKind::None && !aug.headers.empty()) {
        aug.kind = AugmentationKind::StaticHeaders;
    }

    return aug;
}

} // namespace openapi_mcp
