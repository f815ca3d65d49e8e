#pragma once

#include <openapi_mcp/auth/request_augmentation.hpp>
#include <openapi_mcp/core/url.hpp>
#include <openapi_mcp/http/i_http_client.hpp>

#include <chrono>
#include <memory>

namespace openapi_mcp {

struct HttpClientOptions {
    std::chrono::seconds timeout{30};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// HttpClient: IHttpClient backed by cpp-httplib.
//
// Every Send() applies the request augmentation to its own copy of the
// request and runs on a fresh httplib::Client, so concurrent calls share
// nothing mutable. Pimpl keeps httplib out of the public header.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    HttpClient(BaseUrl base_url,
               RequestAugmentation augmentation,
               const HttpClientOptions& options = {});

    ~HttpClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Send(
        const OutgoingRequest& request) override;

    [[nodiscard]] const BaseUrl& GetBaseUrl() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace openapi_mcp
