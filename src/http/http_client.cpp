#include <openapi_mcp/http/http_client.hpp>
#include <openapi_mcp/core/log.hpp>

#include <httplib.h>

namespace openapi_mcp {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(const std::string& key) {
    static const HeaderNameLess less;
    const auto equals = [&](const std::string& other) {
        return !less(key, other) && !less(other, key);
    };
    return equals("authorization") || equals("cookie") ||
           equals("proxy-authorization") || equals("x-api-key");
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    if (!GlobalLogger().Enabled(LogLevel::Debug)) return;
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty() && GlobalLogger().Enabled(LogLevel::Debug)) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

struct HttpClient::Impl {
    BaseUrl base_url;
    RequestAugmentation augmentation;
    HttpClientOptions options;

    std::string Target(const OutgoingRequest& request) const {
        auto target = base_url.path_prefix + request.path;
        if (target.empty()) target = "/";
        if (!request.query.empty()) {
            target += "?" + BuildQueryString(request.query);
        }
        return target;
    }

    // Secrets never reach the log: the query string is dropped when the
    // api key rides in it.
    std::string LoggableTarget(const OutgoingRequest& request) const {
        if (augmentation.kind == AugmentationKind::QueryInjection) {
            return base_url.path_prefix + request.path + (request.query.empty() ? "" : "?<redacted>");
        }
        return Target(request);
    }

    httplib::Result Dispatch(httplib::Client& client,
                             const OutgoingRequest& request,
                             const std::string& target,
                             const httplib::Headers& hdrs) const {
        const std::string body = request.body.value_or("");
        const std::string& content_type = request.content_type;
        switch (request.method) {
            case HttpMethod::Get:
                return client.Get(target, hdrs);
            case HttpMethod::Post:
                return client.Post(target, hdrs, body, content_type);
            case HttpMethod::Put:
                return client.Put(target, hdrs, body, content_type);
            case HttpMethod::Patch:
                return client.Patch(target, hdrs, body, content_type);
            case HttpMethod::Delete:
                if (request.body.has_value()) {
                    return client.Delete(target, hdrs, body, content_type);
                }
                return client.Delete(target, hdrs);
            case HttpMethod::Head:
                return client.Head(target, hdrs);
            case HttpMethod::Options:
                return client.Options(target, hdrs);
        }
        return client.Get(target, hdrs);
    }
};

HttpClient::HttpClient(BaseUrl base_url,
                       RequestAugmentation augmentation,
                       const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(
          Impl{std::move(base_url), std::move(augmentation), options})) {}

HttpClient::~HttpClient() = default;

const BaseUrl& HttpClient::GetBaseUrl() const noexcept {
    return impl_->base_url;
}

Result<HttpResponse, Error> HttpClient::Send(const OutgoingRequest& request) {
    OutgoingRequest prepared = request;
    impl_->augmentation.Apply(prepared);

    httplib::Client client(impl_->base_url.origin);
    client.set_connection_timeout(impl_->options.timeout);
    client.set_read_timeout(impl_->options.timeout);
    client.set_write_timeout(impl_->options.timeout);
    if (impl_->options.disable_tls_verify) {
        client.enable_server_certificate_verification(false);
    }
    if (prepared.basic_auth.has_value()) {
        client.set_basic_auth(prepared.basic_auth->username,
                              prepared.basic_auth->password);
    }

    httplib::Headers hdrs;
    for (const auto& [key, value] : prepared.headers) {
        hdrs.emplace(key, value);
    }

    const auto target = impl_->Target(prepared);
    const std::string method = HttpMethodName(prepared.method);
    LogInfo("http", method + " " + impl_->base_url.origin +
                        impl_->LoggableTarget(prepared));
    LogRequestHeaders(hdrs);

    auto res = impl_->Dispatch(client, prepared, target, hdrs);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "HttpClient", method + " " + prepared.path, std::nullopt,
            "HTTP request failed: " + httplib::to_string(http_error),
            std::nullopt, CategoryFromHttpTransportError(http_error)});
    }

    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace openapi_mcp
