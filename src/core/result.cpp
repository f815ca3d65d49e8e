#include <openapi_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iterator>
#include <sstream>

namespace openapi_mcp {

namespace {

std::optional<std::string> StringField(const nlohmann::json& obj,
                                       const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

// REST APIs report errors in a handful of JSON shapes:
//   {"message": "..."}
//   {"error": "..."} / {"error": {"message": "..."}}
//   {"detail": "..."} / {"title": "..."}  (RFC 7807)
// Non-JSON bodies yield nothing.
std::optional<std::string> ExtractApiError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    if (auto msg = StringField(parsed, "message")) return msg;

    auto err = parsed.find("error");
    if (err != parsed.end()) {
        if (err->is_string() && !err->get<std::string>().empty()) {
            return err->get<std::string>();
        }
        if (err->is_object()) {
            if (auto msg = StringField(*err, "message")) return msg;
        }
    }

    if (auto msg = StringField(parsed, "detail")) return msg;
    return StringField(parsed, "title");
}

// Plain-text and HTML error pages carry the upstream diagnostic verbatim.
std::optional<std::string> RawBodyExcerpt(const std::string& body) {
    constexpr size_t kMaxExcerpt = 1000;
    const auto first = body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    const auto last = body.find_last_not_of(" \t\r\n");
    auto excerpt = body.substr(first, last - first + 1);
    if (excerpt.size() > kMaxExcerpt) {
        excerpt.resize(kMaxExcerpt);
        excerpt += "... (truncated)";
    }
    return excerpt;
}

nlohmann::json ErrorBody(const Error& error) {
    nlohmann::json body;
    body["category"] = error.CategoryName();
    body["operation"] = error.operation;
    if (!error.subject.empty()) {
        body["subject"] = error.subject;
    }
    if (error.http_status.has_value()) {
        body["http_status"] = *error.http_status;
    }
    body["message"] = error.message;
    if (error.api_error.has_value() && !error.api_error->empty()) {
        body["api_error"] = *error.api_error;
    }
    return body;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto api_error = ExtractApiError(response_body);
    if (!api_error.has_value()) {
        api_error = RawBodyExcerpt(response_body);
    }

    ErrorCategory category = ErrorCategory::Http;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
            message = "Authentication failed, check the configured credentials";
            break;
        case 403:
            message = "Forbidden";
            break;
        case 404:
            message = "Not found";
            break;
        case 405:
            message = "Method not allowed";
            break;
        case 409:
            message = "Conflict";
            break;
        case 422:
            message = "Unprocessable entity";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            message = "Too many requests, retry later";
            break;
        case 500:
            message = "Upstream server error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Upstream server unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, api_error, category};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Validation:
        case ErrorCategory::InvalidPattern:
        case ErrorCategory::MissingCredential:
        case ErrorCategory::Config:
            return 2;
        case ErrorCategory::NameCollision: return 3;
        case ErrorCategory::Document: return 4;
        case ErrorCategory::Connection: return 5;
        case ErrorCategory::Timeout: return 6;
        case ErrorCategory::Http: return 7;
        case ErrorCategory::Internal: break;
    }
    return 99;
}

std::string Error::CategoryName() const {
    static const char* const kNames[] = {
        "validation", "invalid_pattern", "missing_credential", "name_collision",
        "config", "document", "connection", "timeout", "http", "internal",
    };
    const auto index = static_cast<size_t>(category);
    return index < std::size(kNames) ? kNames[index] : "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!subject.empty()) {
        oss << " [" << subject << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (api_error.has_value() && !api_error->empty()) {
        oss << " (API: " << *api_error << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    auto body = ErrorBody(*this);
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", body}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Error::ToToolJson() const {
    return nlohmann::json{{"error", ErrorBody(*this)}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace openapi_mcp
