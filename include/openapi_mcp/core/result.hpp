#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace openapi_mcp {

// Value-or-error return type used by every layer. Reading the wrong side
// throws std::bad_variant_access (std::bad_optional_access for void).
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) {
        return Result(Storage(std::in_place_index<0>, std::move(value)));
    }
    static Result Err(E error) {
        return Result(Storage(std::in_place_index<1>, std::move(error)));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& { return std::get<0>(storage_); }
    [[nodiscard]] T Value() && { return std::get<0>(std::move(storage_)); }

    [[nodiscard]] const E& Error() const& { return std::get<1>(storage_); }
    [[nodiscard]] E Error() && { return std::get<1>(std::move(storage_)); }

private:
    using Storage = std::variant<T, E>;
    explicit Result(Storage storage) : storage_(std::move(storage)) {}

    Storage storage_;
};

template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& { return error_.value(); }
    [[nodiscard]] E Error() && { return std::move(error_).value(); }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

enum class ErrorCategory {
    Validation,
    InvalidPattern,
    MissingCredential,
    NameCollision,
    Config,
    Document,
    Connection,
    Timeout,
    Http,
    Internal,
};

// `operation` is the step or tool that failed. `subject` names what it failed
// on: "GET /pets/{petId}" for HTTP errors, the pattern text for
// InvalidPattern, the tool name for NameCollision.
struct Error {
    std::string operation;
    std::string subject;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> api_error;
    ErrorCategory category = ErrorCategory::Internal;

    /// api_error is lifted from a JSON body when the API sent one,
    /// otherwise it is the trimmed raw body, truncated.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    /// Process exit status: 2 for bad input (validation, patterns,
    /// credentials, config), 3 name collision, 4 unusable document,
    /// 5 connection, 6 timeout, 7 HTTP error, 99 internal.
    [[nodiscard]] int ExitCode() const;

    /// Lower-case snake name used in JSON error output.
    [[nodiscard]] std::string CategoryName() const;

    [[nodiscard]] std::string ToString() const;

    // Single-line JSON object: {"error":{...}}. Strings are escaped.
    [[nodiscard]] std::string ToJson() const;

    // Same object without exit_code, for isError tool results.
    [[nodiscard]] std::string ToToolJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               subject == other.subject &&
               http_status == other.http_status &&
               message == other.message &&
               api_error == other.api_error &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace openapi_mcp
