#pragma once

#include <openapi_mcp/core/result.hpp>

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace openapi_mcp {

// ---------------------------------------------------------------------------
// PathPattern: a compiled, user-supplied path regular expression.
//
// Matching is an unanchored search (ECMAScript grammar): "/users" matches
// "/api/users/{id}". OpenAPI placeholders are ordinary text to the engine,
// so "/users/{id}" only matches paths that literally contain "{id}".
//
// Compile failures surface here, never at match time.
// ---------------------------------------------------------------------------
class PathPattern {
public:
    /// Compile a single pattern. Fails with ErrorCategory::InvalidPattern.
    static Result<PathPattern, Error> Compile(std::string_view pattern);

    /// Compile the OR of several patterns. Each source pattern is wrapped in
    /// a non-capturing group before joining with '|', so its anchors stay
    /// scoped to itself. An empty list is rejected.
    static Result<PathPattern, Error> Combine(const std::vector<std::string>& patterns);

    [[nodiscard]] bool Matches(std::string_view path) const;

    /// The source text the regex was compiled from.
    [[nodiscard]] const std::string& Source() const noexcept { return source_; }

private:
    PathPattern(std::string source, std::shared_ptr<const std::regex> regex)
        : source_(std::move(source)), regex_(std::move(regex)) {}

    std::string source_;
    // Shared so that rules can be copied cheaply; the regex is never mutated.
    std::shared_ptr<const std::regex> regex_;
};

} // namespace openapi_mcp
