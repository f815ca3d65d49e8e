#pragma once

#include <openapi_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace openapi_mcp {

// ---------------------------------------------------------------------------
// FilterPrecedence: how an include rule interacts with exclusions.
//
//   ExclusionWins: the include rule refuses any operation an exclude-path
//                   or exclude-tag rule would match, so exclusions always
//                   take effect.
//   FirstMatch   : the include rule is evaluated first and captures every
//                   operation it matches; later exclusions only see what it
//                   left behind.
// ---------------------------------------------------------------------------
enum class FilterPrecedence {
    ExclusionWins,
    FirstMatch,
};

/// "exclusion-wins" | "first-match" (underscores accepted).
Result<FilterPrecedence, std::string> ParseFilterPrecedence(std::string_view name);
const char* FilterPrecedenceName(FilterPrecedence precedence);

// ---------------------------------------------------------------------------
// FilterOptions: raw filter strings as the operator typed them. Each field
// is a comma-separated list; nullopt and "" both mean "not given".
// ---------------------------------------------------------------------------
struct FilterOptions {
    std::optional<std::string> methods;
    std::optional<std::string> include_paths;
    std::optional<std::string> exclude_paths;
    std::optional<std::string> include_tags;
    std::optional<std::string> exclude_tags;
    FilterPrecedence precedence = FilterPrecedence::ExclusionWins;

    /// True if at least one of the five filter fields is non-empty.
    [[nodiscard]] bool HasAnyFilter() const;
};

/// Split "a, b ,c" into {"a","b","c"}. Tokens are whitespace-trimmed and
/// empty tokens dropped. An absent or blank value yields an empty list.
std::vector<std::string> SplitCommaList(const std::optional<std::string>& value);

/// Validate every field and return all problems at once (empty = valid):
///   - unknown HTTP methods, reported together in one message per field
///   - each include/exclude path pattern that fails to compile
/// Tags are free text and never rejected.
std::vector<std::string> ValidateFilterOptions(const FilterOptions& options);

} // namespace openapi_mcp
