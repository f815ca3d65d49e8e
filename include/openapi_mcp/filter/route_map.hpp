#pragma once

#include <openapi_mcp/core/result.hpp>
#include <openapi_mcp/core/types.hpp>
#include <openapi_mcp/filter/filter_options.hpp>
#include <openapi_mcp/filter/path_pattern.hpp>
#include <openapi_mcp/openapi/operation.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace openapi_mcp {

enum class RouteOutcome {
    Tool,
    Exclude,
};

const char* RouteOutcomeName(RouteOutcome outcome);

// ---------------------------------------------------------------------------
// RouteRule: predicate over {method, path, tags} plus an outcome.
//
// The predicate is a conjunction. An unset dimension matches everything:
//   methods       : operation method is in the set
//   pattern       : pattern matches the operation's path template
//   tags          : operation tags intersect the set
//   reject_pattern: pattern must NOT match the path
//   reject_tags   : operation tags must NOT intersect the set
// The reject_* constraints are only set on the include rule under
// FilterPrecedence::ExclusionWins.
// ---------------------------------------------------------------------------
struct RouteRule {
    std::optional<std::set<HttpMethod>> methods;
    std::optional<PathPattern> pattern;
    std::optional<std::set<std::string>> tags;
    std::optional<PathPattern> reject_pattern;
    std::optional<std::set<std::string>> reject_tags;
    RouteOutcome outcome = RouteOutcome::Tool;

    [[nodiscard]] bool Matches(const OperationDescriptor& operation) const;

    /// Human-readable form for debug logs, e.g.
    /// "EXCLUDE methods=[DELETE] pattern=.*".
    [[nodiscard]] std::string Describe() const;
};

using RouteRules = std::vector<RouteRule>;

/// Convert filter options into an ordered first-match-wins rule list.
///
/// Returns nullopt when no filter field is given (no filtering requested).
/// Otherwise, in this order:
///   1. one TOOL rule combining methods / include paths / include tags, if
///      any of those three is given
///   2. one EXCLUDE rule per method outside the allow-list
///   3. one EXCLUDE rule per exclude-path pattern
///   4. one EXCLUDE rule per excluded tag
///   5. a catch-all EXCLUDE rule when rule 1 was emitted, so operations the
///      include rule did not select are dropped
///
/// Options are expected to have passed ValidateFilterOptions; an unknown
/// method or bad pattern still fails here with a Validation/InvalidPattern
/// error rather than being ignored.
Result<std::optional<RouteRules>, Error> BuildRouteMaps(const FilterOptions& options);

} // namespace openapi_mcp
