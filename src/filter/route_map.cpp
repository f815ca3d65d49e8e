#include <openapi_mcp/filter/route_map.hpp>

#include <algorithm>
#include <sstream>

namespace openapi_mcp {

namespace {

using BuildResult = Result<std::optional<RouteRules>, Error>;

Error MakeRouteMapError(const std::string& subject, const std::string& message) {
    return Error{"BuildRouteMaps", subject, std::nullopt, message, std::nullopt,
                 ErrorCategory::Validation};
}

bool Intersects(const std::set<std::string>& a, const std::set<std::string>& b) {
    return std::any_of(a.begin(), a.end(),
                       [&](const std::string& tag) { return b.count(tag) > 0; });
}

std::string JoinSet(const std::set<std::string>& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ",";
        out += v;
    }
    return out;
}

} // anonymous namespace

const char* RouteOutcomeName(RouteOutcome outcome) {
    switch (outcome) {
        case RouteOutcome::Tool:    return "TOOL";
        case RouteOutcome::Exclude: return "EXCLUDE";
    }
    return "TOOL";
}

bool RouteRule::Matches(const OperationDescriptor& operation) const {
    if (methods.has_value() && methods->count(operation.method) == 0) {
        return false;
    }
    if (pattern.has_value() && !pattern->Matches(operation.path)) {
        return false;
    }
    if (tags.has_value() && !Intersects(*tags, operation.tags)) {
        return false;
    }
    if (reject_pattern.has_value() && reject_pattern->Matches(operation.path)) {
        return false;
    }
    if (reject_tags.has_value() && Intersects(*reject_tags, operation.tags)) {
        return false;
    }
    return true;
}

std::string RouteRule::Describe() const {
    std::ostringstream oss;
    oss << RouteOutcomeName(outcome);
    if (methods.has_value()) {
        oss << " methods=[";
        bool first = true;
        for (auto m : *methods) {
            if (!first) oss << ",";
            oss << HttpMethodName(m);
            first = false;
        }
        oss << "]";
    }
    if (pattern.has_value()) oss << " pattern=" << pattern->Source();
    if (tags.has_value()) oss << " tags=[" << JoinSet(*tags) << "]";
    if (reject_pattern.has_value()) oss << " not-pattern=" << reject_pattern->Source();
    if (reject_tags.has_value()) oss << " not-tags=[" << JoinSet(*reject_tags) << "]";
    if (!methods && !pattern && !tags && !reject_pattern && !reject_tags) {
        oss << " (any)";
    }
    return oss.str();
}

BuildResult BuildRouteMaps(const FilterOptions& options) {
    if (!options.HasAnyFilter()) {
        return BuildResult::Ok(std::optional<RouteRules>());
    }

    const auto method_tokens = SplitCommaList(options.methods);
    const auto include_paths = SplitCommaList(options.include_paths);
    const auto exclude_paths = SplitCommaList(options.exclude_paths);
    const auto include_tag_list = SplitCommaList(options.include_tags);
    const auto exclude_tag_list = SplitCommaList(options.exclude_tags);

    std::set<HttpMethod> allowed_methods;
    for (const auto& token : method_tokens) {
        auto method = ParseHttpMethod(token);
        if (method.IsErr()) {
            return BuildResult::Err(MakeRouteMapError(token, method.Error()));
        }
        allowed_methods.insert(method.Value());
    }

    std::vector<PathPattern> exclude_patterns;
    for (const auto& source : exclude_paths) {
        auto compiled = PathPattern::Compile(source);
        if (compiled.IsErr()) {
            return BuildResult::Err(std::move(compiled).Error());
        }
        exclude_patterns.push_back(std::move(compiled).Value());
    }

    // Declared order, duplicates dropped.
    std::vector<std::string> exclude_tags;
    for (const auto& tag : exclude_tag_list) {
        if (std::find(exclude_tags.begin(), exclude_tags.end(), tag) ==
            exclude_tags.end()) {
            exclude_tags.push_back(tag);
        }
    }

    RouteRules rules;

    // 1. Include rule.
    const bool has_include = !allowed_methods.empty() || !include_paths.empty() ||
                             !include_tag_list.empty();
    if (has_include) {
        RouteRule include;
        include.outcome = RouteOutcome::Tool;
        if (!allowed_methods.empty()) {
            include.methods = allowed_methods;
        }
        if (!include_paths.empty()) {
            auto combined = PathPattern::Combine(include_paths);
            if (combined.IsErr()) {
                return BuildResult::Err(std::move(combined).Error());
            }
            include.pattern = std::move(combined).Value();
        }
        if (!include_tag_list.empty()) {
            include.tags = std::set<std::string>(include_tag_list.begin(),
                                                 include_tag_list.end());
        }
        if (options.precedence == FilterPrecedence::ExclusionWins) {
            if (!exclude_paths.empty()) {
                auto rejected = PathPattern::Combine(exclude_paths);
                if (rejected.IsErr()) {
                    return BuildResult::Err(std::move(rejected).Error());
                }
                include.reject_pattern = std::move(rejected).Value();
            }
            if (!exclude_tags.empty()) {
                include.reject_tags = std::set<std::string>(exclude_tags.begin(),
                                                            exclude_tags.end());
            }
        }
        rules.push_back(std::move(include));
    }

    // 2. Methods outside the allow-list, canonical order.
    if (!allowed_methods.empty()) {
        auto match_all = PathPattern::Compile(".*");
        if (match_all.IsErr()) {
            return BuildResult::Err(std::move(match_all).Error());
        }
        for (auto method : kAllHttpMethods) {
            if (allowed_methods.count(method) > 0) continue;
            RouteRule rule;
            rule.methods = std::set<HttpMethod>{method};
            rule.pattern = match_all.Value();
            rule.outcome = RouteOutcome::Exclude;
            rules.push_back(std::move(rule));
        }
    }

    // 3. Exclude paths, each independently.
    for (auto& pattern : exclude_patterns) {
        RouteRule rule;
        rule.pattern = std::move(pattern);
        rule.outcome = RouteOutcome::Exclude;
        rules.push_back(std::move(rule));
    }

    // 4. Exclude tags, one rule per tag.
    for (const auto& tag : exclude_tags) {
        RouteRule rule;
        rule.tags = std::set<std::string>{tag};
        rule.outcome = RouteOutcome::Exclude;
        rules.push_back(std::move(rule));
    }

    // 5. Anything the include rule did not select is dropped.
    if (has_include) {
        RouteRule rest;
        rest.outcome = RouteOutcome::Exclude;
        rules.push_back(std::move(rest));
    }

    return BuildResult::Ok(std::optional<RouteRules>(std::move(rules)));
}

} // namespace openapi_mcp
