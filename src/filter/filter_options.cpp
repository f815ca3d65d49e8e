#include <openapi_mcp/filter/filter_options.hpp>

#include <openapi_mcp/core/types.hpp>
#include <openapi_mcp/filter/path_pattern.hpp>

#include <algorithm>
#include <cctype>

namespace openapi_mcp {

namespace {

std::string Trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

void ValidatePatterns(const std::optional<std::string>& raw,
                      const char* label,
                      std::vector<std::string>& errors) {
    for (const auto& pattern : SplitCommaList(raw)) {
        if (PathPattern::Compile(pattern).IsErr()) {
            errors.push_back(std::string("Invalid ") + label +
                             " path pattern: " + pattern);
        }
    }
}

} // anonymous namespace

Result<FilterPrecedence, std::string> ParseFilterPrecedence(std::string_view name) {
    std::string normalized(name);
    std::replace(normalized.begin(), normalized.end(), '_', '-');
    if (normalized == "exclusion-wins") {
        return Result<FilterPrecedence, std::string>::Ok(FilterPrecedence::ExclusionWins);
    }
    if (normalized == "first-match") {
        return Result<FilterPrecedence, std::string>::Ok(FilterPrecedence::FirstMatch);
    }
    return Result<FilterPrecedence, std::string>::Err(
        "Unknown filter precedence '" + std::string(name) +
        "' (expected exclusion-wins or first-match)");
}

const char* FilterPrecedenceName(FilterPrecedence precedence) {
    switch (precedence) {
        case FilterPrecedence::ExclusionWins: return "exclusion-wins";
        case FilterPrecedence::FirstMatch:    return "first-match";
    }
    return "exclusion-wins";
}

bool FilterOptions::HasAnyFilter() const {
    for (const auto* field : {&methods, &include_paths, &exclude_paths,
                              &include_tags, &exclude_tags}) {
        if (!SplitCommaList(*field).empty()) return true;
    }
    return false;
}

std::vector<std::string> SplitCommaList(const std::optional<std::string>& value) {
    std::vector<std::string> items;
    if (!value.has_value()) return items;

    std::string_view rest(*value);
    while (true) {
        auto comma = rest.find(',');
        auto token = Trim(rest.substr(0, comma));
        if (!token.empty()) items.push_back(std::move(token));
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return items;
}

std::vector<std::string> ValidateFilterOptions(const FilterOptions& options) {
    std::vector<std::string> errors;

    std::vector<std::string> invalid_methods;
    for (const auto& token : SplitCommaList(options.methods)) {
        auto upper = ToUpper(token);
        if (ParseHttpMethod(upper).IsErr()) {
            invalid_methods.push_back(upper);
        }
    }
    if (!invalid_methods.empty()) {
        std::string joined;
        for (const auto& m : invalid_methods) {
            if (!joined.empty()) joined += ", ";
            joined += m;
        }
        errors.push_back("Invalid HTTP methods: " + joined +
                         ". Valid methods: " + ValidHttpMethodList());
    }

    ValidatePatterns(options.include_paths, "include", errors);
    ValidatePatterns(options.exclude_paths, "exclude", errors);

    return errors;
}

} // namespace openapi_mcp
