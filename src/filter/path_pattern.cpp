#include <openapi_mcp/filter/path_pattern.hpp>

namespace openapi_mcp {

namespace {

Error MakePatternError(const std::string& pattern, const std::string& message) {
    return Error{"PathPattern", pattern, std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidPattern};
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

// Length of a "{n}", "{n,}" or "{n,m}" quantifier starting at `pos`, or 0.
size_t QuantifierLength(std::string_view text, size_t pos) {
    size_t i = pos + 1;
    const size_t digits_start = i;
    while (i < text.size() && IsDigit(text[i])) ++i;
    if (i == digits_start) return 0;
    if (i < text.size() && text[i] == ',') {
        ++i;
        while (i < text.size() && IsDigit(text[i])) ++i;
    }
    if (i < text.size() && text[i] == '}') return i - pos + 1;
    return 0;
}

// Braces that do not form a quantifier are literal text, so templates like
// "/pets/{petId}" can be used as patterns.
std::string EscapeLiteralBraces(std::string_view pattern) {
    std::string out;
    out.reserve(pattern.size());
    bool in_class = false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            out += c;
            out += pattern[++i];
            continue;
        }
        if (in_class) {
            if (c == ']') in_class = false;
            out += c;
            continue;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == '{') {
            if (auto len = QuantifierLength(pattern, i)) {
                out.append(pattern.substr(i, len));
                i += len - 1;
                continue;
            }
            out += "\\{";
            continue;
        } else if (c == '}') {
            out += "\\}";
            continue;
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

Result<PathPattern, Error> PathPattern::Compile(std::string_view pattern) {
    std::string source(pattern);
    try {
        auto regex = std::make_shared<const std::regex>(
            EscapeLiteralBraces(source), std::regex::ECMAScript | std::regex::optimize);
        return Result<PathPattern, Error>::Ok(
            PathPattern(std::move(source), std::move(regex)));
    } catch (const std::regex_error& e) {
        return Result<PathPattern, Error>::Err(MakePatternError(
            source, "Invalid regular expression '" + source + "': " + e.what()));
    }
}

Result<PathPattern, Error> PathPattern::Combine(
    const std::vector<std::string>& patterns) {
    if (patterns.empty()) {
        return Result<PathPattern, Error>::Err(
            MakePatternError("", "Cannot combine an empty pattern list"));
    }
    if (patterns.size() == 1) {
        return Compile(patterns.front());
    }

    // Validate one by one first so the error names the offending source
    // pattern rather than the combined expression.
    for (const auto& pattern : patterns) {
        auto compiled = Compile(pattern);
        if (compiled.IsErr()) {
            return compiled;
        }
    }

    std::string combined;
    for (const auto& pattern : patterns) {
        if (!combined.empty()) combined += '|';
        combined += "(?:" + pattern + ")";
    }
    return Compile(combined);
}

bool PathPattern::Matches(std::string_view path) const {
    return std::regex_search(path.begin(), path.end(), *regex_);
}

} // namespace openapi_mcp
