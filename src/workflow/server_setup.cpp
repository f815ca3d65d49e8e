#include <openapi_mcp/workflow/server_setup.hpp>

#include <openapi_mcp/auth/auth_config.hpp>
#include <openapi_mcp/core/log.hpp>
#include <openapi_mcp/filter/filter_options.hpp>
#include <openapi_mcp/filter/route_map.hpp>

namespace openapi_mcp {

namespace {

Error MakeSetupError(const std::string& subject, const std::string& message,
                     ErrorCategory category) {
    return Error{"PlanServer", subject, std::nullopt, message, std::nullopt, category};
}

} // anonymous namespace

std::string ServerPlan::Instructions() const {
    std::string text = "Tools for the " + api.title + " API (version " +
                       api.version + "). Each tool performs one HTTP operation against " +
                       base_url.origin + base_url.path_prefix + ".";
    return text;
}

Result<ServerPlan, Error> PlanServer(const AppConfig& config,
                                     const nlohmann::json& document) {
    using R = Result<ServerPlan, Error>;

    auto problems = ValidateFilterOptions(config.filters);
    if (!problems.empty()) {
        std::string joined;
        for (const auto& problem : problems) {
            if (!joined.empty()) joined += "; ";
            joined += problem;
        }
        return R::Err(MakeSetupError("filters", joined, ErrorCategory::Validation));
    }

    auto rules = BuildRouteMaps(config.filters);
    if (rules.IsErr()) {
        return R::Err(std::move(rules).Error());
    }
    if (rules.Value().has_value()) {
        LogDebug("filter", std::string("Precedence: ") +
                               FilterPrecedenceName(config.filters.precedence));
        for (const auto& rule : *rules.Value()) {
            LogDebug("filter", rule.Describe());
        }
    }

    ServerPlan plan;
    plan.server_name = config.server_name;

    auto headers = ParseCustomHeaders(config.auth.headers);
    for (const auto& warning : headers.warnings) {
        LogWarn("auth", warning);
        plan.warnings.push_back(warning);
    }
    auto auth = BuildAuthConfig(config.auth, std::move(headers.headers));
    if (auth.IsErr()) {
        return R::Err(std::move(auth).Error());
    }
    plan.augmentation = BuildRequestAugmentation(auth.Value());
    LogInfo("auth", std::string("Request augmentation: ") +
                        AugmentationKindName(plan.augmentation.kind));

    auto base_url = ResolveBaseUrl(document, config.base_url, config.openapi_source);
    if (base_url.IsErr()) {
        return R::Err(std::move(base_url).Error());
    }
    auto parsed_base = ParseBaseUrl(base_url.Value());
    if (parsed_base.IsErr()) {
        return R::Err(MakeSetupError(base_url.Value(), parsed_base.Error(),
                                     ErrorCategory::Config));
    }
    plan.base_url = parsed_base.Value();

    auto operations = ExtractOperations(document);
    if (operations.IsErr()) {
        return R::Err(std::move(operations).Error());
    }

    auto classification = ClassifyOperations(operations.Value(), rules.Value(),
                                             base_url.Value());
    if (classification.IsErr()) {
        return R::Err(std::move(classification).Error());
    }
    plan.classification = std::move(classification).Value();
    plan.api = ReadApiInfo(document);

    LogInfo("filter", std::to_string(plan.classification.tools.size()) + " tool(s), " +
                          std::to_string(plan.classification.excluded.size()) +
                          " excluded operation(s)");
    for (const auto& op : plan.classification.excluded) {
        LogDebug("filter", "Excluded " + op.Label());
    }

    return R::Ok(std::move(plan));
}

} // namespace openapi_mcp
