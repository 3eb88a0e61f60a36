// =================================================================
// include/Arbiter/RequestContext.hpp
// =================================================================
// Immutable per-request snapshot created at ingress.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace Arbiter {

/**
 * @brief Declared data sensitivity of a request, ordered low to high
 */
enum class SensitivityLevel {
    PUBLIC = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    RESTRICTED = 4
};

/**
 * @brief Action applied by the output firewall when a detector fires
 */
enum class FirewallAction {
    NONE,       ///< Detectors still run, output is annotated only in the trace
    FLAG,       ///< Return original output, annotated with masked samples
    REDRAFT     ///< Replace output with a sanitized rewrite
};

/**
 * @brief Caller-requested options
 */
struct RequestOptions {
    std::optional<size_t> max_tokens;                 ///< Output token cap
    std::optional<double> temperature;                ///< Sampling temperature
    std::optional<FirewallAction> firewall_override;  ///< Overrides the policy default action
};

/**
 * @brief Per-request context; never mutated after construction
 */
struct RequestContext {
    std::string tenant_id;                 ///< Tenant identifier
    std::string app_id;                    ///< Application identifier (selects the policy)
    std::optional<std::string> team_id;    ///< Optional team identifier
    std::string user_role;                 ///< Role of the calling user
    SensitivityLevel sensitivity = SensitivityLevel::LOW; ///< Declared sensitivity
    size_t token_estimate = 0;             ///< Estimated input tokens
    std::string language;                  ///< Input language code
    std::vector<std::string> tags;         ///< Free-form request tags
    RequestOptions options;                ///< Requested options
    std::string request_key;               ///< Stable key used for experiment bucketing
    std::string input;                     ///< Normalized input text

    bool hasTag(const std::string& tag) const;
};

using RequestContextPtr = std::shared_ptr<const RequestContext>;

std::string sensitivityToString(SensitivityLevel level);

/**
 * @brief Parse a sensitivity name ("public", "low", "medium", "high", "restricted")
 * @throws std::invalid_argument for unknown names
 */
SensitivityLevel parseSensitivity(const std::string& name);

std::string firewallActionToString(FirewallAction action);

/**
 * @brief Parse a firewall action name ("none", "flag", "redraft")
 * @throws std::invalid_argument for unknown names
 */
FirewallAction parseFirewallAction(const std::string& name);

} // namespace Arbiter
