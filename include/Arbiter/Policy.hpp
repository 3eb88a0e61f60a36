// =================================================================
// include/Arbiter/Policy.hpp
// =================================================================
// Versioned routing policy: ordered rules with tagged selection directives.

#pragma once

#include "Arbiter/RequestContext.hpp"
#include "Arbiter/Subscription.hpp"
#include <string>
#include <vector>
#include <variant>
#include <memory>
#include <unordered_map>

namespace Arbiter {

/**
 * @brief Comparison operator of a rule condition
 */
enum class ConditionOp {
    EQ,         ///< Field equals value
    NE,         ///< Field differs from value
    LT,         ///< Field is less than value (numeric or ordinal)
    GE,         ///< Field is greater or equal to value (numeric or ordinal)
    IN,         ///< Field is one of the values (tags: any tag is one of the values)
    CONTAINS    ///< Request tags contain the value
};

std::string conditionOpToString(ConditionOp op);
ConditionOp parseConditionOp(const std::string& name);

/**
 * @brief One field comparison; a rule predicate is a conjunction of these
 */
struct Condition {
    std::string field;                 ///< tenant, app, team, role, sensitivity, tokens, language, tags
    ConditionOp op = ConditionOp::EQ;  ///< Operator
    std::vector<std::string> values;   ///< Comparison operand(s)
};

/**
 * @brief Route to exactly one model
 */
struct SingleChoice {
    std::string model;
};

/**
 * @brief One entry of a weighted directive
 */
struct WeightedEntry {
    std::string model;
    double weight = 0.0;
};

/**
 * @brief Draw one model using the weights; weights sum to 1
 */
struct WeightedChoice {
    std::vector<WeightedEntry> entries;
};

/**
 * @brief Priority list tried strictly in order
 */
struct OrderedChoice {
    std::vector<std::string> models;
};

using Directive = std::variant<SingleChoice, WeightedChoice, OrderedChoice>;

enum class DirectiveKind {
    SINGLE,
    WEIGHTED,
    ORDERED
};

DirectiveKind directiveKind(const Directive& directive);
std::string directiveKindToString(DirectiveKind kind);

/**
 * @brief Models referenced by a directive, in declaration order
 */
std::vector<std::string> directiveModels(const Directive& directive);

/**
 * @brief One routing rule
 */
struct PolicyRule {
    std::string id;                        ///< Rule identifier recorded in the trace
    std::vector<Condition> conditions;     ///< Conjunction; empty matches everything
    Directive directive;                   ///< Selection directive
    std::string fallback_chain;            ///< Optional named fallback chain
};

/**
 * @brief Spend limits per (tenant, app) per calendar month
 */
struct BudgetLimits {
    double monthly_limit = 0.0;            ///< 0 disables the budget gate
    double low_water_mark = 0.0;           ///< Remaining budget that triggers downgrade
    double minimal_cost_threshold = 0.0;   ///< Max unit price allowed once exhausted
};

/**
 * @brief Custom pattern detector declared in a policy
 */
struct CustomDetectorConfig {
    std::string name;
    std::string pattern;                   ///< ECMAScript regular expression
};

/**
 * @brief Output firewall detector configuration
 */
struct DetectorConfig {
    std::vector<std::string> enabled;      ///< Built-in detector names; empty enables all
    std::vector<CustomDetectorConfig> custom; ///< Extra pattern detectors, run after built-ins
    bool contextual = false;               ///< Run the contextual detector when inconclusive
};

/**
 * @brief Data-handling constraints
 */
struct CompliancePolicy {
    SensitivityLevel external_max_sensitivity = SensitivityLevel::MEDIUM; ///< Highest sensitivity allowed on external models
    std::vector<std::string> blocked_tags; ///< Request tags that forbid external models
};

/**
 * @brief Behaviour once the fallback chain is exhausted
 */
enum class DegradeMode {
    NONE,                  ///< Fail the request
    MINIMAL_COMPLETION     ///< Try the cheapest compliant candidate once more
};

/**
 * @brief Versioned policy for one application; never mutated once published
 */
struct Policy {
    std::string id;                        ///< Policy identifier
    std::string app_id;                    ///< Application the policy governs
    std::string version;                   ///< Immutable version identifier
    std::vector<PolicyRule> rules;         ///< Evaluated top to bottom
    std::unordered_map<std::string, std::vector<std::string>> fallback_chains; ///< name -> models or "@chain" references
    BudgetLimits budget;                   ///< Budget limits
    FirewallAction default_firewall_action = FirewallAction::FLAG; ///< Used without a request override
    DetectorConfig detectors;              ///< Firewall detectors
    CompliancePolicy compliance;           ///< Compliance constraints
    std::vector<SubscriptionScope> subscription_precedence{
        SubscriptionScope::APP, SubscriptionScope::TEAM, SubscriptionScope::TENANT}; ///< First enabled scope wins
    DegradeMode degrade_mode = DegradeMode::NONE; ///< Exhaustion behaviour
    std::string sanitizer_model;           ///< Model used for redrafts

    /**
     * @brief Flatten a named fallback chain, resolving "@chain" references
     *
     * Duplicates are dropped, first occurrence wins. Unknown chains expand to
     * an empty list. Cycles are rejected at validation time.
     */
    std::vector<std::string> expandFallbackChain(const std::string& chain_name) const;
};

using PolicyPtr = std::shared_ptr<const Policy>;

} // namespace Arbiter
