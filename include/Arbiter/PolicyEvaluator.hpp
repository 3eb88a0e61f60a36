// =================================================================
// include/Arbiter/PolicyEvaluator.hpp
// =================================================================
// First-match rule evaluation producing the initial candidate set.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include "Arbiter/ModelRegistry.hpp"
#include "Arbiter/Policy.hpp"
#include "Arbiter/RequestContext.hpp"
#include <string>
#include <vector>

namespace Arbiter {

/**
 * @brief Outcome of policy evaluation
 */
struct EvaluationResult {
    bool matched = false;                    ///< Whether any rule matched
    std::string rule_id;                     ///< Matched rule id
    CandidateSet candidates;                 ///< Directive models present and enabled in the snapshot
    CandidateSet fallback;                   ///< Expanded fallback chain of the matched rule
    std::vector<std::string> dropped;        ///< Unknown or disabled models removed
};

/**
 * @brief Evaluates a policy's rules top to bottom
 *
 * No match produces an empty candidate set; there is no implicit default
 * route.
 */
class PolicyEvaluator {
public:
    /**
     * @brief Evaluate a request against a policy
     * @param policy Policy snapshot held by the request
     * @param context Request context
     * @param registry Registry snapshot held by the request
     */
    static EvaluationResult evaluate(const Policy& policy,
                                     const RequestContext& context,
                                     const RegistrySnapshot& registry);

    /**
     * @brief Whether every condition of a rule holds
     */
    static bool ruleMatches(const PolicyRule& rule, const RequestContext& context);

    /**
     * @brief Whether a single condition holds; unknown or absent fields never match
     */
    static bool conditionMatches(const Condition& condition, const RequestContext& context);

private:
    static bool compareString(const Condition& condition, const std::string& actual);
    static bool compareNumber(const Condition& condition, double actual);
    static bool compareTags(const Condition& condition, const std::vector<std::string>& tags);
};

} // namespace Arbiter
