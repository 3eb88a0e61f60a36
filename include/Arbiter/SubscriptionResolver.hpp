// =================================================================
// include/Arbiter/SubscriptionResolver.hpp
// =================================================================
// Intersects candidates with the winning subscription scope.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include "Arbiter/RequestContext.hpp"
#include "Arbiter/Subscription.hpp"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace Arbiter {

/**
 * @brief Outcome of subscription resolution
 */
struct SubscriptionResolution {
    CandidateSet candidates;                          ///< Candidates permitted by the winning scope
    std::optional<SubscriptionScope> winning_scope;   ///< Scope that decided; empty means deny-all
    std::unordered_set<std::string> permitted;        ///< Union of the winning scope's models
    std::vector<std::string> removed;                 ///< Candidates not subscribed
};

/**
 * @brief Resolves which models a request is subscribed to
 *
 * Scopes are consulted in the configured precedence order. The first scope
 * with at least one enabled subscription wins exclusively; later scopes are
 * not merged in. With no enabled subscription anywhere, nothing is permitted.
 */
class SubscriptionResolver {
public:
    static SubscriptionResolution resolve(CandidateSet candidates,
                                          const RequestContext& context,
                                          const SubscriptionSnapshot& subscriptions,
                                          const std::vector<SubscriptionScope>& precedence);

    /**
     * @brief Apply an already resolved permitted set to another candidate list
     */
    static CandidateSet restrict(CandidateSet candidates, const std::unordered_set<std::string>& permitted);

private:
    static std::optional<std::string> targetFor(SubscriptionScope scope, const RequestContext& context);
};

} // namespace Arbiter
