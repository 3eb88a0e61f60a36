// =================================================================
// src/Arbiter/SubscriptionResolver.cpp
// =================================================================
// Implementation of subscription resolution.

#include "Arbiter/SubscriptionResolver.hpp"
#include "Arbiter/Logger.hpp"

namespace Arbiter {

SubscriptionResolution SubscriptionResolver::resolve(CandidateSet candidates,
                                                     const RequestContext& context,
                                                     const SubscriptionSnapshot& subscriptions,
                                                     const std::vector<SubscriptionScope>& precedence) {
    SubscriptionResolution resolution;

    for (SubscriptionScope scope : precedence) {
        auto target = targetFor(scope, context);
        if (!target) {
            continue;
        }

        bool found_enabled = false;
        for (const Subscription* subscription : subscriptions.lookup(scope, *target)) {
            if (!subscription->enabled) {
                continue;
            }
            found_enabled = true;
            resolution.permitted.insert(subscription->models.begin(), subscription->models.end());
        }

        if (found_enabled) {
            resolution.winning_scope = scope;
            break;
        }
    }

    if (!resolution.winning_scope) {
        Logger::getInstance().debug("SubscriptionResolver", "No enabled subscription for request",
                                    "tenant=" + context.tenant_id + " app=" + context.app_id);
    }

    const auto& permitted = resolution.permitted;
    resolution.removed = candidates.removeIf([&permitted](const Candidate& candidate) {
        return permitted.count(candidate.id()) == 0;
    });
    resolution.candidates = std::move(candidates);
    return resolution;
}

CandidateSet SubscriptionResolver::restrict(CandidateSet candidates, const std::unordered_set<std::string>& permitted) {
    candidates.removeIf([&permitted](const Candidate& candidate) {
        return permitted.count(candidate.id()) == 0;
    });
    return candidates;
}

std::optional<std::string> SubscriptionResolver::targetFor(SubscriptionScope scope, const RequestContext& context) {
    switch (scope) {
        case SubscriptionScope::TENANT:
            return context.tenant_id;
        case SubscriptionScope::APP:
            return context.app_id;
        case SubscriptionScope::TEAM:
            return context.team_id;
    }
    return std::nullopt;
}

} // namespace Arbiter
