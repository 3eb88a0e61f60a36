// =================================================================
// src/Arbiter/ComplianceFilter.cpp
// =================================================================
// Implementation of the compliance stage.

#include "Arbiter/ComplianceFilter.hpp"
#include "Arbiter/Logger.hpp"
#include <algorithm>

namespace Arbiter {

ComplianceResult ComplianceFilter::apply(CandidateSet candidates,
                                         const RequestContext& context,
                                         const CompliancePolicy& compliance) {
    ComplianceResult result;
    result.sensitivity_block = context.sensitivity > compliance.external_max_sensitivity;
    result.tag_block = hasBlockedTag(context, compliance);

    if (result.sensitivity_block || result.tag_block) {
        result.removed = candidates.removeIf([](const Candidate& candidate) {
            return candidate.model->isExternal();
        });
        if (!result.removed.empty()) {
            Logger::getInstance().debug("ComplianceFilter",
                "Removed external candidates",
                std::string(result.sensitivity_block ? "sensitivity " : "") +
                (result.tag_block ? "blocked-tag " : "") +
                std::to_string(result.removed.size()) + " removed");
        }
    }

    result.candidates = std::move(candidates);
    return result;
}

bool ComplianceFilter::isEligible(const ModelDescriptor& model,
                                  const RequestContext& context,
                                  const CompliancePolicy& compliance) {
    return !model.isExternal() || !externalForbidden(context, compliance);
}

bool ComplianceFilter::externalForbidden(const RequestContext& context, const CompliancePolicy& compliance) {
    return context.sensitivity > compliance.external_max_sensitivity || hasBlockedTag(context, compliance);
}

bool ComplianceFilter::hasBlockedTag(const RequestContext& context, const CompliancePolicy& compliance) {
    return std::any_of(compliance.blocked_tags.begin(), compliance.blocked_tags.end(),
                       [&context](const std::string& tag) { return context.hasTag(tag); });
}

} // namespace Arbiter
