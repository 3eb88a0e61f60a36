// =================================================================
// include/Arbiter/ComplianceFilter.hpp
// =================================================================
// Removes external models the request's data may not reach.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include "Arbiter/Policy.hpp"
#include "Arbiter/RequestContext.hpp"
#include <string>
#include <vector>

namespace Arbiter {

/**
 * @brief Outcome of the compliance stage
 */
struct ComplianceResult {
    CandidateSet candidates;              ///< Compliant candidates
    std::vector<std::string> removed;     ///< External candidates removed
    bool sensitivity_block = false;       ///< Sensitivity exceeded the external threshold
    bool tag_block = false;               ///< A blocked tag was present
};

/**
 * @brief Compliance stage; always runs and cannot be bypassed downstream
 */
class ComplianceFilter {
public:
    static ComplianceResult apply(CandidateSet candidates,
                                  const RequestContext& context,
                                  const CompliancePolicy& compliance);

    /**
     * @brief Whether a request may be sent to a model at all
     */
    static bool isEligible(const ModelDescriptor& model,
                           const RequestContext& context,
                           const CompliancePolicy& compliance);

    /**
     * @brief Whether the request excludes every external model
     */
    static bool externalForbidden(const RequestContext& context, const CompliancePolicy& compliance);

private:
    static bool hasBlockedTag(const RequestContext& context, const CompliancePolicy& compliance);
};

} // namespace Arbiter
