// =================================================================
// include/Arbiter/CandidateSet.hpp
// =================================================================
// Ordered candidate list narrowed by each pipeline stage.

#pragma once

#include "Arbiter/ModelDescriptor.hpp"
#include "Arbiter/Policy.hpp"
#include <string>
#include <vector>
#include <functional>

namespace Arbiter {

/**
 * @brief One model eligible at the current stage
 */
struct Candidate {
    ModelDescriptorPtr model;     ///< Descriptor from the request's registry snapshot
    double weight = 1.0;          ///< Directive weight (weighted directives only)
    std::string rule_id;          ///< Rule that produced the candidate
    bool trial = false;           ///< Half-open circuit; this request holds the trial

    const std::string& id() const { return model->id; }
};

/**
 * @brief Candidates plus the directive they came from
 *
 * Stages only remove or reorder entries; no stage adds a model that an
 * earlier stage did not produce.
 */
struct CandidateSet {
    std::vector<Candidate> candidates;                 ///< Current order
    DirectiveKind kind = DirectiveKind::ORDERED;       ///< Directive kind for the selector
    std::string rule_id;                               ///< Matched rule

    bool empty() const { return candidates.empty(); }
    size_t size() const { return candidates.size(); }

    bool contains(const std::string& model_id) const;
    const Candidate* find(const std::string& model_id) const;

    /**
     * @brief Model ids in current order
     */
    std::vector<std::string> modelIds() const;

    /**
     * @brief Remove every candidate matching the predicate
     * @return Ids of removed candidates, in their previous order
     */
    std::vector<std::string> removeIf(const std::function<bool(const Candidate&)>& predicate);
};

} // namespace Arbiter
