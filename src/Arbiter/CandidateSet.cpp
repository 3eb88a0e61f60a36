// =================================================================
// src/Arbiter/CandidateSet.cpp
// =================================================================
// Implementation of candidate set helpers.

#include "Arbiter/CandidateSet.hpp"
#include <algorithm>

namespace Arbiter {

bool CandidateSet::contains(const std::string& model_id) const {
    return find(model_id) != nullptr;
}

const Candidate* CandidateSet::find(const std::string& model_id) const {
    for (const auto& candidate : candidates) {
        if (candidate.model->id == model_id) {
            return &candidate;
        }
    }
    return nullptr;
}

std::vector<std::string> CandidateSet::modelIds() const {
    std::vector<std::string> ids;
    ids.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        ids.push_back(candidate.model->id);
    }
    return ids;
}

std::vector<std::string> CandidateSet::removeIf(const std::function<bool(const Candidate&)>& predicate) {
    std::vector<std::string> removed;
    std::vector<Candidate> kept;
    kept.reserve(candidates.size());
    for (auto& candidate : candidates) {
        if (predicate(candidate)) {
            removed.push_back(candidate.model->id);
        } else {
            kept.push_back(std::move(candidate));
        }
    }
    candidates = std::move(kept);
    return removed;
}

} // namespace Arbiter
