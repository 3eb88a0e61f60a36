// =================================================================
// include/Arbiter/CandidateSelector.hpp
// =================================================================
// Deterministic selection of the recommended model and fallback order.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Arbiter {

/**
 * @brief Health score lookup used as a tie-break
 */
using HealthScoreFn = std::function<double(const ModelDescriptor&)>;

/**
 * @brief Result of candidate selection
 */
struct SelectionResult {
    ModelDescriptorPtr recommended;       ///< Model to try first
    std::vector<Candidate> order;         ///< Full try order, recommended first
    std::string strategy;                 ///< Strategy that produced the order
    uint64_t seed = 0;                    ///< Seed used for sampling
};

/**
 * @brief Selection strategy base class
 */
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    /**
     * @brief Order candidates; the head is the recommended model
     * @param candidates Non-empty candidate set
     * @param seed Selection seed
     * @param health Health score lookup for tie-breaks
     */
    virtual std::vector<Candidate> order(const CandidateSet& candidates,
                                         uint64_t seed,
                                         const HealthScoreFn& health) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Picks the recommended model using the strategy for the directive kind
 *
 * Output depends only on the candidate set, the seed and the health scores,
 * so re-running a request against the same snapshots repeats the ordering.
 */
class CandidateSelector {
public:
    CandidateSelector();

    /**
     * @brief Select from a candidate set
     * @throws std::invalid_argument if the set is empty
     */
    SelectionResult select(const CandidateSet& candidates, uint64_t seed,
                           const HealthScoreFn& health = HealthScoreFn()) const;

    /**
     * @brief Replace the strategy used for a directive kind
     */
    void registerStrategy(DirectiveKind kind, std::shared_ptr<SelectionStrategy> strategy);

    /**
     * @brief Uniform draw in [0, 1) from a 64-bit generator output
     */
    static double unitInterval(uint64_t bits);

private:
    std::unordered_map<int, std::shared_ptr<SelectionStrategy>> m_strategies;
    mutable std::mutex m_mutex;

    class SingleStrategy;
    class WeightedStrategy;
    class OrderedStrategy;
};

} // namespace Arbiter
