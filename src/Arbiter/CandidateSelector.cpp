// =================================================================
// src/Arbiter/CandidateSelector.cpp
// =================================================================
// Implementation of the candidate selector and its strategies.

#include "Arbiter/CandidateSelector.hpp"
#include "Arbiter/Logger.hpp"
#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>

namespace Arbiter {

// =================================================================
// Built-in Selection Strategies
// =================================================================

/**
 * @brief The single directive model, followed by anything left in the set
 */
class CandidateSelector::SingleStrategy : public SelectionStrategy {
public:
    std::vector<Candidate> order(const CandidateSet& candidates, uint64_t, const HealthScoreFn&) override {
        return candidates.candidates;
    }

    std::string getName() const override {
        return "single";
    }
};

/**
 * @brief Ordered directive: head first, remainder as declared
 */
class CandidateSelector::OrderedStrategy : public SelectionStrategy {
public:
    std::vector<Candidate> order(const CandidateSet& candidates, uint64_t, const HealthScoreFn&) override {
        return candidates.candidates;
    }

    std::string getName() const override {
        return "ordered";
    }
};

/**
 * @brief Weighted directive: seeded weighted draw, remainder by weight then health
 */
class CandidateSelector::WeightedStrategy : public SelectionStrategy {
public:
    std::vector<Candidate> order(const CandidateSet& candidates, uint64_t seed,
                                 const HealthScoreFn& health) override {
        const auto& pool = candidates.candidates;

        double total = 0.0;
        for (const auto& candidate : pool) {
            total += std::max(0.0, candidate.weight);
        }

        size_t chosen = 0;
        if (total > 0.0) {
            std::mt19937_64 generator(seed);
            double draw = unitInterval(generator()) * total;
            double cumulative = 0.0;
            chosen = pool.size() - 1;
            for (size_t i = 0; i < pool.size(); ++i) {
                cumulative += std::max(0.0, pool[i].weight);
                if (draw < cumulative) {
                    chosen = i;
                    break;
                }
            }
        }

        std::vector<size_t> rest;
        for (size_t i = 0; i < pool.size(); ++i) {
            if (i != chosen) {
                rest.push_back(i);
            }
        }

        std::vector<double> scores(pool.size(), 1.0);
        if (health) {
            for (size_t i : rest) {
                scores[i] = health(*pool[i].model);
            }
        }

        std::stable_sort(rest.begin(), rest.end(), [&pool, &scores](size_t a, size_t b) {
            if (pool[a].weight != pool[b].weight) {
                return pool[a].weight > pool[b].weight;
            }
            return scores[a] > scores[b];
        });

        std::vector<Candidate> ordered;
        ordered.reserve(pool.size());
        ordered.push_back(pool[chosen]);
        for (size_t i : rest) {
            ordered.push_back(pool[i]);
        }
        return ordered;
    }

    std::string getName() const override {
        return "weighted";
    }
};

// =================================================================
// CandidateSelector
// =================================================================

CandidateSelector::CandidateSelector() {
    registerStrategy(DirectiveKind::SINGLE, std::make_shared<SingleStrategy>());
    registerStrategy(DirectiveKind::WEIGHTED, std::make_shared<WeightedStrategy>());
    registerStrategy(DirectiveKind::ORDERED, std::make_shared<OrderedStrategy>());
}

void CandidateSelector::registerStrategy(DirectiveKind kind, std::shared_ptr<SelectionStrategy> strategy) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_strategies[static_cast<int>(kind)] = std::move(strategy);
}

double CandidateSelector::unitInterval(uint64_t bits) {
    return static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);
}

SelectionResult CandidateSelector::select(const CandidateSet& candidates, uint64_t seed,
                                          const HealthScoreFn& health) const {
    if (candidates.empty()) {
        throw std::invalid_argument("Cannot select from an empty candidate set");
    }

    std::shared_ptr<SelectionStrategy> strategy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_strategies.find(static_cast<int>(candidates.kind));
        if (it == m_strategies.end()) {
            it = m_strategies.find(static_cast<int>(DirectiveKind::ORDERED));
        }
        strategy = it->second;
    }

    SelectionResult result;
    result.seed = seed;
    result.strategy = strategy->getName();
    result.order = strategy->order(candidates, seed, health);
    result.recommended = result.order.front().model;

    Logger::getInstance().debug("CandidateSelector",
        "Recommended " + result.recommended->id,
        "strategy=" + result.strategy + " candidates=" + std::to_string(result.order.size()));
    return result;
}

} // namespace Arbiter
