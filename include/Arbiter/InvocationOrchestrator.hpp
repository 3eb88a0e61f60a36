// =================================================================
// include/Arbiter/InvocationOrchestrator.hpp
// =================================================================
// Per-request invocation state machine with retry, fallback and degrade mode.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include "Arbiter/DecisionTrace.hpp"
#include "Arbiter/Deadline.hpp"
#include "Arbiter/HealthTracker.hpp"
#include "Arbiter/Policy.hpp"
#include "Arbiter/ProviderAdapter.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace Arbiter {

/**
 * @brief Invocation states
 */
enum class InvocationState {
    PENDING,
    INVOKING,
    RETRYING,
    FALLING_BACK,
    SUCCEEDED,
    FAILED
};

std::string invocationStateToString(InvocationState state);

/**
 * @brief Retry policy for transient failures
 */
struct RetryConfig {
    size_t max_attempts = 3;                       ///< Attempts per candidate, first included
    std::chrono::milliseconds base_backoff{200};   ///< Backoff before the second attempt
    std::chrono::milliseconds max_backoff{5000};   ///< Backoff ceiling; a longer retry-after falls back instead
    double jitter = 0.2;                           ///< Relative jitter, 0 disables
};

/**
 * @brief What the orchestrator may try for one request
 */
struct InvocationPlan {
    std::vector<Candidate> primary;            ///< Selector order, recommended first
    std::vector<Candidate> fallback;           ///< Policy fallback chain, already filtered
    std::vector<Candidate> compliant;          ///< Post-compliance candidates for degrade mode
    DegradeMode degrade_mode = DegradeMode::NONE;
    uint64_t seed = 0;                         ///< Seed for backoff jitter
};

/**
 * @brief Outcome of the state machine
 */
struct InvocationOutcome {
    InvocationState state = InvocationState::PENDING;   ///< Terminal state
    std::vector<InvocationState> history;               ///< Every state entered, in order
    bool success = false;
    ModelDescriptorPtr final_model;                     ///< Model that served the request
    InvocationResult result;                            ///< Serving result
    std::vector<AttemptRecord> attempts;                ///< Attempts in order
    bool fell_back = false;                             ///< A candidate after the first was tried
    bool degraded_completion = false;                   ///< Served by the degrade attempt
    bool cancelled = false;                             ///< Stopped by cancellation
    ProviderErrorClass last_error = ProviderErrorClass::NONE;
    std::string remediation;                            ///< Hint for failed requests
};

/**
 * @brief Drives provider calls for one request at a time
 *
 * Attempts are strictly sequential. Each call is bounded by the provider
 * timeout; a timeout is a retryable failure. Calls that outlive their
 * timeout count against a per-model budget, and a model with a full budget
 * fails fast as unavailable. Health records are updated after every attempt
 * and half-open trials are released when the request is done with the
 * candidate. A retry only goes out while the circuit is still closed.
 */
class InvocationOrchestrator {
public:
    using AdapterResolver = std::function<ProviderAdapterPtr(const ModelDescriptor&)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using AttemptObserver = std::function<void(const AttemptRecord&)>;

    InvocationOrchestrator(AdapterResolver resolver,
                           HealthTracker& health,
                           RetryConfig retry = RetryConfig(),
                           std::chrono::milliseconds provider_timeout = std::chrono::milliseconds(30000),
                           Sleeper sleeper = Sleeper(),
                           size_t max_outstanding_calls = 16);

    /**
     * @brief Run the plan
     * @param plan Candidates to try
     * @param input Normalized input
     * @param options Invocation options
     * @param audit_id Audit id for logs
     * @param cancel Cancellation token, may be null
     * @param observer Called after each attempt, may be empty
     */
    InvocationOutcome run(const InvocationPlan& plan,
                          const std::string& input,
                          const InvocationOptions& options,
                          const std::string& audit_id,
                          const CancellationTokenPtr& cancel = nullptr,
                          const AttemptObserver& observer = AttemptObserver());

    /**
     * @brief Backoff before the attempt following `attempt`
     */
    std::chrono::milliseconds backoffFor(size_t attempt,
                                         const std::optional<std::chrono::milliseconds>& retry_after,
                                         std::mt19937_64& rng) const;

    const RetryConfig& retryConfig() const { return m_retry; }

private:
    AdapterResolver m_resolver;
    HealthTracker& m_health;
    RetryConfig m_retry;
    std::chrono::milliseconds m_provider_timeout;
    Sleeper m_sleeper;
    size_t m_max_outstanding_calls;
    std::unordered_map<std::string, WorkerBudget> m_budgets;
    std::mutex m_budgets_mutex;

    WorkerBudget budgetFor(const std::string& key);

    InvocationResult invokeOnce(const ModelDescriptorPtr& model, const std::string& input,
                                const InvocationOptions& options);

    /**
     * @brief Try one candidate until success, a terminal error or the attempt cap
     * @return True on success
     */
    bool tryCandidate(const Candidate& candidate, size_t max_attempts, bool degrade,
                      const std::string& input, const InvocationOptions& options,
                      const std::string& audit_id, const CancellationTokenPtr& cancel,
                      const AttemptObserver& observer, std::mt19937_64& rng,
                      InvocationOutcome& outcome);

    static void enter(InvocationOutcome& outcome, InvocationState state);
};

} // namespace Arbiter
