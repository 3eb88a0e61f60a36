// =================================================================
// include/Arbiter/RoutingEngine.hpp
// =================================================================
// Request routing pipeline: policy, governance gates, selection,
// invocation, output firewall and lineage.

#pragma once

#include "Arbiter/BudgetGate.hpp"
#include "Arbiter/CandidateSelector.hpp"
#include "Arbiter/Deadline.hpp"
#include "Arbiter/DecisionTrace.hpp"
#include "Arbiter/EngineConfig.hpp"
#include "Arbiter/ExperimentOverlay.hpp"
#include "Arbiter/HealthTracker.hpp"
#include "Arbiter/InvocationOrchestrator.hpp"
#include "Arbiter/Lineage.hpp"
#include "Arbiter/Metrics.hpp"
#include "Arbiter/ModelRegistry.hpp"
#include "Arbiter/OutputFirewall.hpp"
#include "Arbiter/PolicyStore.hpp"
#include "Arbiter/RequestContext.hpp"
#include "Arbiter/Subscription.hpp"
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace Arbiter {

/**
 * @brief One request entering the engine
 */
struct RoutingRequest {
    RequestContext context;          ///< Immutable request context
    CancellationTokenPtr cancel;     ///< Set by the caller on disconnect; may be null
};

/**
 * @brief Public response returned to the caller
 */
struct RoutingResponse {
    RequestStatus status = RequestStatus::SUCCEEDED;   ///< Outcome
    ErrorKind error_kind = ErrorKind::NONE;            ///< Error classification
    std::string reason;                                ///< Reason code, empty on a clean success
    std::string message;                               ///< Human-readable detail
    std::string output;                                ///< Text returned to the caller
    std::string recommended_model;                     ///< Selector's choice
    std::string final_model;                           ///< Model that served the request
    bool fell_back = false;                            ///< A later candidate served the request
    std::string rule_id;                               ///< Matched rule
    TokenUsage usage;                                  ///< Tokens of the serving model
    double cost = 0.0;                                 ///< Cost including sanitizer
    FirewallReport firewall;                           ///< Firewall outcome with masked samples
    std::string audit_id;                              ///< Audit identifier, always set
    std::string remediation;                           ///< Hint when every candidate failed
    std::vector<std::string> attempted_chain;          ///< Models attempted, in order

    bool success() const { return status == RequestStatus::SUCCEEDED; }
};

void to_json(nlohmann::json& j, const RoutingResponse& response);

/**
 * @brief Engine counters
 */
struct EngineStatistics {
    size_t total_requests = 0;
    size_t succeeded = 0;
    size_t denied = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    size_t fallbacks = 0;
    size_t redrafts = 0;
};

/**
 * @brief Runs every request through the routing and governance pipeline
 *
 * Stages run in a fixed order: policy evaluation, subscription resolution,
 * compliance, health gate, budget gate, experiment overlay, selection,
 * invocation, output firewall, cost and lineage. Request-time failures are
 * returned in the response and never thrown. Every request produces exactly
 * one DecisionTrace.
 */
class RoutingEngine {
public:
    /**
     * @brief Constructor
     * @param config Engine configuration
     * @param registry Model registry
     * @param policies Policy store
     * @param subscriptions Subscription store
     * @param health Shared health tracker
     * @param budget Shared budget ledger
     * @param experiments Experiment overlay
     * @param lineage Trace sink, wrapped in a bounded-timeout buffer
     * @param metrics Metrics sink; may be null
     * @param sleeper Backoff sleeper; defaults to sleeping the thread
     */
    RoutingEngine(const EngineConfig& config,
                  ModelRegistry& registry,
                  PolicyStore& policies,
                  SubscriptionStore& subscriptions,
                  HealthTracker& health,
                  BudgetLedger& budget,
                  ExperimentOverlay& experiments,
                  LineageSinkPtr lineage,
                  MetricsSinkPtr metrics = nullptr,
                  InvocationOrchestrator::Sleeper sleeper = InvocationOrchestrator::Sleeper());

    virtual ~RoutingEngine() = default;

    /**
     * @brief Route one request
     */
    virtual RoutingResponse route(const RoutingRequest& request);

    /**
     * @brief Route independent requests concurrently
     *
     * At most `max_parallel_requests` run at once; responses keep the
     * order of the requests.
     */
    virtual std::vector<RoutingResponse> routeBatch(const std::vector<RoutingRequest>& requests);

    /**
     * @brief Install a contextual detector for inconclusive screening
     */
    void setContextualDetector(std::shared_ptr<ContextualDetector> detector);

    /**
     * @brief Register a selection strategy for a directive kind
     */
    void registerSelectionStrategy(DirectiveKind kind, std::shared_ptr<SelectionStrategy> strategy);

    /**
     * @brief Flush buffered lineage
     */
    void flushLineage();

    EngineStatistics getStatistics() const;

    const EngineConfig& config() const { return m_config; }

private:
    EngineConfig m_config;
    ModelRegistry& m_registry;
    PolicyStore& m_policies;
    SubscriptionStore& m_subscriptions;
    HealthTracker& m_health;
    BudgetLedger& m_budget;
    ExperimentOverlay& m_experiments;
    MetricsSinkPtr m_metrics;

    std::shared_ptr<BufferedLineageSink> m_lineage_buffer;
    std::unique_ptr<LineageRecorder> m_lineage;
    CandidateSelector m_selector;
    InvocationOrchestrator m_orchestrator;
    OutputFirewall m_firewall;

    std::shared_ptr<ContextualDetector> m_contextual;
    mutable std::mutex m_contextual_mutex;

    EngineStatistics m_statistics;
    mutable std::mutex m_statistics_mutex;

    /**
     * @brief Pipeline body; may throw, route() turns exceptions into internal errors
     */
    void runPipeline(const RoutingRequest& request, DecisionTrace& trace, RoutingResponse& response);

    void deny(DecisionTrace& trace, RoutingResponse& response, const std::string& reason,
              const std::string& message) const;

    std::vector<Candidate> filterFallback(CandidateSet fallback,
                                          const std::unordered_set<std::string>& permitted,
                                          const RequestContext& context,
                                          const Policy& policy,
                                          const BudgetStatus& budget) const;

    std::shared_ptr<ContextualDetector> contextualFor(const RegistrySnapshot& registry);

    void finish(const RequestContext& context, DecisionTrace& trace, RoutingResponse& response);
    void emitMetrics(const DecisionTrace& trace) const;
    void updateStatistics(const DecisionTrace& trace);
};

} // namespace Arbiter
