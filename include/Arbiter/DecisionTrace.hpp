// =================================================================
// include/Arbiter/DecisionTrace.hpp
// =================================================================
// Audit record of one request's routing and safety decisions.

#pragma once

#include "Arbiter/Errors.hpp"
#include "Arbiter/OutputFirewall.hpp"
#include "Arbiter/ProviderAdapter.hpp"
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace Arbiter {

/**
 * @brief Terminal status of a request
 */
enum class RequestStatus {
    SUCCEEDED,          ///< Output returned
    DENIED,             ///< Policy deny before any invocation
    FAILED,             ///< Every candidate failed or an internal error occurred
    CLIENT_CANCELLED    ///< Caller disconnected
};

std::string requestStatusToString(RequestStatus status);

/**
 * @brief One provider invocation attempt
 */
struct AttemptRecord {
    std::string model_id;                                     ///< Model invoked
    std::string provider;                                     ///< Provider of the model
    size_t attempt = 1;                                       ///< Attempt number on this model
    bool success = false;                                     ///< Outcome
    ProviderErrorClass error_class = ProviderErrorClass::NONE; ///< Failure class
    std::string error_message;                                ///< Failure detail
    std::chrono::milliseconds latency{0};                     ///< Attempt latency
    std::chrono::milliseconds backoff{0};                     ///< Wait before the next attempt
    bool trial = false;                                       ///< Half-open trial
    bool degrade = false;                                     ///< Minimal-completion attempt
};

/**
 * @brief Duration of one pipeline stage
 */
struct StageTiming {
    std::string stage;                        ///< Stage name
    std::chrono::microseconds duration{0};    ///< Wall time
};

/**
 * @brief Durable audit record; one per request, immutable once persisted
 */
struct DecisionTrace {
    std::string audit_id;                      ///< Unique audit identifier
    std::chrono::system_clock::time_point started_at; ///< Ingress time
    std::string tenant_id;
    std::string app_id;
    std::string team_id;
    std::string sensitivity;
    std::string policy_id;
    std::string policy_version;
    uint64_t registry_generation = 0;
    uint64_t subscription_version = 0;
    std::string rule_id;                       ///< Matched rule
    std::string directive;                     ///< Directive kind
    std::string subscription_scope;            ///< Winning subscription scope
    std::vector<std::string> compliant_set;    ///< Post-compliance candidates and admitted fallbacks
    std::vector<std::string> removed_open;     ///< Candidates dropped by open circuits
    bool budget_downgraded = false;            ///< Budget gate reordered or narrowed
    std::string experiment_id;                 ///< Experiment in scope
    std::string experiment_arm;                ///< Assigned arm
    std::vector<std::string> candidate_order;  ///< Candidates handed to the selector, in order
    std::string selection_strategy;            ///< Selector strategy
    std::string recommended_model;             ///< Selector's choice
    std::string final_model;                   ///< Model that served the request
    bool fell_back = false;                    ///< A later candidate was tried
    bool degraded_completion = false;          ///< Served by the minimal-completion attempt
    std::vector<AttemptRecord> attempts;       ///< Attempts in order
    FirewallReport firewall;                   ///< Firewall outcome, masked
    TokenUsage usage;                          ///< Tokens of the serving model
    double cost = 0.0;                         ///< Total cost including sanitizer
    std::vector<StageTiming> timings;          ///< Per-stage timings
    RequestStatus status = RequestStatus::SUCCEEDED;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string reason;                        ///< Reason code
    std::string message;                       ///< Human-readable detail
    std::chrono::milliseconds total_latency{0};

    /**
     * @brief Model ids of attempts in order
     */
    std::vector<std::string> attemptedChain() const;
};

/**
 * @brief Cost of a model invocation from its per-1k prices
 */
double computeCost(const ModelDescriptor& model, const TokenUsage& usage);

void to_json(nlohmann::json& j, const AttemptRecord& attempt);
void to_json(nlohmann::json& j, const FirewallReport& report);
void to_json(nlohmann::json& j, const DecisionTrace& trace);

} // namespace Arbiter
