// =================================================================
// src/Arbiter/RoutingEngine.cpp
// =================================================================
// Implementation of the request routing pipeline.

#include "Arbiter/RoutingEngine.hpp"
#include "Arbiter/ComplianceFilter.hpp"
#include "Arbiter/Errors.hpp"
#include "Arbiter/Identifiers.hpp"
#include "Arbiter/Logger.hpp"
#include "Arbiter/PolicyEvaluator.hpp"
#include "Arbiter/SubscriptionResolver.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <future>
#include <unordered_set>

namespace Arbiter {

void to_json(nlohmann::json& j, const RoutingResponse& response) {
    j = nlohmann::json{
        {"audit_id", response.audit_id},
        {"status", requestStatusToString(response.status)},
        {"error_kind", errorKindToString(response.error_kind)},
        {"reason", response.reason},
        {"message", response.message},
        {"output", response.output},
        {"recommended_model", response.recommended_model},
        {"final_model", response.final_model},
        {"fell_back", response.fell_back},
        {"rule_id", response.rule_id},
        {"usage", {{"input_tokens", response.usage.input_tokens},
                   {"output_tokens", response.usage.output_tokens}}},
        {"cost", response.cost},
        {"firewall", response.firewall},
        {"attempted_chain", response.attempted_chain}
    };
    if (!response.remediation.empty()) {
        j["remediation"] = response.remediation;
    }
}

RoutingEngine::RoutingEngine(const EngineConfig& config,
                             ModelRegistry& registry,
                             PolicyStore& policies,
                             SubscriptionStore& subscriptions,
                             HealthTracker& health,
                             BudgetLedger& budget,
                             ExperimentOverlay& experiments,
                             LineageSinkPtr lineage,
                             MetricsSinkPtr metrics,
                             InvocationOrchestrator::Sleeper sleeper)
    : m_config(config),
      m_registry(registry),
      m_policies(policies),
      m_subscriptions(subscriptions),
      m_health(health),
      m_budget(budget),
      m_experiments(experiments),
      m_metrics(std::move(metrics)),
      m_orchestrator([&registry](const ModelDescriptor& model) { return registry.adapterFor(model); },
                     health, config.retry, config.provider_timeout, std::move(sleeper),
                     config.max_outstanding_calls),
      m_firewall(config.sanitizer_timeout, config.contextual_timeout) {

    if (!lineage) {
        throw ConfigError("RoutingEngine requires a lineage sink");
    }
    m_lineage_buffer = std::make_shared<BufferedLineageSink>(std::move(lineage), config.lineage_write_timeout,
                                                             config.lineage_buffer_limit);
    m_lineage = std::make_unique<LineageRecorder>(m_lineage_buffer);

    Logger::getInstance().info("RoutingEngine", "Routing engine initialized",
                               "lineage=" + m_lineage_buffer->getName());
}

RoutingResponse RoutingEngine::route(const RoutingRequest& request) {
    auto start_time = std::chrono::steady_clock::now();
    const RequestContext& context = request.context;

    DecisionTrace trace;
    trace.audit_id = generateAuditId();
    trace.started_at = std::chrono::system_clock::now();
    trace.tenant_id = context.tenant_id;
    trace.app_id = context.app_id;
    trace.team_id = context.team_id.value_or("");
    trace.sensitivity = sensitivityToString(context.sensitivity);

    RoutingResponse response;
    response.audit_id = trace.audit_id;

    Logger::getInstance().debug("RoutingEngine", "Routing request for app " + context.app_id, trace.audit_id);

    try {
        runPipeline(request, trace, response);
    } catch (const std::exception& e) {
        Logger::getInstance().error("RoutingEngine", "Pipeline failed: " + std::string(e.what()), trace.audit_id);
        trace.status = RequestStatus::FAILED;
        trace.error_kind = ErrorKind::NONE;
        trace.reason = Reason::INTERNAL_ERROR;
        trace.message = e.what();
        response.output.clear();
    }

    trace.total_latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    finish(context, trace, response);
    return response;
}

void RoutingEngine::runPipeline(const RoutingRequest& request, DecisionTrace& trace, RoutingResponse& response) {
    const RequestContext& context = request.context;
    auto stage_start = std::chrono::steady_clock::now();
    auto mark = [&trace, &stage_start](const char* stage) {
        auto now = std::chrono::steady_clock::now();
        trace.timings.push_back({stage, std::chrono::duration_cast<std::chrono::microseconds>(now - stage_start)});
        stage_start = now;
    };

    uint64_t seed = fnv1a64(trace.audit_id);

    // Snapshots are held for the whole request
    RegistrySnapshotPtr registry = m_registry.snapshot();
    SubscriptionSnapshotPtr subscriptions = m_subscriptions.snapshot();
    PolicyPtr policy = m_policies.active(context.app_id);
    trace.registry_generation = registry->generation();
    trace.subscription_version = subscriptions->version();

    if (!policy) {
        deny(trace, response, Reason::NO_ACTIVE_POLICY, "No active policy for app '" + context.app_id + "'");
        return;
    }
    trace.policy_id = policy->id;
    trace.policy_version = policy->version;

    // Step 1: Policy evaluation
    EvaluationResult evaluation = PolicyEvaluator::evaluate(*policy, context, *registry);
    mark("policy");
    if (!evaluation.matched) {
        deny(trace, response, Reason::NO_ELIGIBLE_MODEL, "No policy rule matched the request");
        return;
    }
    trace.rule_id = evaluation.rule_id;
    trace.directive = directiveKindToString(evaluation.candidates.kind);
    if (evaluation.candidates.empty()) {
        deny(trace, response, Reason::NO_ELIGIBLE_MODEL,
             "Rule '" + evaluation.rule_id + "' references no routable model");
        return;
    }

    // Step 2: Subscriptions
    SubscriptionResolution subscription = SubscriptionResolver::resolve(
        evaluation.candidates, context, *subscriptions, policy->subscription_precedence);
    mark("subscription");
    if (subscription.winning_scope) {
        trace.subscription_scope = subscriptionScopeToString(*subscription.winning_scope);
    }
    if (subscription.candidates.empty()) {
        deny(trace, response, Reason::NO_ELIGIBLE_MODEL,
             subscription.winning_scope ? "No candidate is covered by the " + trace.subscription_scope + " subscription"
                                        : "No enabled subscription for tenant, app or team");
        return;
    }

    // Step 3: Compliance
    ComplianceResult compliance = ComplianceFilter::apply(std::move(subscription.candidates), context,
                                                          policy->compliance);
    mark("compliance");
    trace.compliant_set = compliance.candidates.modelIds();
    if (compliance.candidates.empty()) {
        deny(trace, response, Reason::COMPLIANCE_BLOCK,
             compliance.sensitivity_block ? "Sensitivity " + trace.sensitivity + " forbids every external candidate"
                                          : "A request tag forbids every external candidate");
        return;
    }
    CandidateSet compliant = compliance.candidates;

    // Step 4: Health gate
    HealthGateResult gate = HealthGate::apply(std::move(compliance.candidates), m_health);
    mark("health");
    trace.removed_open = gate.removed_open;
    TrialLease trials(m_health, gate.trial_keys);
    if (gate.candidates.empty()) {
        deny(trace, response, Reason::NO_ELIGIBLE_MODEL, "Every compliant candidate has an open circuit");
        return;
    }

    // Step 5: Budget gate
    BudgetGateResult budget = BudgetGate::apply(std::move(gate.candidates), context, policy->budget, m_budget);
    mark("budget");
    trace.budget_downgraded = budget.downgraded;
    if (budget.candidates.empty()) {
        deny(trace, response, Reason::BUDGET_EXCEEDED,
             "Monthly budget exhausted and no candidate is within the minimal-cost threshold");
        return;
    }

    // Step 6: Experiment overlay
    OverlayResult overlay = m_experiments.apply(std::move(budget.candidates), context);
    mark("experiment");
    trace.candidate_order = overlay.candidates.modelIds();
    if (overlay.assignment) {
        trace.experiment_id = overlay.assignment->experiment_id;
        trace.experiment_arm = experimentArmToString(overlay.assignment->arm);
    }

    // Step 7: Selection
    HealthTracker& health = m_health;
    SelectionResult selection = m_selector.select(overlay.candidates, seed, [&health](const ModelDescriptor& model) {
        return health.score(model.healthKey());
    });
    mark("selection");
    trace.selection_strategy = selection.strategy;
    trace.recommended_model = selection.recommended->id;

    std::unordered_set<std::string> carried_trials;
    for (const auto& candidate : selection.order) {
        if (candidate.trial) {
            carried_trials.insert(candidate.model->healthKey());
        }
    }
    trials.releaseExcept(carried_trials);

    // Step 8: Invocation
    InvocationPlan plan;
    plan.primary = selection.order;
    plan.fallback = filterFallback(evaluation.fallback, subscription.permitted, context, *policy, budget.status);
    for (const auto& candidate : plan.fallback) {
        if (std::find(trace.compliant_set.begin(), trace.compliant_set.end(), candidate.id()) ==
            trace.compliant_set.end()) {
            trace.compliant_set.push_back(candidate.id());
        }
    }
    plan.compliant = BudgetGate::applyStatus(std::move(compliant), budget.status, policy->budget).candidates;
    plan.degrade_mode = policy->degrade_mode;
    plan.seed = seed;

    InvocationOptions options;
    if (context.options.max_tokens) {
        options.max_tokens = *context.options.max_tokens;
    }
    if (context.options.temperature) {
        options.temperature = *context.options.temperature;
    }
    options.timeout = m_config.provider_timeout;

    MetricsSinkPtr metrics = m_metrics;
    std::string app_id = context.app_id;
    auto observer = [metrics, app_id](const AttemptRecord& attempt) {
        if (metrics) {
            metrics->increment("arbiter_attempts_total",
                               {app_id, attempt.model_id, attempt.provider,
                                attempt.success ? "ok" : providerErrorClassToString(attempt.error_class)});
            metrics->observe("arbiter_attempt_latency_ms",
                             {app_id, attempt.model_id, attempt.provider, ""},
                             static_cast<double>(attempt.latency.count()));
        }
    };

    trials.handOff();
    InvocationOutcome outcome = m_orchestrator.run(plan, context.input, options, trace.audit_id,
                                                   request.cancel, observer);
    mark("invocation");
    trace.attempts = outcome.attempts;
    trace.fell_back = outcome.fell_back;
    trace.degraded_completion = outcome.degraded_completion;

    std::chrono::milliseconds attempt_latency{0};
    for (const auto& attempt : outcome.attempts) {
        attempt_latency += attempt.latency;
    }

    if (!outcome.success) {
        if (outcome.cancelled) {
            trace.status = RequestStatus::CLIENT_CANCELLED;
            trace.error_kind = ErrorKind::CLIENT_CANCELLED;
            trace.reason = Reason::CLIENT_CANCELLED;
            trace.message = "Caller cancelled the request";
            return;
        }
        trace.status = RequestStatus::FAILED;
        trace.error_kind = ErrorKind::EXHAUSTED_FALLBACK;
        trace.reason = Reason::EXHAUSTED_FALLBACK;
        trace.message = "Every candidate failed; last error " + providerErrorClassToString(outcome.last_error);
        response.remediation = outcome.remediation;
        if (overlay.assignment) {
            m_experiments.recordOutcome(*overlay.assignment, attempt_latency, 0.0, false);
        }
        return;
    }

    trace.final_model = outcome.final_model->id;
    trace.usage = outcome.result.usage;
    double cost = computeCost(*outcome.final_model, outcome.result.usage);

    if (request.cancel && request.cancel->isCancelled()) {
        // The provider already charged for the output
        trace.cost = cost;
        m_budget.recordSpend(context.tenant_id, context.app_id, cost);
        trace.status = RequestStatus::CLIENT_CANCELLED;
        trace.error_kind = ErrorKind::CLIENT_CANCELLED;
        trace.reason = Reason::CLIENT_CANCELLED;
        trace.message = "Caller cancelled before the output was screened";
        return;
    }

    // Step 9: Output firewall
    ModelDescriptorPtr sanitizer_model;
    ProviderAdapterPtr sanitizer;
    if (!policy->sanitizer_model.empty()) {
        sanitizer_model = registry->find(policy->sanitizer_model);
        if (sanitizer_model && sanitizer_model->enabled &&
            ComplianceFilter::isEligible(*sanitizer_model, context, policy->compliance)) {
            sanitizer = m_registry.adapterFor(*sanitizer_model);
        } else if (sanitizer_model) {
            Logger::getInstance().warning("RoutingEngine",
                "Sanitizing model " + sanitizer_model->id + " is not eligible for this request", trace.audit_id);
            sanitizer_model = nullptr;
        }
    }

    FirewallResult screened = m_firewall.screen(outcome.result.text, *policy, context.options.firewall_override,
                                                sanitizer, sanitizer_model, contextualFor(*registry));
    mark("firewall");
    trace.firewall = screened.report;
    Logger::getInstance().logFirewallOutcome(trace.audit_id, screened.report);

    // Step 10: Cost
    if (screened.report.redrafted && sanitizer_model) {
        cost += computeCost(*sanitizer_model, screened.report.sanitizer_usage);
    }
    trace.cost = cost;
    m_budget.recordSpend(context.tenant_id, context.app_id, cost);
    if (overlay.assignment) {
        m_experiments.recordOutcome(*overlay.assignment, attempt_latency, cost, true);
    }
    mark("cost");

    trace.status = RequestStatus::SUCCEEDED;
    if (screened.report.degraded) {
        trace.error_kind = ErrorKind::FIREWALL_DEGRADED;
        trace.reason = Reason::FIREWALL_DEGRADED;
        trace.message = screened.report.degrade_reason;
    }
    response.output = screened.output;
}

void RoutingEngine::deny(DecisionTrace& trace, RoutingResponse& response, const std::string& reason,
                         const std::string& message) const {
    trace.status = RequestStatus::DENIED;
    trace.error_kind = ErrorKind::POLICY_DENY;
    trace.reason = reason;
    trace.message = message;
    response.output.clear();
}

std::vector<Candidate> RoutingEngine::filterFallback(CandidateSet fallback,
                                                     const std::unordered_set<std::string>& permitted,
                                                     const RequestContext& context,
                                                     const Policy& policy,
                                                     const BudgetStatus& budget) const {
    if (fallback.empty()) {
        return {};
    }
    CandidateSet subscribed = SubscriptionResolver::restrict(std::move(fallback), permitted);
    ComplianceResult compliant = ComplianceFilter::apply(std::move(subscribed), context, policy.compliance);
    return BudgetGate::applyStatus(std::move(compliant.candidates), budget, policy.budget).candidates;
}

std::shared_ptr<ContextualDetector> RoutingEngine::contextualFor(const RegistrySnapshot& registry) {
    {
        std::lock_guard<std::mutex> lock(m_contextual_mutex);
        if (m_contextual) {
            return m_contextual;
        }
    }
    if (m_config.contextual_model.empty()) {
        return nullptr;
    }
    ModelDescriptorPtr model = registry.find(m_config.contextual_model);
    if (!model || !model->enabled) {
        return nullptr;
    }
    ProviderAdapterPtr adapter = m_registry.adapterFor(*model);
    if (!adapter) {
        return nullptr;
    }
    return std::make_shared<AdapterContextualDetector>(adapter, model);
}

void RoutingEngine::finish(const RequestContext& context, DecisionTrace& trace, RoutingResponse& response) {
    response.status = trace.status;
    response.error_kind = trace.error_kind;
    response.reason = trace.reason;
    response.message = trace.message;
    response.recommended_model = trace.recommended_model;
    response.final_model = trace.final_model;
    response.fell_back = trace.fell_back;
    response.rule_id = trace.rule_id;
    response.usage = trace.usage;
    response.cost = trace.cost;
    response.firewall = trace.firewall;
    response.attempted_chain = trace.attemptedChain();
    if (!response.success()) {
        response.output.clear();
    }

    Logger::getInstance().logRoutingDecision(trace);

    if (!m_lineage->record(trace)) {
        Logger::getInstance().error("RoutingEngine", "Decision trace was not recorded", trace.audit_id);
    }

    emitMetrics(trace);
    updateStatistics(trace);

    Logger::getInstance().debug("RoutingEngine", "Request for app " + context.app_id + " finished with status " +
                                requestStatusToString(trace.status), trace.audit_id);
}

void RoutingEngine::emitMetrics(const DecisionTrace& trace) const {
    if (!m_metrics) {
        return;
    }

    std::string provider = trace.attempts.empty() ? "" : trace.attempts.back().provider;
    std::string model = trace.final_model.empty() ? trace.recommended_model : trace.final_model;
    std::string reason = trace.reason.empty() ? "ok" : trace.reason;

    MetricKey request_key{trace.app_id, model, provider, reason};
    m_metrics->increment("arbiter_requests_total", request_key);
    m_metrics->observe("arbiter_request_latency_ms", request_key, static_cast<double>(trace.total_latency.count()));

    if (trace.cost > 0.0) {
        m_metrics->increment("arbiter_cost_total", {trace.app_id, model, provider, ""}, trace.cost);
    }
    if (trace.fell_back) {
        m_metrics->increment("arbiter_fallbacks_total", {trace.app_id, model, provider, "fell_back"});
    }
    if (trace.degraded_completion) {
        m_metrics->increment("arbiter_fallbacks_total", {trace.app_id, model, provider, "minimal_completion"});
    }
    for (const auto& skipped : trace.removed_open) {
        m_metrics->increment("arbiter_circuit_skips_total", {trace.app_id, skipped, "", "circuit_open"});
    }
    if (trace.budget_downgraded) {
        m_metrics->increment("arbiter_budget_downgrades_total", {trace.app_id, model, provider, "budget_low"});
    }
    if (trace.firewall.state != FirewallState::CLEAN || trace.firewall.degraded) {
        m_metrics->increment("arbiter_firewall_total",
                             {trace.app_id, model, provider,
                              trace.firewall.degraded ? Reason::FIREWALL_DEGRADED
                                                      : firewallStateToString(trace.firewall.state)});
    }
}

void RoutingEngine::updateStatistics(const DecisionTrace& trace) {
    std::lock_guard<std::mutex> lock(m_statistics_mutex);
    m_statistics.total_requests++;
    switch (trace.status) {
        case RequestStatus::SUCCEEDED: m_statistics.succeeded++; break;
        case RequestStatus::DENIED: m_statistics.denied++; break;
        case RequestStatus::FAILED: m_statistics.failed++; break;
        case RequestStatus::CLIENT_CANCELLED: m_statistics.cancelled++; break;
    }
    if (trace.fell_back) {
        m_statistics.fallbacks++;
    }
    if (trace.firewall.redrafted) {
        m_statistics.redrafts++;
    }
}

std::vector<RoutingResponse> RoutingEngine::routeBatch(const std::vector<RoutingRequest>& requests) {
    std::vector<RoutingResponse> responses;
    responses.reserve(requests.size());

    size_t window = std::max<size_t>(1, m_config.max_parallel_requests);
    for (size_t begin = 0; begin < requests.size(); begin += window) {
        size_t end = std::min(requests.size(), begin + window);

        std::vector<std::future<RoutingResponse>> futures;
        for (size_t i = begin; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, [this, &requests, i]() {
                return route(requests[i]);
            }));
        }
        for (auto& future : futures) {
            responses.push_back(future.get());
        }
    }

    Logger::getInstance().info("RoutingEngine", "Routed batch of " + std::to_string(requests.size()) + " requests");
    return responses;
}

void RoutingEngine::setContextualDetector(std::shared_ptr<ContextualDetector> detector) {
    std::lock_guard<std::mutex> lock(m_contextual_mutex);
    m_contextual = std::move(detector);
}

void RoutingEngine::registerSelectionStrategy(DirectiveKind kind, std::shared_ptr<SelectionStrategy> strategy) {
    m_selector.registerStrategy(kind, std::move(strategy));
}

void RoutingEngine::flushLineage() {
    m_lineage_buffer->flush();
}

EngineStatistics RoutingEngine::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_statistics_mutex);
    return m_statistics;
}

} // namespace Arbiter
