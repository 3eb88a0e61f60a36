// =================================================================
// src/Arbiter/DecisionTrace.cpp
// =================================================================
// Decision trace helpers and JSON serialization.

#include "Arbiter/DecisionTrace.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Arbiter {

namespace {

std::string isoTimestamp(std::chrono::system_clock::time_point time_point) {
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()) % 1000;
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // namespace

std::string requestStatusToString(RequestStatus status) {
    switch (status) {
        case RequestStatus::SUCCEEDED: return "succeeded";
        case RequestStatus::DENIED: return "denied";
        case RequestStatus::FAILED: return "failed";
        case RequestStatus::CLIENT_CANCELLED: return "client_cancelled";
        default: return "unknown";
    }
}

std::vector<std::string> DecisionTrace::attemptedChain() const {
    std::vector<std::string> chain;
    for (const auto& attempt : attempts) {
        if (chain.empty() || chain.back() != attempt.model_id) {
            chain.push_back(attempt.model_id);
        }
    }
    return chain;
}

double computeCost(const ModelDescriptor& model, const TokenUsage& usage) {
    return static_cast<double>(usage.input_tokens) / 1000.0 * model.price_per_1k_input +
           static_cast<double>(usage.output_tokens) / 1000.0 * model.price_per_1k_output;
}

void to_json(nlohmann::json& j, const AttemptRecord& attempt) {
    j = nlohmann::json{
        {"model", attempt.model_id},
        {"provider", attempt.provider},
        {"attempt", attempt.attempt},
        {"success", attempt.success},
        {"error_class", providerErrorClassToString(attempt.error_class)},
        {"error", attempt.error_message},
        {"latency_ms", attempt.latency.count()},
        {"backoff_ms", attempt.backoff.count()},
        {"trial", attempt.trial},
        {"degrade", attempt.degrade}
    };
}

void to_json(nlohmann::json& j, const FirewallReport& report) {
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& violation : report.violations) {
        violations.push_back({
            {"detector", violation.detector},
            {"sample", violation.masked_sample},
            {"offset", violation.offset}
        });
    }

    j = nlohmann::json{
        {"state", firewallStateToString(report.state)},
        {"action", firewallActionToString(report.action)},
        {"redrafted", report.redrafted},
        {"sanitizing_model", report.sanitizing_model},
        {"degraded", report.degraded},
        {"degrade_reason", report.degrade_reason},
        {"contextual_ran", report.contextual_ran},
        {"violations", violations}
    };
}

void to_json(nlohmann::json& j, const DecisionTrace& trace) {
    nlohmann::json timings = nlohmann::json::object();
    for (const auto& timing : trace.timings) {
        timings[timing.stage] = timing.duration.count();
    }

    j = nlohmann::json{
        {"audit_id", trace.audit_id},
        {"timestamp", isoTimestamp(trace.started_at)},
        {"tenant", trace.tenant_id},
        {"app", trace.app_id},
        {"team", trace.team_id},
        {"sensitivity", trace.sensitivity},
        {"policy", {{"id", trace.policy_id}, {"version", trace.policy_version}}},
        {"registry_generation", trace.registry_generation},
        {"subscription_version", trace.subscription_version},
        {"rule_id", trace.rule_id},
        {"directive", trace.directive},
        {"subscription_scope", trace.subscription_scope},
        {"compliant_set", trace.compliant_set},
        {"removed_open", trace.removed_open},
        {"budget_downgraded", trace.budget_downgraded},
        {"experiment", {{"id", trace.experiment_id}, {"arm", trace.experiment_arm}}},
        {"candidate_order", trace.candidate_order},
        {"selection_strategy", trace.selection_strategy},
        {"recommended_model", trace.recommended_model},
        {"final_model", trace.final_model},
        {"fell_back", trace.fell_back},
        {"degraded_completion", trace.degraded_completion},
        {"attempted_chain", trace.attemptedChain()},
        {"attempts", trace.attempts},
        {"firewall", trace.firewall},
        {"usage", {{"input_tokens", trace.usage.input_tokens}, {"output_tokens", trace.usage.output_tokens}}},
        {"cost", trace.cost},
        {"stage_timings_us", timings},
        {"status", requestStatusToString(trace.status)},
        {"error_kind", errorKindToString(trace.error_kind)},
        {"reason", trace.reason},
        {"message", trace.message},
        {"total_latency_ms", trace.total_latency.count()}
    };
}

} // namespace Arbiter
