// =================================================================
// src/Arbiter/ExperimentOverlay.cpp
// =================================================================
// Implementation of the experiment overlay.

#include "Arbiter/ExperimentOverlay.hpp"
#include "Arbiter/Errors.hpp"
#include "Arbiter/Identifiers.hpp"
#include "Arbiter/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Arbiter {

std::string experimentStateToString(ExperimentState state) {
    return state == ExperimentState::ACTIVE ? "active" : "rolled_back";
}

std::string experimentArmToString(ExperimentArm arm) {
    return arm == ExperimentArm::CONTROL ? "control" : "variant";
}

// =================================================================
// ArmMetrics
// =================================================================

void ExperimentOverlay::ArmMetrics::add(std::chrono::milliseconds latency, bool success, double cost, size_t window) {
    latencies.push_back(latency);
    outcomes.push_back(success);
    total_cost += cost;
    while (outcomes.size() > window && window > 0) {
        latencies.pop_front();
        outcomes.pop_front();
    }
}

std::chrono::milliseconds ExperimentOverlay::ArmMetrics::p95() const {
    if (latencies.empty()) {
        return std::chrono::milliseconds(0);
    }
    std::vector<std::chrono::milliseconds> sorted(latencies.begin(), latencies.end());
    std::sort(sorted.begin(), sorted.end());
    size_t rank = static_cast<size_t>(std::ceil(0.95 * static_cast<double>(sorted.size())));
    return sorted[rank == 0 ? 0 : rank - 1];
}

double ExperimentOverlay::ArmMetrics::successRate() const {
    if (outcomes.empty()) {
        return 1.0;
    }
    size_t successes = static_cast<size_t>(std::count(outcomes.begin(), outcomes.end(), true));
    return static_cast<double>(successes) / static_cast<double>(outcomes.size());
}

// =================================================================
// ExperimentOverlay
// =================================================================

ExperimentOverlay::ExperimentOverlay(GuardrailConfig defaults, Clock clock)
    : m_defaults(defaults), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = []() { return std::chrono::steady_clock::now(); };
    }
}

uint32_t ExperimentOverlay::bucketOf(const std::string& request_key) {
    return fnv1a32(request_key) % 10000u;
}

void ExperimentOverlay::loadFromConfig(const std::string& config_path) {
    std::vector<Experiment> experiments;

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        for (const auto& node : root["experiments"]) {
            Experiment experiment;
            experiment.id = node["id"].as<std::string>();
            experiment.app_id = node["app"].as<std::string>();
            experiment.tenant_id = node["tenant"].as<std::string>("");
            experiment.traffic_percent = node["traffic_percent"].as<double>(0.0);
            experiment.guardrail = m_defaults;

            if (YAML::Node variant = node["variant"]) {
                if (variant["substitute"]) {
                    for (const auto& model : variant["substitute"]) {
                        experiment.variant.substitute_models.push_back(model.as<std::string>());
                    }
                }
                if (variant["weights"]) {
                    for (YAML::const_iterator it = variant["weights"].begin(); it != variant["weights"].end(); ++it) {
                        experiment.variant.weights[it->first.as<std::string>()] = it->second.as<double>();
                    }
                }
            }

            if (YAML::Node guardrail = node["guardrail"]) {
                GuardrailConfig& g = experiment.guardrail;
                g.latency_ratio = guardrail["latency_ratio"].as<double>(g.latency_ratio);
                g.success_margin = guardrail["success_margin"].as<double>(g.success_margin);
                g.min_samples = guardrail["min_samples"].as<size_t>(g.min_samples);
                g.window_size = guardrail["window_size"].as<size_t>(g.window_size);
                g.cool_down = std::chrono::milliseconds(guardrail["cool_down_ms"].as<long>(g.cool_down.count()));
                g.auto_resume = guardrail["auto_resume"].as<bool>(g.auto_resume);
            }

            experiments.push_back(experiment);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load experiments from " + config_path + ": " + e.what());
    }

    for (const auto& experiment : experiments) {
        try {
            addExperiment(experiment);
        } catch (const std::invalid_argument& e) {
            throw ConfigError("Invalid experiment in " + config_path + ": " + e.what());
        }
    }

    Logger::getInstance().info("ExperimentOverlay", "Loaded experiments",
                               std::to_string(experiments.size()) + " from " + config_path);
}

void ExperimentOverlay::addExperiment(const Experiment& experiment) {
    if (experiment.id.empty()) {
        throw std::invalid_argument("experiment id is empty");
    }
    if (experiment.traffic_percent < 0.0 || experiment.traffic_percent > 100.0) {
        throw std::invalid_argument("traffic_percent of " + experiment.id + " must be within [0, 100]");
    }
    if (experiment.variant.substitute_models.empty() && experiment.variant.weights.empty()) {
        throw std::invalid_argument("experiment " + experiment.id + " defines no variant");
    }

    auto entry = std::make_shared<Entry>();
    entry->config = experiment;
    entry->effective_traffic = experiment.traffic_percent;

    std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
    auto existing = m_by_id.find(experiment.id);
    if (existing != m_by_id.end()) {
        std::replace(m_entries.begin(), m_entries.end(), existing->second, entry);
    } else {
        m_entries.push_back(entry);
    }
    m_by_id[experiment.id] = entry;
}

std::shared_ptr<ExperimentOverlay::Entry> ExperimentOverlay::findEntry(const std::string& experiment_id) const {
    std::shared_lock<std::shared_mutex> lock(m_entries_mutex);
    auto it = m_by_id.find(experiment_id);
    return it == m_by_id.end() ? nullptr : it->second;
}

OverlayResult ExperimentOverlay::apply(CandidateSet candidates, const RequestContext& context) {
    OverlayResult result;

    std::shared_ptr<Entry> entry;
    {
        std::shared_lock<std::shared_mutex> lock(m_entries_mutex);
        for (const auto& candidate : m_entries) {
            const Experiment& config = candidate->config;
            if (config.app_id == context.app_id &&
                (config.tenant_id.empty() || config.tenant_id == context.tenant_id)) {
                entry = candidate;
                break;
            }
        }
    }

    if (!entry) {
        result.candidates = std::move(candidates);
        return result;
    }

    ExperimentAssignment assignment;
    assignment.experiment_id = entry->config.id;
    assignment.bucket = bucketOf(context.request_key);

    double traffic;
    VariantDefinition variant;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        maybeResume(*entry, m_clock());
        traffic = entry->effective_traffic;
        variant = entry->config.variant;
    }

    if (static_cast<double>(assignment.bucket) < traffic * 100.0) {
        CandidateSet varied = candidates;
        if (applyVariant(varied, variant)) {
            assignment.arm = ExperimentArm::VARIANT;
            candidates = std::move(varied);
        }
    }

    result.candidates = std::move(candidates);
    result.assignment = assignment;
    return result;
}

bool ExperimentOverlay::applyVariant(CandidateSet& candidates, const VariantDefinition& variant) {
    if (!variant.substitute_models.empty()) {
        std::vector<Candidate> substituted;
        for (const auto& model_id : variant.substitute_models) {
            const Candidate* present = candidates.find(model_id);
            if (present) {
                substituted.push_back(*present);
            }
        }
        if (substituted.empty()) {
            return false;
        }
        candidates.candidates = std::move(substituted);
        if (candidates.kind == DirectiveKind::SINGLE && candidates.size() > 1) {
            candidates.kind = DirectiveKind::ORDERED;
        }
    }

    if (!variant.weights.empty()) {
        bool touched = false;
        for (auto& candidate : candidates.candidates) {
            auto it = variant.weights.find(candidate.id());
            if (it != variant.weights.end()) {
                candidate.weight = it->second;
                touched = true;
            }
        }
        if (!touched && variant.substitute_models.empty()) {
            return false;
        }
        candidates.kind = DirectiveKind::WEIGHTED;
    }

    return true;
}

void ExperimentOverlay::recordOutcome(const ExperimentAssignment& assignment, std::chrono::milliseconds latency,
                                      double cost, bool success) {
    auto entry = findEntry(assignment.experiment_id);
    if (!entry) {
        return;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    ArmMetrics& arm = assignment.arm == ExperimentArm::CONTROL ? entry->control : entry->variant;
    arm.add(latency, success, cost, entry->config.guardrail.window_size);
    evaluateGuardrails(*entry, m_clock());
}

void ExperimentOverlay::maybeResume(Entry& entry, std::chrono::steady_clock::time_point now) const {
    if (entry.state != ExperimentState::ROLLED_BACK || !entry.config.guardrail.auto_resume) {
        return;
    }
    if (now - entry.rolled_back_at < entry.config.guardrail.cool_down) {
        return;
    }
    entry.state = ExperimentState::ACTIVE;
    entry.effective_traffic = entry.config.traffic_percent;
    entry.control = ArmMetrics();
    entry.variant = ArmMetrics();
    Logger::getInstance().info("ExperimentOverlay", "Experiment resumed after cool-down", entry.config.id);
}

void ExperimentOverlay::evaluateGuardrails(Entry& entry, std::chrono::steady_clock::time_point now) const {
    if (entry.state != ExperimentState::ACTIVE) {
        return;
    }

    const GuardrailConfig& guardrail = entry.config.guardrail;
    if (entry.control.samples() < guardrail.min_samples || entry.variant.samples() < guardrail.min_samples) {
        return;
    }

    std::string reason;
    double control_p95 = static_cast<double>(entry.control.p95().count());
    double variant_p95 = static_cast<double>(entry.variant.p95().count());
    if (variant_p95 > control_p95 * guardrail.latency_ratio) {
        reason = "variant p95 " + std::to_string(static_cast<long>(variant_p95)) +
                 "ms exceeds control " + std::to_string(static_cast<long>(control_p95)) + "ms";
    } else if (entry.variant.successRate() < entry.control.successRate() - guardrail.success_margin) {
        reason = "variant success rate " + std::to_string(entry.variant.successRate()) +
                 " below control " + std::to_string(entry.control.successRate());
    }

    if (reason.empty()) {
        return;
    }

    entry.state = ExperimentState::ROLLED_BACK;
    entry.effective_traffic = 0.0;
    entry.rolled_back_at = now;
    Logger::getInstance().warning("ExperimentOverlay", "Experiment rolled back: " + entry.config.id, reason);
}

ExperimentStatus ExperimentOverlay::statusOf(const Entry& entry) {
    ExperimentStatus status;
    status.id = entry.config.id;
    status.state = entry.state;
    status.configured_traffic = entry.config.traffic_percent;
    status.effective_traffic = entry.effective_traffic;
    status.control_samples = entry.control.samples();
    status.variant_samples = entry.variant.samples();
    status.control_p95 = entry.control.p95();
    status.variant_p95 = entry.variant.p95();
    status.control_success_rate = entry.control.successRate();
    status.variant_success_rate = entry.variant.successRate();
    status.control_cost = entry.control.total_cost;
    status.variant_cost = entry.variant.total_cost;
    return status;
}

std::optional<ExperimentStatus> ExperimentOverlay::status(const std::string& experiment_id) const {
    auto entry = findEntry(experiment_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return statusOf(*entry);
}

std::vector<ExperimentStatus> ExperimentOverlay::allStatuses() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(m_entries_mutex);
        entries = m_entries;
    }

    std::vector<ExperimentStatus> statuses;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        statuses.push_back(statusOf(*entry));
    }
    return statuses;
}

} // namespace Arbiter
