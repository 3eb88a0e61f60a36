// =================================================================
// include/Arbiter/ExperimentOverlay.hpp
// =================================================================
// Traffic-split experiments over the candidate set with auto-rollback.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include "Arbiter/RequestContext.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Arbiter {

enum class ExperimentState {
    ACTIVE,
    ROLLED_BACK
};

enum class ExperimentArm {
    CONTROL,
    VARIANT
};

std::string experimentStateToString(ExperimentState state);
std::string experimentArmToString(ExperimentArm arm);

/**
 * @brief How the variant arm changes the candidate set
 *
 * Substitution keeps only the listed models, in the listed order, and only
 * those already present in the set. Re-weighting changes weights of present
 * candidates and turns the directive into a weighted draw.
 */
struct VariantDefinition {
    std::vector<std::string> substitute_models;          ///< Models to route to instead
    std::unordered_map<std::string, double> weights;     ///< Replacement weights by model id
};

/**
 * @brief Auto-rollback thresholds
 */
struct GuardrailConfig {
    double latency_ratio = 1.5;                  ///< Variant p95 may not exceed control p95 times this
    double success_margin = 0.1;                 ///< Variant success rate may trail control by at most this
    size_t min_samples = 20;                     ///< Samples per arm before guardrails apply
    size_t window_size = 200;                    ///< Rolling samples kept per arm
    std::chrono::milliseconds cool_down{300000}; ///< Wait after rollback before re-evaluation
    bool auto_resume = false;                    ///< Restore traffic after the cool-down
};

/**
 * @brief Experiment definition
 */
struct Experiment {
    std::string id;                    ///< Experiment identifier
    std::string tenant_id;             ///< Tenant scope; empty matches any tenant
    std::string app_id;                ///< App scope
    double traffic_percent = 0.0;      ///< Share of requests enrolled in the variant (0-100)
    VariantDefinition variant;         ///< Variant definition
    GuardrailConfig guardrail;         ///< Rollback thresholds
};

/**
 * @brief Arm a request was assigned to
 */
struct ExperimentAssignment {
    std::string experiment_id;                 ///< Experiment
    ExperimentArm arm = ExperimentArm::CONTROL; ///< Assigned arm
    uint32_t bucket = 0;                       ///< Hash bucket in [0, 10000)
};

/**
 * @brief Outcome of the overlay stage
 */
struct OverlayResult {
    CandidateSet candidates;                       ///< Candidates after the variant was applied
    std::optional<ExperimentAssignment> assignment; ///< Set when an experiment was in scope
};

/**
 * @brief Per-experiment observability view
 */
struct ExperimentStatus {
    std::string id;
    ExperimentState state = ExperimentState::ACTIVE;
    double configured_traffic = 0.0;
    double effective_traffic = 0.0;
    size_t control_samples = 0;
    size_t variant_samples = 0;
    std::chrono::milliseconds control_p95{0};
    std::chrono::milliseconds variant_p95{0};
    double control_success_rate = 1.0;
    double variant_success_rate = 1.0;
    double control_cost = 0.0;
    double variant_cost = 0.0;
};

/**
 * @brief Applies experiments and tracks per-arm outcomes
 */
class ExperimentOverlay {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ExperimentOverlay(GuardrailConfig defaults = GuardrailConfig(), Clock clock = Clock());

    /**
     * @brief Load experiments from YAML
     * @throws ConfigError on unreadable or malformed files
     */
    void loadFromConfig(const std::string& config_path);

    /**
     * @brief Register or replace an experiment
     * @throws std::invalid_argument on an empty id or traffic outside [0, 100]
     */
    void addExperiment(const Experiment& experiment);

    /**
     * @brief Apply the first in-scope experiment to a candidate set
     *
     * The overlay never adds a model that is not already a candidate. When a
     * substitution leaves nothing, the request stays on the control arm.
     */
    OverlayResult apply(CandidateSet candidates, const RequestContext& context);

    /**
     * @brief Record a completed request for an arm; may trigger rollback
     */
    void recordOutcome(const ExperimentAssignment& assignment, std::chrono::milliseconds latency,
                       double cost, bool success);

    std::optional<ExperimentStatus> status(const std::string& experiment_id) const;
    std::vector<ExperimentStatus> allStatuses() const;

    /**
     * @brief Enrollment bucket of a request key: FNV-1a modulo 10000
     */
    static uint32_t bucketOf(const std::string& request_key);

private:
    struct ArmMetrics {
        std::deque<std::chrono::milliseconds> latencies;
        std::deque<bool> outcomes;
        double total_cost = 0.0;

        void add(std::chrono::milliseconds latency, bool success, double cost, size_t window);
        size_t samples() const { return outcomes.size(); }
        std::chrono::milliseconds p95() const;
        double successRate() const;
    };

    struct Entry {
        mutable std::mutex mutex;
        Experiment config;
        ExperimentState state = ExperimentState::ACTIVE;
        double effective_traffic = 0.0;
        ArmMetrics control;
        ArmMetrics variant;
        std::chrono::steady_clock::time_point rolled_back_at;
    };

    GuardrailConfig m_defaults;
    Clock m_clock;
    std::vector<std::shared_ptr<Entry>> m_entries;
    std::unordered_map<std::string, std::shared_ptr<Entry>> m_by_id;
    mutable std::shared_mutex m_entries_mutex;

    std::shared_ptr<Entry> findEntry(const std::string& experiment_id) const;
    void maybeResume(Entry& entry, std::chrono::steady_clock::time_point now) const;
    void evaluateGuardrails(Entry& entry, std::chrono::steady_clock::time_point now) const;
    static bool applyVariant(CandidateSet& candidates, const VariantDefinition& variant);
    static ExperimentStatus statusOf(const Entry& entry);
};

} // namespace Arbiter
