// =================================================================
// include/Arbiter/HealthTracker.hpp
// =================================================================
// Per-model health records, circuit breakers and the health gate stage.

#pragma once

#include "Arbiter/CandidateSet.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Arbiter {

/**
 * @brief Circuit breaker state
 */
enum class CircuitState {
    CLOSED,     ///< Normal traffic
    OPEN,       ///< Rejects new traffic until the cool-down passes
    HALF_OPEN   ///< Admits a single trial request
};

std::string circuitStateToString(CircuitState state);

/**
 * @brief Circuit breaker thresholds
 */
struct HealthConfig {
    std::chrono::milliseconds window{60000};               ///< Trailing window for failure counting
    size_t failure_threshold = 5;                          ///< Trip when failures in the window exceed this
    std::chrono::milliseconds latency_p95_threshold{10000}; ///< p95 latency considered degraded
    std::chrono::milliseconds latency_sustain{30000};      ///< How long p95 must stay degraded to trip
    size_t min_latency_samples = 5;                        ///< Samples needed before p95 is trusted
    std::chrono::milliseconds cool_down{30000};            ///< Open duration before a trial is admitted
};

/**
 * @brief Observable view of one health record
 */
struct HealthSnapshot {
    std::string key;                             ///< provider/model
    CircuitState state = CircuitState::CLOSED;   ///< Circuit state
    size_t successes = 0;                        ///< Successes in the window
    size_t failures = 0;                         ///< Failures in the window
    std::chrono::milliseconds p95_latency{0};    ///< p95 latency over the window
    double score = 1.0;                          ///< Health score in [0, 1]
    bool trial_in_flight = false;                ///< A half-open trial is running
};

/**
 * @brief Tracks rolling health per (provider, model)
 *
 * Records are created lazily and locked individually; the record map is
 * only write-locked when a new key appears.
 */
class HealthTracker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit HealthTracker(HealthConfig config = HealthConfig(), Clock clock = Clock());

    /**
     * @brief Current circuit state, applying the open to half-open transition
     */
    CircuitState state(const std::string& key);

    /**
     * @brief Try to become the single in-flight trial of a half-open circuit
     * @return True if the caller now owns the trial
     */
    bool tryAcquireTrial(const std::string& key);

    /**
     * @brief Give back a trial acquired with tryAcquireTrial
     */
    void releaseTrial(const std::string& key);

    /**
     * @brief Record the outcome of one invocation
     *
     * While half-open only the trial holder's outcome moves the circuit;
     * late results from other requests are kept as samples.
     *
     * @param key Health key of the model
     * @param success Whether the invocation succeeded
     * @param latency Observed latency
     * @param trial Whether the caller holds the half-open trial
     */
    void recordOutcome(const std::string& key, bool success, std::chrono::milliseconds latency,
                       bool trial = false);

    /**
     * @brief Health score; tie-break only, never a gate
     *
     * Success ratio over the window weighted by latency headroom against the
     * p95 threshold. Unknown keys score 1.
     */
    double score(const std::string& key);

    HealthSnapshot snapshot(const std::string& key);

    const HealthConfig& config() const { return m_config; }

private:
    struct Sample {
        std::chrono::steady_clock::time_point at;
        bool success;
        std::chrono::milliseconds latency;
    };

    struct Record {
        std::mutex mutex;
        CircuitState state = CircuitState::CLOSED;
        std::deque<Sample> samples;
        std::chrono::steady_clock::time_point opened_at;
        std::optional<std::chrono::steady_clock::time_point> latency_breach_since;
        std::atomic<bool> trial_in_flight{false};
    };

    HealthConfig m_config;
    Clock m_clock;
    std::unordered_map<std::string, std::shared_ptr<Record>> m_records;
    mutable std::shared_mutex m_records_mutex;

    std::shared_ptr<Record> recordFor(const std::string& key);
    std::shared_ptr<Record> findRecord(const std::string& key) const;

    // The helpers below expect the record mutex to be held
    void prune(Record& record, std::chrono::steady_clock::time_point now) const;
    void advance(Record& record, std::chrono::steady_clock::time_point now) const;
    void trip(Record& record, std::chrono::steady_clock::time_point now, const std::string& key,
              const std::string& reason) const;
    std::chrono::milliseconds p95(const Record& record) const;
    double scoreLocked(const Record& record) const;
};

/**
 * @brief Outcome of the health gate
 */
struct HealthGateResult {
    CandidateSet candidates;                ///< Closed candidates and admitted trials
    std::vector<std::string> removed_open;  ///< Candidates with an open circuit
    std::vector<std::string> bypassed;      ///< Half-open candidates whose trial was taken
    std::vector<std::string> trial_keys;    ///< Health keys this request now owns a trial for
};

/**
 * @brief Health gate stage
 */
class HealthGate {
public:
    /**
     * @brief Drop open circuits and admit at most one trial per half-open circuit
     *
     * Trials listed in trial_keys must be released by the caller once the
     * request is done with them.
     */
    static HealthGateResult apply(CandidateSet candidates, HealthTracker& tracker);
};

/**
 * @brief Owns half-open trials on behalf of one request
 *
 * Every trial still held when the lease goes away is released, including
 * on exceptions.
 */
class TrialLease {
public:
    explicit TrialLease(HealthTracker& tracker, const std::vector<std::string>& keys = {});
    ~TrialLease();

    TrialLease(const TrialLease&) = delete;
    TrialLease& operator=(const TrialLease&) = delete;

    void adopt(const std::string& key);
    bool holds(const std::string& key) const;

    /**
     * @brief Release one trial if held
     */
    void release(const std::string& key);

    /**
     * @brief Release every trial not listed in `keep`
     */
    void releaseExcept(const std::unordered_set<std::string>& keep);

    /**
     * @brief Forget the held trials without releasing them; the new owner releases them
     */
    void handOff();

private:
    HealthTracker& m_tracker;
    std::unordered_set<std::string> m_keys;
};

} // namespace Arbiter
