// =================================================================
// src/Arbiter/HealthTracker.cpp
// =================================================================
// Implementation of circuit breakers and the health gate.

#include "Arbiter/HealthTracker.hpp"
#include "Arbiter/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace Arbiter {

std::string circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default: return "unknown";
    }
}

HealthTracker::HealthTracker(HealthConfig config, Clock clock)
    : m_config(config), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = []() { return std::chrono::steady_clock::now(); };
    }
}

std::shared_ptr<HealthTracker::Record> HealthTracker::findRecord(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_records_mutex);
    auto it = m_records.find(key);
    return it == m_records.end() ? nullptr : it->second;
}

std::shared_ptr<HealthTracker::Record> HealthTracker::recordFor(const std::string& key) {
    if (auto existing = findRecord(key)) {
        return existing;
    }
    std::unique_lock<std::shared_mutex> lock(m_records_mutex);
    auto& slot = m_records[key];
    if (!slot) {
        slot = std::make_shared<Record>();
    }
    return slot;
}

CircuitState HealthTracker::state(const std::string& key) {
    auto record = findRecord(key);
    if (!record) {
        return CircuitState::CLOSED;
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    advance(*record, m_clock());
    return record->state;
}

bool HealthTracker::tryAcquireTrial(const std::string& key) {
    auto record = findRecord(key);
    if (!record) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        advance(*record, m_clock());
        if (record->state != CircuitState::HALF_OPEN) {
            return false;
        }
    }
    bool expected = false;
    return record->trial_in_flight.compare_exchange_strong(expected, true);
}

void HealthTracker::releaseTrial(const std::string& key) {
    if (auto record = findRecord(key)) {
        record->trial_in_flight.store(false);
    }
}

void HealthTracker::recordOutcome(const std::string& key, bool success, std::chrono::milliseconds latency,
                                  bool trial) {
    auto record = recordFor(key);
    auto now = m_clock();

    std::lock_guard<std::mutex> lock(record->mutex);
    advance(*record, now);
    prune(*record, now);
    record->samples.push_back({now, success, latency});

    switch (record->state) {
        case CircuitState::HALF_OPEN:
            if (!trial) {
                // Dispatched before the circuit opened; only the trial decides
                break;
            }
            if (success) {
                record->state = CircuitState::CLOSED;
                record->samples.clear();
                record->latency_breach_since.reset();
                Logger::getInstance().info("HealthTracker", "Circuit closed after successful trial", key);
            } else {
                trip(*record, now, key, "trial request failed");
            }
            break;

        case CircuitState::CLOSED: {
            size_t failures = static_cast<size_t>(std::count_if(record->samples.begin(), record->samples.end(),
                                                                [](const Sample& s) { return !s.success; }));
            if (failures > m_config.failure_threshold) {
                trip(*record, now, key, std::to_string(failures) + " failures in window");
                break;
            }

            if (record->samples.size() >= m_config.min_latency_samples &&
                p95(*record) > m_config.latency_p95_threshold) {
                if (!record->latency_breach_since) {
                    record->latency_breach_since = now;
                } else if (now - *record->latency_breach_since >= m_config.latency_sustain) {
                    trip(*record, now, key, "p95 latency above threshold for sustained period");
                }
            } else {
                record->latency_breach_since.reset();
            }
            break;
        }

        case CircuitState::OPEN:
            // Late result from a request dispatched before the trip
            break;
    }
}

double HealthTracker::score(const std::string& key) {
    auto record = findRecord(key);
    if (!record) {
        return 1.0;
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    auto now = m_clock();
    advance(*record, now);
    prune(*record, now);
    return scoreLocked(*record);
}

HealthSnapshot HealthTracker::snapshot(const std::string& key) {
    HealthSnapshot view;
    view.key = key;

    auto record = findRecord(key);
    if (!record) {
        return view;
    }

    std::lock_guard<std::mutex> lock(record->mutex);
    auto now = m_clock();
    advance(*record, now);
    prune(*record, now);

    view.state = record->state;
    for (const auto& sample : record->samples) {
        sample.success ? view.successes++ : view.failures++;
    }
    view.p95_latency = p95(*record);
    view.score = scoreLocked(*record);
    view.trial_in_flight = record->trial_in_flight.load();
    return view;
}

void HealthTracker::prune(Record& record, std::chrono::steady_clock::time_point now) const {
    while (!record.samples.empty() && now - record.samples.front().at > m_config.window) {
        record.samples.pop_front();
    }
}

void HealthTracker::advance(Record& record, std::chrono::steady_clock::time_point now) const {
    if (record.state == CircuitState::OPEN && now - record.opened_at >= m_config.cool_down) {
        record.state = CircuitState::HALF_OPEN;
    }
}

void HealthTracker::trip(Record& record, std::chrono::steady_clock::time_point now, const std::string& key,
                         const std::string& reason) const {
    record.state = CircuitState::OPEN;
    record.opened_at = now;
    record.latency_breach_since.reset();
    Logger::getInstance().warning("HealthTracker", "Circuit opened for " + key, reason);
}

std::chrono::milliseconds HealthTracker::p95(const Record& record) const {
    if (record.samples.empty()) {
        return std::chrono::milliseconds(0);
    }
    std::vector<std::chrono::milliseconds> latencies;
    latencies.reserve(record.samples.size());
    for (const auto& sample : record.samples) {
        latencies.push_back(sample.latency);
    }
    std::sort(latencies.begin(), latencies.end());
    size_t rank = static_cast<size_t>(std::ceil(0.95 * static_cast<double>(latencies.size())));
    return latencies[rank == 0 ? 0 : rank - 1];
}

double HealthTracker::scoreLocked(const Record& record) const {
    if (record.state == CircuitState::OPEN) {
        return 0.0;
    }
    if (record.samples.empty()) {
        return 1.0;
    }

    size_t successes = static_cast<size_t>(std::count_if(record.samples.begin(), record.samples.end(),
                                                         [](const Sample& s) { return s.success; }));
    double success_ratio = static_cast<double>(successes) / static_cast<double>(record.samples.size());

    double threshold = static_cast<double>(m_config.latency_p95_threshold.count());
    double headroom = 1.0;
    if (threshold > 0.0) {
        headroom = std::clamp(1.0 - static_cast<double>(p95(record).count()) / threshold, 0.0, 1.0);
    }

    return success_ratio * (0.5 + 0.5 * headroom);
}

HealthGateResult HealthGate::apply(CandidateSet candidates, HealthTracker& tracker) {
    HealthGateResult result;
    std::unordered_set<std::string> owned;

    std::vector<Candidate> kept;
    for (auto& candidate : candidates.candidates) {
        std::string key = candidate.model->healthKey();
        CircuitState state = tracker.state(key);

        if (state == CircuitState::OPEN) {
            result.removed_open.push_back(candidate.id());
            continue;
        }

        if (state == CircuitState::HALF_OPEN) {
            if (owned.count(key) || tracker.tryAcquireTrial(key)) {
                if (owned.insert(key).second) {
                    result.trial_keys.push_back(key);
                }
                candidate.trial = true;
            } else {
                result.bypassed.push_back(candidate.id());
                continue;
            }
        }

        kept.push_back(std::move(candidate));
    }

    candidates.candidates = std::move(kept);
    result.candidates = std::move(candidates);
    return result;
}

// =================================================================
// TrialLease
// =================================================================

TrialLease::TrialLease(HealthTracker& tracker, const std::vector<std::string>& keys)
    : m_tracker(tracker), m_keys(keys.begin(), keys.end()) {
}

TrialLease::~TrialLease() {
    for (const auto& key : m_keys) {
        m_tracker.releaseTrial(key);
    }
}

void TrialLease::adopt(const std::string& key) {
    m_keys.insert(key);
}

bool TrialLease::holds(const std::string& key) const {
    return m_keys.count(key) > 0;
}

void TrialLease::release(const std::string& key) {
    if (m_keys.erase(key)) {
        m_tracker.releaseTrial(key);
    }
}

void TrialLease::releaseExcept(const std::unordered_set<std::string>& keep) {
    for (auto it = m_keys.begin(); it != m_keys.end();) {
        if (keep.count(*it)) {
            ++it;
            continue;
        }
        m_tracker.releaseTrial(*it);
        it = m_keys.erase(it);
    }
}

void TrialLease::handOff() {
    m_keys.clear();
}

} // namespace Arbiter
