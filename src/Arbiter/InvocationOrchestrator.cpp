// =================================================================
// src/Arbiter/InvocationOrchestrator.cpp
// =================================================================
// Implementation of the invocation state machine.

#include "Arbiter/InvocationOrchestrator.hpp"
#include "Arbiter/CandidateSelector.hpp"
#include "Arbiter/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <thread>
#include <unordered_set>

namespace Arbiter {

std::string invocationStateToString(InvocationState state) {
    switch (state) {
        case InvocationState::PENDING: return "pending";
        case InvocationState::INVOKING: return "invoking";
        case InvocationState::RETRYING: return "retrying";
        case InvocationState::FALLING_BACK: return "falling_back";
        case InvocationState::SUCCEEDED: return "succeeded";
        case InvocationState::FAILED: return "failed";
        default: return "unknown";
    }
}

InvocationOrchestrator::InvocationOrchestrator(AdapterResolver resolver,
                                               HealthTracker& health,
                                               RetryConfig retry,
                                               std::chrono::milliseconds provider_timeout,
                                               Sleeper sleeper,
                                               size_t max_outstanding_calls)
    : m_resolver(std::move(resolver)),
      m_health(health),
      m_retry(retry),
      m_provider_timeout(provider_timeout),
      m_sleeper(std::move(sleeper)),
      m_max_outstanding_calls(max_outstanding_calls == 0 ? 1 : max_outstanding_calls) {
    if (m_retry.max_attempts == 0) {
        m_retry.max_attempts = 1;
    }
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

void InvocationOrchestrator::enter(InvocationOutcome& outcome, InvocationState state) {
    outcome.state = state;
    outcome.history.push_back(state);
}

std::chrono::milliseconds InvocationOrchestrator::backoffFor(
    size_t attempt, const std::optional<std::chrono::milliseconds>& retry_after, std::mt19937_64& rng) const {
    double base = static_cast<double>(m_retry.base_backoff.count());
    double delay = base * std::pow(2.0, static_cast<double>(attempt > 0 ? attempt - 1 : 0));
    delay = std::min(delay, static_cast<double>(m_retry.max_backoff.count()));

    if (m_retry.jitter > 0.0) {
        double factor = 1.0 - m_retry.jitter + 2.0 * m_retry.jitter * CandidateSelector::unitInterval(rng());
        delay *= factor;
    }

    auto backoff = std::chrono::milliseconds(static_cast<long>(std::max(0.0, delay)));
    if (retry_after && *retry_after > backoff) {
        backoff = std::min(*retry_after, m_retry.max_backoff);
    }
    return backoff;
}

WorkerBudget InvocationOrchestrator::budgetFor(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_budgets_mutex);
    auto it = m_budgets.find(key);
    if (it == m_budgets.end()) {
        it = m_budgets.emplace(key, WorkerBudget(m_max_outstanding_calls)).first;
    }
    return it->second;
}

InvocationResult InvocationOrchestrator::invokeOnce(const ModelDescriptorPtr& model, const std::string& input,
                                                    const InvocationOptions& options) {
    ProviderAdapterPtr adapter = m_resolver ? m_resolver(*model) : nullptr;
    if (!adapter) {
        return InvocationResult::failure(ProviderErrorClass::MALFORMED_REQUEST,
                                         "no adapter registered for adapter type '" + model->adapter_type + "'");
    }

    auto start = std::chrono::steady_clock::now();
    InvocationResult result;
    try {
        ModelDescriptor descriptor = *model;
        auto completed = runWithDeadline<InvocationResult>(
            [adapter, descriptor, input, options]() { return adapter->invoke(descriptor, input, options); },
            m_provider_timeout, budgetFor(model->healthKey()));
        if (!completed) {
            return InvocationResult::failure(ProviderErrorClass::TIMEOUT,
                "provider call exceeded " + std::to_string(m_provider_timeout.count()) + "ms",
                m_provider_timeout);
        }
        result = *completed;
    } catch (const WorkerBudgetExhausted& e) {
        return InvocationResult::failure(ProviderErrorClass::UNAVAILABLE,
                                         std::string("provider not accepting calls: ") + e.what());
    } catch (const std::exception& e) {
        result = InvocationResult::failure(ProviderErrorClass::SERVER_ERROR,
                                           std::string("adapter threw: ") + e.what());
    }

    if (result.latency.count() == 0) {
        result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    }
    return result;
}

bool InvocationOrchestrator::tryCandidate(const Candidate& candidate, size_t max_attempts, bool degrade,
                                          const std::string& input, const InvocationOptions& options,
                                          const std::string& audit_id, const CancellationTokenPtr& cancel,
                                          const AttemptObserver& observer, std::mt19937_64& rng,
                                          InvocationOutcome& outcome) {
    const std::string key = candidate.model->healthKey();

    for (size_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (cancel && cancel->isCancelled()) {
            outcome.cancelled = true;
            return false;
        }
        // Other traffic may have opened the circuit during the backoff
        if (attempt > 1 && !candidate.trial && m_health.state(key) != CircuitState::CLOSED) {
            Logger::getInstance().info("InvocationOrchestrator",
                "Circuit for " + candidate.id() + " is no longer closed, falling back", audit_id);
            return false;
        }

        enter(outcome, attempt == 1 ? InvocationState::INVOKING : InvocationState::RETRYING);
        InvocationResult result = invokeOnce(candidate.model, input, options);
        m_health.recordOutcome(key, result.success, result.latency, candidate.trial);

        AttemptRecord record;
        record.model_id = candidate.id();
        record.provider = candidate.model->provider;
        record.attempt = attempt;
        record.success = result.success;
        record.error_class = result.success ? ProviderErrorClass::NONE : result.error.error_class;
        record.error_message = result.success ? "" : result.error.message;
        record.latency = result.latency;
        record.trial = candidate.trial;
        record.degrade = degrade;

        Logger::getInstance().logInvocationAttempt(audit_id, record.model_id, attempt, result.success,
                                                   static_cast<long>(result.latency.count()), record.error_message);

        if (result.success) {
            outcome.attempts.push_back(record);
            if (observer) observer(record);
            outcome.success = true;
            outcome.final_model = candidate.model;
            outcome.result = result;
            return true;
        }

        outcome.last_error = result.error.error_class;

        bool retry = isRetryable(result.error.error_class) && attempt < max_attempts && !candidate.trial &&
                     m_health.state(key) == CircuitState::CLOSED;
        if (retry && result.error.retry_after && *result.error.retry_after > m_retry.max_backoff) {
            Logger::getInstance().info("InvocationOrchestrator",
                "Retry-after of " + std::to_string(result.error.retry_after->count()) + "ms on " + candidate.id() +
                " exceeds the backoff ceiling, falling back", audit_id);
            retry = false;
        }
        if (retry) {
            record.backoff = backoffFor(attempt, result.error.retry_after, rng);
        }
        outcome.attempts.push_back(record);
        if (observer) observer(record);

        if (!retry) {
            return false;
        }
        m_sleeper(record.backoff);
    }
    return false;
}

InvocationOutcome InvocationOrchestrator::run(const InvocationPlan& plan,
                                              const std::string& input,
                                              const InvocationOptions& options,
                                              const std::string& audit_id,
                                              const CancellationTokenPtr& cancel,
                                              const AttemptObserver& observer) {
    InvocationOutcome outcome;
    enter(outcome, InvocationState::PENDING);
    std::mt19937_64 rng(plan.seed);

    // Trials acquired by the health gate belong to this request until released
    TrialLease held(m_health);
    for (const auto& candidate : plan.primary) {
        if (candidate.trial) {
            held.adopt(candidate.model->healthKey());
        }
    }

    std::vector<Candidate> sequence;
    std::unordered_set<std::string> queued;
    auto enqueue = [&sequence, &queued](const Candidate& candidate) {
        if (queued.insert(candidate.id()).second) {
            sequence.push_back(candidate);
        }
    };
    if (!plan.primary.empty()) {
        enqueue(plan.primary.front());
    }
    for (const auto& candidate : plan.fallback) {
        enqueue(candidate);
    }
    for (size_t i = 1; i < plan.primary.size(); ++i) {
        enqueue(plan.primary[i]);
    }

    // Admission re-checks the circuit at attempt time
    auto admit = [this, &held](Candidate& candidate) {
        std::string key = candidate.model->healthKey();
        if (held.holds(key)) {
            candidate.trial = true;
            return true;
        }
        switch (m_health.state(key)) {
            case CircuitState::CLOSED:
                candidate.trial = false;
                return true;
            case CircuitState::HALF_OPEN:
                if (m_health.tryAcquireTrial(key)) {
                    held.adopt(key);
                    candidate.trial = true;
                    return true;
                }
                return false;
            case CircuitState::OPEN:
            default:
                return false;
        }
    };

    auto release = [&held](const Candidate& candidate) {
        held.release(candidate.model->healthKey());
    };

    std::unordered_set<std::string> attempted;
    bool first = true;

    for (auto candidate : sequence) {
        if (cancel && cancel->isCancelled()) {
            outcome.cancelled = true;
            break;
        }
        if (!admit(candidate)) {
            Logger::getInstance().debug("InvocationOrchestrator", "Skipping " + candidate.id() + ": circuit not admitting",
                                        audit_id);
            continue;
        }

        if (!first) {
            enter(outcome, InvocationState::FALLING_BACK);
            outcome.fell_back = true;
        }
        first = false;
        attempted.insert(candidate.id());

        bool served = tryCandidate(candidate, m_retry.max_attempts, false, input, options, audit_id, cancel,
                                   observer, rng, outcome);
        release(candidate);
        if (served) {
            break;
        }
        if (outcome.cancelled) {
            break;
        }
    }

    if (!outcome.success && !outcome.cancelled && plan.degrade_mode == DegradeMode::MINIMAL_COMPLETION) {
        std::vector<Candidate> cheapest = plan.compliant;
        std::stable_sort(cheapest.begin(), cheapest.end(), [](const Candidate& a, const Candidate& b) {
            return a.model->unitPrice() < b.model->unitPrice();
        });

        for (auto candidate : cheapest) {
            if (attempted.count(candidate.id()) || !admit(candidate)) {
                continue;
            }
            Logger::getInstance().warning("InvocationOrchestrator",
                "Fallback chain exhausted, trying minimal completion on " + candidate.id(), audit_id);
            enter(outcome, InvocationState::FALLING_BACK);
            outcome.fell_back = outcome.fell_back || !attempted.empty();
            attempted.insert(candidate.id());

            bool served = tryCandidate(candidate, 1, true, input, options, audit_id, cancel, observer, rng, outcome);
            release(candidate);
            outcome.degraded_completion = served;
            break;
        }
    }

    // Trials the request never reached
    held.releaseExcept({});

    if (outcome.success) {
        enter(outcome, InvocationState::SUCCEEDED);
        return outcome;
    }

    enter(outcome, InvocationState::FAILED);
    if (!outcome.cancelled) {
        std::ostringstream hint;
        if (outcome.attempts.empty()) {
            hint << "No candidate could be attempted; every circuit was open. Retry after the cool-down "
                 << "or add healthy models to the policy fallback chain.";
        } else {
            hint << "All candidates failed (";
            std::string previous;
            for (const auto& attempt : outcome.attempts) {
                if (attempt.model_id == previous) {
                    continue;
                }
                hint << (previous.empty() ? "" : ", ") << attempt.model_id;
                previous = attempt.model_id;
            }
            hint << "; last error " << providerErrorClassToString(outcome.last_error)
                 << "). Check provider status or extend the policy fallback chain.";
        }
        outcome.remediation = hint.str();
    }
    return outcome;
}

} // namespace Arbiter
