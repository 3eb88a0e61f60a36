// =================================================================
// include/Arbiter/Deadline.hpp
// =================================================================
// Bounded execution of external calls and cooperative cancellation.

#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace Arbiter {

/**
 * @brief Shared flag set when the caller disconnects
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

/**
 * @brief Raised when a component already has its maximum number of workers running
 */
class WorkerBudgetExhausted : public std::runtime_error {
public:
    explicit WorkerBudgetExhausted(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Caps the workers a component may have running at once
 *
 * A worker that outlives its deadline keeps its slot until the callable
 * returns, so a hung dependency exhausts the budget instead of piling up
 * threads. Copies share the same slots.
 */
class WorkerBudget {
public:
    explicit WorkerBudget(size_t limit) : m_state(std::make_shared<State>()) {
        m_state->limit = limit == 0 ? 1 : limit;
    }

    size_t running() const { return m_state->running.load(); }
    size_t limit() const { return m_state->limit; }

private:
    struct State {
        std::atomic<size_t> running{0};
        size_t limit = 1;
    };
    std::shared_ptr<State> m_state;

    template <typename T>
    friend std::optional<T> runWithDeadline(std::function<T()> fn, std::chrono::milliseconds timeout,
                                            const WorkerBudget& budget);
};

/**
 * @brief Run a callable on a worker thread and wait at most `timeout`
 *
 * Returns std::nullopt when the deadline passes; the worker is abandoned and
 * its result discarded, but it holds its budget slot until it returns.
 * Exceptions thrown by the callable are rethrown here. Everything the
 * callable touches must be owned by the callable itself.
 *
 * @throws WorkerBudgetExhausted if every slot of the budget is taken
 */
template <typename T>
std::optional<T> runWithDeadline(std::function<T()> fn, std::chrono::milliseconds timeout,
                                 const WorkerBudget& budget) {
    auto slots = budget.m_state;
    size_t current = slots->running.load();
    do {
        if (current >= slots->limit) {
            throw WorkerBudgetExhausted(std::to_string(current) + " calls still running past their deadline");
        }
    } while (!slots->running.compare_exchange_weak(current, current + 1));

    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();

    try {
        std::thread([promise, slots, fn = std::move(fn)]() {
            std::optional<T> value;
            std::exception_ptr error;
            try {
                value.emplace(fn());
            } catch (...) {
                error = std::current_exception();
            }
            // Free the slot before the caller can observe the result
            slots->running.fetch_sub(1);
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(*value));
            }
        }).detach();
    } catch (const std::system_error&) {
        slots->running.fetch_sub(1);
        throw;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

} // namespace Arbiter
