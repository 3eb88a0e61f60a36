// =================================================================
// include/Arbiter/Lineage.hpp
// =================================================================
// Append-only lineage sinks and the exactly-once trace recorder.

#pragma once

#include "Arbiter/DecisionTrace.hpp"
#include "Arbiter/Deadline.hpp"
#include <chrono>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace Arbiter {

/**
 * @brief Append-only destination for decision traces
 */
class LineageSink {
public:
    virtual ~LineageSink() = default;

    /**
     * @brief Append one trace
     * @throws std::runtime_error when the write fails
     */
    virtual void write(const DecisionTrace& trace) = 0;

    virtual void flush() {}

    virtual std::string getName() const = 0;
};

using LineageSinkPtr = std::shared_ptr<LineageSink>;

/**
 * @brief Writes one JSON object per line
 */
class JsonlFileLineageSink : public LineageSink {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened for appending
     */
    explicit JsonlFileLineageSink(const std::string& path);

    void write(const DecisionTrace& trace) override;
    void flush() override;
    std::string getName() const override { return "jsonl:" + m_path; }

private:
    std::string m_path;
    std::ofstream m_stream;
    std::mutex m_mutex;
};

/**
 * @brief Keeps traces in memory (tests and embedders)
 */
class InMemoryLineageSink : public LineageSink {
public:
    void write(const DecisionTrace& trace) override;
    std::string getName() const override { return "memory"; }

    std::vector<DecisionTrace> traces() const;
    size_t size() const;

    /**
     * @brief Trace by audit id, if present
     */
    bool find(const std::string& audit_id, DecisionTrace& out) const;

private:
    std::vector<DecisionTrace> m_traces;
    mutable std::mutex m_mutex;
};

/**
 * @brief Bounded-time writes with local buffering on failure
 *
 * Each write waits at most `timeout` for the wrapped sink. Failed writes stay
 * in a local buffer and are retried, oldest first, on the next write or
 * flush. A write that outlives its timeout keeps running and re-buffers
 * itself only if it eventually fails, so no trace is written twice. Only one
 * write to the wrapped sink runs at a time; while it is stalled new traces
 * stay buffered.
 */
class BufferedLineageSink : public LineageSink {
public:
    BufferedLineageSink(LineageSinkPtr inner, std::chrono::milliseconds timeout, size_t max_buffered = 10000);

    void write(const DecisionTrace& trace) override;
    void flush() override;
    std::string getName() const override;

    /**
     * @brief Traces waiting for a retry
     */
    size_t buffered() const;

private:
    struct State {
        LineageSinkPtr inner;
        std::deque<DecisionTrace> buffer;
        size_t max_buffered = 0;
        std::mutex mutex;
        WorkerBudget writer{1}; ///< One sink write in flight at a time
    };

    std::shared_ptr<State> m_state;
    std::chrono::milliseconds m_timeout;

    void drain();
    static void rebuffer(const std::shared_ptr<State>& state, DecisionTrace trace);
};

/**
 * @brief Persists each trace exactly once
 */
class LineageRecorder {
public:
    explicit LineageRecorder(LineageSinkPtr sink, size_t remembered_ids = 100000);

    /**
     * @brief Persist a trace
     * @return False if a trace with the same audit id was already recorded
     *         or the sink rejected it
     */
    bool record(const DecisionTrace& trace);

    LineageSinkPtr sink() const { return m_sink; }

private:
    LineageSinkPtr m_sink;
    size_t m_remembered_ids;
    std::unordered_set<std::string> m_recorded;
    std::deque<std::string> m_recorded_order;
    std::mutex m_mutex;
};

} // namespace Arbiter
