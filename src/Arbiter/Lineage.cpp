// =================================================================
// src/Arbiter/Lineage.cpp
// =================================================================
// Implementation of lineage sinks and the trace recorder.

#include "Arbiter/Lineage.hpp"
#include "Arbiter/Deadline.hpp"
#include "Arbiter/Logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <stdexcept>

namespace Arbiter {

// =================================================================
// JsonlFileLineageSink
// =================================================================

JsonlFileLineageSink::JsonlFileLineageSink(const std::string& path)
    : m_path(path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    m_stream.open(path, std::ios::app);
    if (!m_stream.is_open()) {
        throw std::runtime_error("Cannot open lineage file: " + path);
    }
}

void JsonlFileLineageSink::write(const DecisionTrace& trace) {
    std::string line = nlohmann::json(trace).dump();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream << line << '\n';
    m_stream.flush();
    if (!m_stream) {
        m_stream.clear();
        throw std::runtime_error("Failed to append trace " + trace.audit_id + " to " + m_path);
    }
}

void JsonlFileLineageSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.flush();
}

// =================================================================
// InMemoryLineageSink
// =================================================================

void InMemoryLineageSink::write(const DecisionTrace& trace) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_traces.push_back(trace);
}

std::vector<DecisionTrace> InMemoryLineageSink::traces() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_traces;
}

size_t InMemoryLineageSink::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_traces.size();
}

bool InMemoryLineageSink::find(const std::string& audit_id, DecisionTrace& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& trace : m_traces) {
        if (trace.audit_id == audit_id) {
            out = trace;
            return true;
        }
    }
    return false;
}

// =================================================================
// BufferedLineageSink
// =================================================================

BufferedLineageSink::BufferedLineageSink(LineageSinkPtr inner, std::chrono::milliseconds timeout,
                                         size_t max_buffered)
    : m_state(std::make_shared<State>()), m_timeout(timeout) {
    m_state->inner = std::move(inner);
    m_state->max_buffered = max_buffered;
}

std::string BufferedLineageSink::getName() const {
    return "buffered(" + m_state->inner->getName() + ")";
}

size_t BufferedLineageSink::buffered() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->buffer.size();
}

void BufferedLineageSink::rebuffer(const std::shared_ptr<State>& state, DecisionTrace trace) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->buffer.push_front(std::move(trace));
    while (state->buffer.size() > state->max_buffered) {
        Logger::getInstance().error("Lineage", "Lineage buffer full, dropping oldest trace",
                                    state->buffer.back().audit_id);
        state->buffer.pop_back();
    }
}

void BufferedLineageSink::write(const DecisionTrace& trace) {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->buffer.push_back(trace);
        while (m_state->buffer.size() > m_state->max_buffered) {
            Logger::getInstance().error("Lineage", "Lineage buffer full, dropping oldest trace",
                                        m_state->buffer.front().audit_id);
            m_state->buffer.pop_front();
        }
    }
    drain();
}

void BufferedLineageSink::drain() {
    auto deadline = std::chrono::steady_clock::now() + m_timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return;
        }

        DecisionTrace trace;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->buffer.empty()) {
                return;
            }
            trace = std::move(m_state->buffer.front());
            m_state->buffer.pop_front();
        }

        std::shared_ptr<State> state = m_state;
        std::optional<bool> written;
        try {
            written = runWithDeadline<bool>([state, trace]() {
                try {
                    state->inner->write(trace);
                    return true;
                } catch (const std::exception& e) {
                    Logger::getInstance().warning("Lineage", "Sink write failed, trace buffered locally",
                                                  trace.audit_id + ": " + e.what());
                    rebuffer(state, trace);
                    return false;
                }
            }, remaining, state->writer);
        } catch (const WorkerBudgetExhausted&) {
            Logger::getInstance().warning("Lineage", "Previous sink write still running, trace kept buffered",
                                          trace.audit_id);
            rebuffer(state, trace);
            return;
        }

        if (!written) {
            Logger::getInstance().warning("Lineage", "Sink write exceeded its time bound", trace.audit_id);
            return;
        }
        if (!*written) {
            return;
        }
    }
}

void BufferedLineageSink::flush() {
    drain();
    try {
        m_state->inner->flush();
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Lineage", "Sink flush failed", e.what());
    }
}

// =================================================================
// LineageRecorder
// =================================================================

LineageRecorder::LineageRecorder(LineageSinkPtr sink, size_t remembered_ids)
    : m_sink(std::move(sink)), m_remembered_ids(remembered_ids) {
    if (!m_sink) {
        throw std::invalid_argument("LineageRecorder requires a sink");
    }
}

bool LineageRecorder::record(const DecisionTrace& trace) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_recorded.insert(trace.audit_id).second) {
            Logger::getInstance().error("Lineage", "Trace already recorded", trace.audit_id);
            return false;
        }
        m_recorded_order.push_back(trace.audit_id);
        while (m_recorded_order.size() > m_remembered_ids) {
            m_recorded.erase(m_recorded_order.front());
            m_recorded_order.pop_front();
        }
    }

    try {
        m_sink->write(trace);
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Lineage", "Failed to persist trace " + trace.audit_id, e.what());
        std::lock_guard<std::mutex> lock(m_mutex);
        m_recorded.erase(trace.audit_id);
        return false;
    }
}

} // namespace Arbiter
