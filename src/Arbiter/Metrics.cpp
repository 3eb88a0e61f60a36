// =================================================================
// src/Arbiter/Metrics.cpp
// =================================================================
// Implementation of the in-memory metrics sink.

#include "Arbiter/Metrics.hpp"
#include <algorithm>
#include <sstream>

namespace Arbiter {

namespace {

std::string labels(const MetricKey& key) {
    return "{app=\"" + key.app + "\",model=\"" + key.model + "\",provider=\"" + key.provider +
           "\",reason=\"" + key.reason + "\"}";
}

} // namespace

void InMemoryMetricsSink::increment(const std::string& name, const MetricKey& key, double value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_counters[name][key] += value;
}

void InMemoryMetricsSink::observe(const std::string& name, const MetricKey& key, double value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    HistogramSummary& summary = m_histograms[name][key];
    if (summary.count == 0) {
        summary.min = value;
        summary.max = value;
    } else {
        summary.min = std::min(summary.min, value);
        summary.max = std::max(summary.max, value);
    }
    summary.count++;
    summary.sum += value;
}

double InMemoryMetricsSink::counter(const std::string& name, const MetricKey& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto series = m_counters.find(name);
    if (series == m_counters.end()) {
        return 0.0;
    }
    auto it = series->second.find(key);
    return it == series->second.end() ? 0.0 : it->second;
}

double InMemoryMetricsSink::total(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto series = m_counters.find(name);
    if (series == m_counters.end()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& [key, value] : series->second) {
        sum += value;
    }
    return sum;
}

double InMemoryMetricsSink::totalForReason(const std::string& name, const std::string& reason) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto series = m_counters.find(name);
    if (series == m_counters.end()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& [key, value] : series->second) {
        if (key.reason == reason) {
            sum += value;
        }
    }
    return sum;
}

HistogramSummary InMemoryMetricsSink::histogram(const std::string& name, const MetricKey& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto series = m_histograms.find(name);
    if (series == m_histograms.end()) {
        return HistogramSummary();
    }
    auto it = series->second.find(key);
    return it == series->second.end() ? HistogramSummary() : it->second;
}

std::string InMemoryMetricsSink::render() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostringstream out;
    for (const auto& [name, series] : m_counters) {
        for (const auto& [key, value] : series) {
            out << name << labels(key) << " " << value << "\n";
        }
    }
    for (const auto& [name, series] : m_histograms) {
        for (const auto& [key, summary] : series) {
            out << name << "_count" << labels(key) << " " << summary.count << "\n";
            out << name << "_sum" << labels(key) << " " << summary.sum << "\n";
        }
    }
    return out.str();
}

} // namespace Arbiter
